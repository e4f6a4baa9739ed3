// =====================================================================================
//
//       Filename:  FactSelector.cpp
//
//    Description:  picks the one numeric fact to show on a presentation row
//
//        Version:  1.0
//        Created:  09/14/2026 02:27:48 PM
//       Revision:  none
//       Compiler:  g++
//
//         Author:  David P. Riedel (dpr), driedel@cox.net
//        License:  GNU General Public License v3
//        Company:
//
// =====================================================================================

/* This file is part of Statement_Recon. */

/* Statement_Recon is free software: you can redistribute it and/or modify */
/* it under the terms of the GNU General Public License as published by */
/* the Free Software Foundation, either version 3 of the License, or */
/* (at your option) any later version. */

/* Statement_Recon is distributed in the hope that it will be useful, */
/* but WITHOUT ANY WARRANTY; without even the implied warranty of */
/* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the */
/* GNU General Public License for more details. */

/* You should have received a copy of the GNU General Public License */
/* along with Statement_Recon.  If not, see <http://www.gnu.org/licenses/>. */

#include "FactSelector.h"

#include <cmath>
#include <set>

#include <range/v3/action/stable_sort.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "Recon_Utils.h"
#include "SemanticRoles.h"
#include "StatementCodes.h"

namespace
{
    // only finite values take part in ranking and conflict counts.

    std::optional<double> UsableValue(const SR::NumericFact* fact)
    {
        if (fact->value && std::isfinite(*fact->value))
        {
            return fact->value;
        }
        return std::nullopt;
    }

    // each narrowing step only sticks if something survives it.

    template <typename Pred>
    SR::FactPtrs NarrowIfAny(const SR::FactPtrs& candidates, Pred&& pred)
    {
        auto narrowed = candidates | rng::views::filter(std::forward<Pred>(pred)) | rng::to<std::vector>();
        return narrowed.empty() ? candidates : narrowed;
    }

    SR::FactPtrs Instants(const SR::FactPtrs& candidates)
    {
        return candidates
            | rng::views::filter([](const SR::NumericFact* fact) { return fact->IsInstant() && fact->end_date; })
            | rng::to<std::vector>();
    }

    // beginning -> latest date strictly before the target date
    // ending -> the target date itself

    std::optional<date::year_month_day> BoundaryDate(const SR::FactPtrs& candidates, SR::BalanceBoundary boundary,
                                                     const std::optional<date::year_month_day>& target_date)
    {
        if (! target_date)
        {
            return std::nullopt;
        }
        if (boundary == SR::BalanceBoundary::e_Ending)
        {
            return target_date;
        }
        auto earlier = candidates
            | rng::views::filter([&target_date](const SR::NumericFact* fact)
                                 { return fact->end_date && *fact->end_date < *target_date; })
            | rng::to<std::vector>();
        if (earlier.empty())
        {
            return std::nullopt;
        }
        return *(*rng::max_element(earlier, {}, [](const SR::NumericFact* fact) { return *fact->end_date; }))->end_date;
    }

    // equity statements without a pinned date use the whole range of instants
    // the filing reports.

    std::optional<date::year_month_day> OuterInstantDate(const SR::FactPtrs& candidates, SR::BalanceBoundary boundary)
    {
        auto instants = Instants(candidates);
        if (instants.empty())
        {
            return std::nullopt;
        }
        auto by_date = [](const SR::NumericFact* fact) { return *fact->end_date; };
        if (boundary == SR::BalanceBoundary::e_Beginning)
        {
            return *(*rng::min_element(instants, {}, by_date))->end_date;
        }
        return *(*rng::max_element(instants, {}, by_date))->end_date;
    }
}		// namespace

namespace StatementRecon
{

// ===  FUNCTION  ======================================================================
//         Name:  RankCandidates
//  Description:
// =====================================================================================

FactPtrs RankCandidates(FactPtrs candidates, bool prefer_no_segments)
{
    auto rank_less = [prefer_no_segments](const NumericFact* lhs, const NumericFact* rhs)
    {
        const bool lhs_coreg = ! lhs->IsConsolidated();
        const bool rhs_coreg = ! rhs->IsConsolidated();
        if (lhs_coreg != rhs_coreg)
        {
            return ! lhs_coreg;
        }
        if (prefer_no_segments && lhs->HasSegments() != rhs->HasSegments())
        {
            return ! lhs->HasSegments();
        }
        const double lhs_abs = std::fabs(UsableValue(lhs).value_or(0.0));
        const double rhs_abs = std::fabs(UsableValue(rhs).value_or(0.0));
        if (lhs_abs != rhs_abs)
        {
            return lhs_abs > rhs_abs;
        }
        // absent dates sort last

        return rhs->end_date < lhs->end_date;
    };

    candidates |= rng::actions::stable_sort(rank_less);
    return candidates;
} // -----  end of function RankCandidates  -----

// ===  FUNCTION  ======================================================================
//         Name:  CountUniqueValues
//  Description:  distinct non-null values. more than 1 is a real conflict.
// =====================================================================================

int CountUniqueValues(const FactPtrs& candidates)
{
    std::set<double> values;
    for (const auto* fact : candidates)
    {
        if (auto value = UsableValue(fact); value)
        {
            values.insert(*value);
        }
    }
    return static_cast<int>(values.size());
} // -----  end of function CountUniqueValues  -----

// ===  FUNCTION  ======================================================================
//         Name:  SelectFact
//  Description:  narrow the facts down a step at a time using what the row tells us
//                about itself then rank whatever is left.
// =====================================================================================

Selection SelectFact(const NumericFacts& facts, const SelectionRequest& request)
{
    // 1. tag and version

    FactPtrs candidates = facts
        | rng::views::transform([](const NumericFact& fact) { return &fact; })
        | rng::views::filter([&request](const NumericFact* fact)
                             {
                                 return fact->tag == request.tag_
                                        && (request.version_.empty() || fact->version == request.version_);
                             })
        | rng::to<std::vector>();
    if (candidates.empty())
    {
        return {};
    }

    // 2. what kind of duration does this row want

    const auto boundary = BoundaryFromLabel(request.label_);
    const bool is_equity = IsEquityStatement(request.statement_code_);

    const bool cash_boundary_row = IsCashFlowFamily(request.statement_code_)
                                   && HasRole(SemanticRole::e_CashRollForward, request.tag_)
                                   && boundary != BalanceBoundary::e_None;
    const bool equity_balance_row = is_equity && (boundary != BalanceBoundary::e_None || IsBalanceLabel(request.label_));

    std::optional<int> desired_duration = request.target_duration_;
    if (IsBalanceSheetFamily(request.statement_code_) || cash_boundary_row || equity_balance_row)
    {
        desired_duration = 0;
    }

    // 3. duration

    if (desired_duration)
    {
        candidates = NarrowIfAny(candidates, [&desired_duration](const NumericFact* fact)
                                 { return fact->duration == desired_duration; });
    }
    const FactPtrs duration_candidates = candidates;

    // 4. date

    if (request.target_date_)
    {
        const auto& target_date = *request.target_date_;
        if (boundary == BalanceBoundary::e_Beginning)
        {
            candidates = NarrowIfAny(candidates, [&target_date](const NumericFact* fact)
                                     { return fact->end_date && *fact->end_date < target_date; });
        }
        else
        {
            candidates = NarrowIfAny(candidates, [&target_date](const NumericFact* fact)
                                     { return fact->end_date == target_date; });
        }
    }

    // 5. beginning and ending balances get pinned to their boundary date.

    if (boundary != BalanceBoundary::e_None && (cash_boundary_row || is_equity))
    {
        std::optional<date::year_month_day> forced_date;
        if (is_equity && ! request.date_pinned_)
        {
            forced_date = OuterInstantDate(duration_candidates, boundary);
        }
        else
        {
            forced_date = BoundaryDate(duration_candidates, boundary, request.target_date_);
        }
        if (forced_date)
        {
            auto at_boundary = duration_candidates
                | rng::views::filter([&forced_date](const NumericFact* fact) { return fact->end_date == forced_date; })
                | rng::to<std::vector>();
            if (! at_boundary.empty())
            {
                candidates = std::move(at_boundary);
            }
        }
    }

    // 6. consolidated totals. segments can matter on the equity statement so leave them there.

    candidates = NarrowIfAny(candidates, [](const NumericFact* fact) { return fact->IsConsolidated(); });
    if (! is_equity)
    {
        candidates = NarrowIfAny(candidates, [](const NumericFact* fact) { return ! fact->HasSegments(); });
    }

    Selection result;
    result.candidate_count_ = static_cast<int>(candidates.size());
    result.unique_values_ = CountUniqueValues(candidates);

    auto ranked = RankCandidates(std::move(candidates), ! is_equity);
    result.chosen_ = *ranked.front();

    if (result.unique_values_ > 1)
    {
        spdlog::debug(catenate("Conflicting candidates for tag: ", request.tag_, " in: ", request.statement_code_,
                               ". ", result.candidate_count_, " candidates with ", result.unique_values_,
                               " distinct values."));
    }
    return result;
} // -----  end of function SelectFact  -----

}		// namespace StatementRecon
