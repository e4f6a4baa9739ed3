// =====================================================================================
//
//       Filename:  ContextResolver.cpp
//
//    Description:  infers the single (end date, duration) a statement is reported for
//
//        Version:  1.0
//        Created:  09/14/2026 01:44:27 PM
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

#include "ContextResolver.h"

#include <utility>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "Recon_Utils.h"
#include "StatementCodes.h"

namespace
{
    auto AsPointers(const SR::NumericFacts& facts)
    {
        return facts | rng::views::transform([](const SR::NumericFact& fact) { return &fact; });
    }

    SR::ResolvedContext LatestContext(const SR::FactPtrs& candidates)
    {
        if (candidates.empty())
        {
            return {};
        }
        auto latest = rng::max_element(candidates, {}, [](const SR::NumericFact* fact) { return *fact->end_date; });
        const auto target_date = *(*latest)->end_date;

        auto same_date = candidates
            | rng::views::filter([&target_date](const SR::NumericFact* fact) { return fact->end_date == target_date; })
            | rng::to<std::vector>();

        return {target_date, SR::ModeDuration(same_date)};
    }
}		// namespace

namespace StatementRecon
{

// ===  FUNCTION  ======================================================================
//         Name:  ModeDuration
//  Description:  most frequent duration. keep track of the order we first saw each
//                value in so ties are stable.
// =====================================================================================

std::optional<int> ModeDuration(const FactPtrs& facts)
{
    std::vector<std::pair<int, int>> counts;
    for (const auto* fact : facts)
    {
        if (! fact->duration)
        {
            continue;
        }
        auto found = rng::find_if(counts, [fact](const auto& entry) { return entry.first == *fact->duration; });
        if (found != counts.end())
        {
            ++found->second;
        }
        else
        {
            counts.emplace_back(*fact->duration, 1);
        }
    }
    if (counts.empty())
    {
        return std::nullopt;
    }
    std::pair<int, int> best = counts.front();
    for (const auto& entry : counts)
    {
        if (entry.second > best.second)
        {
            best = entry;
        }
    }
    return best.first;
} // -----  end of function ModeDuration  -----

// ===  FUNCTION  ======================================================================
//         Name:  SelectPrimaryScope
//  Description:
// =====================================================================================

ScopedCandidates SelectPrimaryScope(const NumericFacts& facts, const TagSet& statement_tags, sv statement_code)
{
    const bool want_instant = IsBalanceSheetFamily(statement_code);

    auto qualifies = [&statement_tags, want_instant](const NumericFact* fact)
    {
        if (! fact->end_date || ! fact->duration)
        {
            return false;
        }
        if (! statement_tags.contains(fact->tag))
        {
            return false;
        }
        return want_instant ? fact->IsInstant() : fact->IsDuration();
    };

    auto primary = AsPointers(facts)
        | rng::views::filter([](const NumericFact* fact) { return fact->IsPrimary(); })
        | rng::views::filter(qualifies)
        | rng::to<std::vector>();
    if (! primary.empty())
    {
        return {ScopeOutcome::e_PrimaryHit, std::move(primary)};
    }

    auto everything = AsPointers(facts) | rng::views::filter(qualifies) | rng::to<std::vector>();
    if (! everything.empty())
    {
        return {ScopeOutcome::e_FallbackHit, std::move(everything)};
    }
    return {ScopeOutcome::e_NoMatch, {}};
} // -----  end of function SelectPrimaryScope  -----

// ===  FUNCTION  ======================================================================
//         Name:  ResolveStatementContext
//  Description:  an empty result means 'context unknown'. not an error.
// =====================================================================================

ResolvedContext ResolveStatementContext(const NumericFacts& facts, const TagSet& statement_tags, sv statement_code)
{
    auto scoped = SelectPrimaryScope(facts, statement_tags, statement_code);
    if (scoped.outcome_ == ScopeOutcome::e_FallbackHit)
    {
        spdlog::debug(catenate("No primary facts for statement: ", statement_code,
                               ". Using facts with coreg or segments."));
    }
    return LatestContext(scoped.candidates_);
} // -----  end of function ResolveStatementContext  -----

// ===  FUNCTION  ======================================================================
//         Name:  ResolveFilingPeriod
//  Description:
// =====================================================================================

ResolvedContext ResolveFilingPeriod(const NumericFacts& facts)
{
    auto period_fact = [](const NumericFact* fact) { return fact->end_date && fact->IsDuration(); };

    auto candidates = AsPointers(facts)
        | rng::views::filter([](const NumericFact* fact) { return fact->IsPrimary(); })
        | rng::views::filter(period_fact)
        | rng::to<std::vector>();
    if (candidates.empty())
    {
        candidates = AsPointers(facts) | rng::views::filter(period_fact) | rng::to<std::vector>();
    }
    return LatestContext(candidates);
} // -----  end of function ResolveFilingPeriod  -----

// ===  FUNCTION  ======================================================================
//         Name:  DerivePeriodLabel
//  Description:
// =====================================================================================

std::string DerivePeriodLabel(const ResolvedContext& context, int fallback_year)
{
    if (! context.end_date)
    {
        return fmt::format("FY-{}", fallback_year);
    }
    const int year = static_cast<int>(context.end_date->year());

    if (! context.duration || *context.duration == 4 || *context.duration <= 0)
    {
        return fmt::format("FY-{}", year);
    }
    if (*context.duration < 4)
    {
        return fmt::format("Q{}-{}", *context.duration, year);
    }
    return fmt::format("P{}-{}", *context.duration, year);
} // -----  end of function DerivePeriodLabel  -----

}		// namespace StatementRecon
