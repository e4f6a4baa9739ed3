// =====================================================================================
//
//       Filename:  TableAssembler.cpp
//
//    Description:  builds row accurate statement tables from the presentation
//                  structure and the filing's numeric facts
//
//        Version:  1.0
//        Created:  09/14/2026 03:52:30 PM
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

#include "TableAssembler.h"

#include <map>
#include <utility>

#include <range/v3/action/stable_sort.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/functional/comparisons.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "ContextResolver.h"
#include "FactSelector.h"
#include "Recon_Utils.h"
#include "SemanticRoles.h"
#include "SignNormalizer.h"

namespace
{
    // copy the chosen fact's details into the output row.

    void FillFromSelection(SR::StatementRow& row, const SR::Selection& selection)
    {
        row.candidate_count = selection.candidate_count_;
        row.candidate_unique_values = selection.unique_values_;
        row.candidate_conflict = selection.unique_values_ > 1;

        if (! selection.chosen_)
        {
            return;
        }
        const auto& chosen = *selection.chosen_;

        row.value = chosen.value;
        if (chosen.value)
        {
            row.display_value = SR::ApplySignRules(row.presentation.statement_code, row.presentation.tag,
                                                   *chosen.value, row.presentation.negating);
        }
        row.formatted_value = SR::FormatDisplayValue(row.display_value);
        row.units = chosen.units;
        row.end_date = chosen.end_date;
        row.duration = chosen.duration;
        row.segments = chosen.segments;
        row.coreg = chosen.coreg;
        row.has_value = chosen.value.has_value();
    }

    // ===  FUNCTION  ======================================================================
    //         Name:  ReconstructComprehensiveIncomeFromFacts
    //  Description:  lots of filers fold comprehensive income into another statement
    //                so there is no CI structure in pre.txt. build one row per
    //                comprehensive income tag from the facts instead.
    // =====================================================================================

    SR::StatementTable ReconstructComprehensiveIncomeFromFacts(const SR::ReconContext& context,
                                                               const SR::FilingID& filing_ID,
                                                               const SR::NumericFacts& facts,
                                                               std::optional<date::year_month_day> end_date,
                                                               std::optional<int> duration)
    {
        SR::FactPtrs candidates = facts
            | rng::views::transform([](const SR::NumericFact& fact) { return &fact; })
            | rng::views::filter([](const SR::NumericFact* fact)
                                 { return fact->IsDuration() && SR::HasRole(SR::SemanticRole::e_ComprehensiveIncome, fact->tag); })
            | rng::views::filter([&end_date, &duration](const SR::NumericFact* fact)
                                 { return (! end_date || fact->end_date == end_date) && (! duration || fact->duration == duration); })
            | rng::to<std::vector>();

        if (! end_date || ! duration)
        {
            candidates = candidates
                | rng::views::filter([](const SR::NumericFact* fact) { return fact->end_date.has_value(); })
                | rng::to<std::vector>();
            if (candidates.empty())
            {
                return {};
            }
            const auto latest =
                *(*rng::max_element(candidates, {}, [](const SR::NumericFact* fact) { return *fact->end_date; }))->end_date;
            candidates = candidates
                | rng::views::filter([&latest](const SR::NumericFact* fact) { return fact->end_date == latest; })
                | rng::to<std::vector>();

            if (! duration)
            {
                const auto mode = SR::ModeDuration(candidates);
                candidates = candidates
                    | rng::views::filter([&mode](const SR::NumericFact* fact) { return fact->duration == mode; })
                    | rng::to<std::vector>();
            }
        }
        if (candidates.empty())
        {
            return {};
        }

        // std::map gives us tag order.

        std::map<std::string, SR::FactPtrs> by_tag;
        for (const auto* fact : candidates)
        {
            by_tag[fact->tag].push_back(fact);
        }

        SR::StatementTable result;
        int line = 0;
        for (const auto& [tag, group] : by_tag)
        {
            auto ranked = SR::RankCandidates(group, true);
            const auto& chosen = *ranked.front();

            SR::StatementRow row;
            row.presentation.filing_ID = filing_ID;
            row.presentation.statement_code = "CI";
            row.presentation.report = 0;
            row.presentation.line = ++line;
            row.presentation.depth = 0;
            row.presentation.source_file = "D";
            row.presentation.tag = tag;
            row.presentation.version = chosen.version;
            row.presentation.negating = false;

            std::optional<std::string> label;
            if (context.labels_ != nullptr)
            {
                label = context.labels_->LabelFor(tag);
            }
            row.presentation.label = label && ! label->empty() ? *label : tag;

            SR::Selection selection{chosen, static_cast<int>(group.size()), SR::CountUniqueValues(group)};
            FillFromSelection(row, selection);

            result.push_back(std::move(row));
        }
        spdlog::debug(catenate("Built: ", result.size(), " comprehensive income rows from facts for: ", filing_ID.get()));
        return result;
    } // -----  end of function ReconstructComprehensiveIncomeFromFacts  -----
}		// namespace

namespace StatementRecon
{

// ===  FUNCTION  ======================================================================
//         Name:  ReconstructStatement
//  Description:
// =====================================================================================

StatementTable ReconstructStatement(const ReconContext& context, const FilingID& filing_ID, sv statement_code,
                                    std::optional<date::year_month_day> end_date, std::optional<int> duration)
{
    CheckFilingID(filing_ID);
    CheckStatementCode(statement_code);

    auto structure = context.presentation_.StructureFor(filing_ID, statement_code);
    const auto facts = context.facts_.FactsFor(filing_ID);

    if (structure.empty())
    {
        if (IsComprehensiveIncome(statement_code))
        {
            return ReconstructComprehensiveIncomeFromFacts(context, filing_ID, facts, end_date, duration);
        }
        return {};
    }

    structure |= rng::actions::stable_sort(rng::less{}, [](const PresentationRow& row)
                                           { return std::pair(row.report, row.line); });

    TagSet statement_tags;
    for (const auto& row : structure)
    {
        if (! row.tag.empty())
        {
            statement_tags.insert(row.tag);
        }
    }

    // whatever the caller pinned wins. resolve the rest.

    auto target_date = end_date;
    auto target_duration = duration;
    if (! target_date || ! target_duration)
    {
        const auto resolved = ResolveStatementContext(facts, statement_tags, statement_code);
        if (! target_date)
        {
            target_date = resolved.end_date;
        }
        if (! target_duration)
        {
            target_duration = resolved.duration;
        }
    }

    StatementTable result;
    result.reserve(structure.size());

    for (auto& presentation_row : structure)
    {
        if (presentation_row.label.empty())
        {
            presentation_row.label = presentation_row.tag;
        }

        SelectionRequest request{.tag_ = presentation_row.tag,
                                 .version_ = presentation_row.version,
                                 .statement_code_ = statement_code,
                                 .label_ = presentation_row.label,
                                 .target_date_ = target_date,
                                 .target_duration_ = target_duration,
                                 .date_pinned_ = end_date.has_value()};
        const auto selection = SelectFact(facts, request);

        StatementRow row;
        row.presentation = presentation_row;
        row.end_date = target_date;
        row.duration = target_duration;
        FillFromSelection(row, selection);

        result.push_back(std::move(row));
    }
    return result;
} // -----  end of function ReconstructStatement  -----

// ===  FUNCTION  ======================================================================
//         Name:  ReconstructFiling
//  Description:
// =====================================================================================

FilingTables ReconstructFiling(const ReconContext& context, const FilingID& filing_ID,
                               const std::vector<std::string>& statement_codes)
{
    FilingTables tables;
    for (const auto& statement_code : statement_codes)
    {
        tables[statement_code] = ReconstructStatement(context, filing_ID, statement_code);
    }
    return tables;
} // -----  end of function ReconstructFiling  -----

// ===  FUNCTION  ======================================================================
//         Name:  CoverageFromTable
//  Description:
// =====================================================================================

CoverageStats CoverageFromTable(const StatementTable& table, sv statement_code)
{
    CoverageStats stats;
    stats.statement_code_ = statement_code;
    stats.rows_total_ = static_cast<int>(table.size());

    for (const auto& row : table)
    {
        if (row.has_value)
        {
            ++stats.rows_with_values_;
        }
        else
        {
            stats.missing_tags_.push_back(row.presentation.tag);
        }
    }
    stats.rows_missing_values_ = stats.rows_total_ - stats.rows_with_values_;
    stats.coverage_ratio_ = stats.rows_total_ > 0 ? static_cast<double>(stats.rows_with_values_) / stats.rows_total_ : 0.0;
    return stats;
} // -----  end of function CoverageFromTable  -----

CoverageStats StatementCoverage(const ReconContext& context, const FilingID& filing_ID, sv statement_code)
{
    return CoverageFromTable(ReconstructStatement(context, filing_ID, statement_code), statement_code);
} // -----  end of function StatementCoverage  -----

}		// namespace StatementRecon
