// =====================================================================================
//
//       Filename:  Validator.cpp
//
//    Description:  consistency checks on reconstructed statements, rolled up to
//                  filing and batch level.
//
//        Version:  1.0
//        Created:  09/15/2026 09:30:51 AM
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

#include "Validator.h"

#include <algorithm>
#include <cmath>
#include <execution>
#include <set>
#include <tuple>
#include <utility>

#include <range/v3/action/stable_sort.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/functional/comparisons.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "Recon_Utils.h"
#include "SemanticRoles.h"

namespace
{
    const SR::StatementRow* FirstValuedRowWithRole(const SR::StatementTable& table, SR::SemanticRole role)
    {
        auto found = rng::find_if(table, [role](const SR::StatementRow& row)
                                  { return row.value && SR::HasRole(role, row.presentation.tag); });
        return found != table.end() ? &(*found) : nullptr;
    }

    SR::SubtotalCheck CompareWithTolerance(std::string name, double lhs, double rhs, std::string variant)
    {
        SR::SubtotalCheck check;
        check.name_ = std::move(name);
        check.lhs_ = lhs;
        check.rhs_ = rhs;
        check.delta_ = lhs - rhs;
        check.passed_ = std::fabs(check.delta_) <= check.tolerance_;
        check.variant_ = std::move(variant);
        return check;
    }

    // ===  FUNCTION  ======================================================================
    //         Name:  BeginningAndEndingCash
    //  Description:  labels decide first. if they don't tell us anything, the earliest
    //                and latest dated cash balances are used.
    // =====================================================================================

    std::pair<const SR::StatementRow*, const SR::StatementRow*> BeginningAndEndingCash(const SR::StatementTable& table)
    {
        auto cash_rows = table
            | rng::views::filter([](const SR::StatementRow& row)
                                 { return row.value && SR::HasRole(SR::SemanticRole::e_CashRollForward, row.presentation.tag); })
            | rng::views::transform([](const SR::StatementRow& row) { return &row; })
            | rng::to<std::vector>();

        const SR::StatementRow* beginning = nullptr;
        const SR::StatementRow* ending = nullptr;
        for (const auto* row : cash_rows)
        {
            const auto boundary = SR::BoundaryFromLabel(row->presentation.label);
            if (boundary == SR::BalanceBoundary::e_Beginning && beginning == nullptr)
            {
                beginning = row;
            }
            else if (boundary == SR::BalanceBoundary::e_Ending && ending == nullptr)
            {
                ending = row;
            }
        }
        if (beginning != nullptr && ending != nullptr)
        {
            return {beginning, ending};
        }

        auto dated = cash_rows
            | rng::views::filter([](const SR::StatementRow* row) { return row->end_date.has_value(); })
            | rng::to<std::vector>();
        if (dated.size() < 2)
        {
            return {nullptr, nullptr};
        }
        auto by_date = [](const SR::StatementRow* row) { return *row->end_date; };
        const auto* earliest = *rng::min_element(dated, {}, by_date);
        const auto* latest = *rng::max_element(dated, {}, by_date);
        if (earliest->end_date == latest->end_date)
        {
            return {nullptr, nullptr};
        }
        return {earliest, latest};
    } // -----  end of function BeginningAndEndingCash  -----

    std::vector<SR::SubtotalCheck> CheckCashRollForward(const SR::StatementTable& table)
    {
        const auto* net_change = FirstValuedRowWithRole(table, SR::SemanticRole::e_NetChangeInCash);
        const auto [beginning, ending] = BeginningAndEndingCash(table);
        if (net_change == nullptr || beginning == nullptr || ending == nullptr)
        {
            return {};
        }
        const double expected = *ending->value - *beginning->value;

        auto check = CompareWithTolerance("net_change_equals_ending_less_beginning_cash", *net_change->value, expected,
                                          "net_change");
        if (check.passed_)
        {
            return {check};
        }
        const auto* exchange_effect = FirstValuedRowWithRole(table, SR::SemanticRole::e_ExchangeRateEffect);
        if (exchange_effect != nullptr)
        {
            auto with_fx = CompareWithTolerance("net_change_equals_ending_less_beginning_cash",
                                                *net_change->value + *exchange_effect->value, expected,
                                                "net_change_plus_fx");
            if (with_fx.passed_)
            {
                return {with_fx};
            }
        }
        check.variant_ = "none";
        return {check};
    } // -----  end of function CheckCashRollForward  -----

}		// namespace

namespace StatementRecon
{

std::string ToString(ValidationStatus status)
{
    switch (status)
    {
        case ValidationStatus::e_Pass:
            return "pass";
        case ValidationStatus::e_Warn:
            return "warn";
        case ValidationStatus::e_Fail:
            return "fail";
    }
    return "fail";
} // -----  end of function ToString  -----

bool StatementDiagnostics::SubtotalsPassed() const
{
    return rng::all_of(subtotal_checks_, [](const SubtotalCheck& check) { return check.passed_; });
} // -----  end of method StatementDiagnostics::SubtotalsPassed  -----

bool StatementDiagnostics::Passed() const
{
    return structural_parity_.passed_ && context_coherence_.passed_ && SubtotalsPassed();
} // -----  end of method StatementDiagnostics::Passed  -----

// ===  FUNCTION  ======================================================================
//         Name:  CheckStructuralParity
//  Description:  the table must line up with the sorted presentation rows exactly.
//                no structure means nothing to compare against so it passes.
// =====================================================================================

StructuralParityCheck CheckStructuralParity(PresentationRows structure, const StatementTable& table)
{
    StructuralParityCheck check;
    check.expected_rows_ = static_cast<int>(structure.size());
    check.actual_rows_ = static_cast<int>(table.size());

    if (structure.empty())
    {
        return check;
    }
    check.applicable_ = true;

    structure |= rng::actions::stable_sort(rng::less{}, [](const PresentationRow& row)
                                           { return std::pair(row.report, row.line); });

    const auto common = std::min(structure.size(), table.size());
    for (size_t i = 0; i < common; ++i)
    {
        const auto& expected = structure[i];
        const auto& actual = table[i].presentation;
        if (std::tie(expected.report, expected.line, expected.depth, expected.tag)
            != std::tie(actual.report, actual.line, actual.depth, actual.tag))
        {
            check.first_mismatch_ = static_cast<int>(i);
            break;
        }
    }
    if (! check.first_mismatch_ && structure.size() != table.size())
    {
        check.first_mismatch_ = static_cast<int>(common);
    }
    check.passed_ = ! check.first_mismatch_.has_value();
    return check;
} // -----  end of function CheckStructuralParity  -----

// ===  FUNCTION  ======================================================================
//         Name:  CheckDuplicateCandidates
//  Description:
// =====================================================================================

DuplicateCandidateCheck CheckDuplicateCandidates(const StatementTable& table)
{
    DuplicateCandidateCheck check;
    for (const auto& row : table)
    {
        if (row.candidate_count <= 1)
        {
            continue;
        }
        ++check.duplicate_rows_;
        if (row.candidate_conflict)
        {
            ++check.conflict_rows_;
        }
        check.rows_.push_back({row.presentation.report, row.presentation.line, row.presentation.tag,
                               row.candidate_count, row.candidate_unique_values, row.candidate_conflict});
    }
    return check;
} // -----  end of function CheckDuplicateCandidates  -----

// ===  FUNCTION  ======================================================================
//         Name:  ClassifyMissingValues
//  Description:  headers, text blocks and the like never have numbers. anything
//                else missing a value is worth a look.
// =====================================================================================

MissingValueCheck ClassifyMissingValues(const StatementTable& table)
{
    MissingValueCheck check;
    for (const auto& row : table)
    {
        if (row.has_value)
        {
            continue;
        }
        if (HasRole(SemanticRole::e_NonNumericDisclosure, row.presentation.tag))
        {
            ++check.expected_missing_;
            check.expected_tags_.push_back(row.presentation.tag);
        }
        else
        {
            ++check.unexpected_missing_;
            check.unexpected_tags_.push_back(row.presentation.tag);
        }
    }
    return check;
} // -----  end of function ClassifyMissingValues  -----

// ===  FUNCTION  ======================================================================
//         Name:  CheckContextCoherence
//  Description:  cash flow gets 1 period plus the beginning and ending cash instants.
//                the equity statement moves across several periods so anything goes.
//                everything else must be reported for a single context.
// =====================================================================================

ContextCoherenceCheck CheckContextCoherence(const StatementTable& table, sv statement_code)
{
    ContextCoherenceCheck check;
    for (const auto& row : table)
    {
        if (! row.has_value)
        {
            continue;
        }
        ResolvedContext row_context{row.end_date, row.duration};
        if (rng::find(check.contexts_, row_context) == check.contexts_.end())
        {
            check.contexts_.push_back(row_context);
        }
    }
    check.total_contexts_ = static_cast<int>(check.contexts_.size());
    check.duration_contexts_ = static_cast<int>(rng::count_if(check.contexts_, [](const ResolvedContext& context)
                                                              { return context.duration && *context.duration > 0; }));
    check.instant_contexts_ = static_cast<int>(rng::count_if(check.contexts_, [](const ResolvedContext& context)
                                                             { return context.duration && *context.duration == 0; }));

    if (IsCashFlowFamily(statement_code))
    {
        check.rule_ = "at most 1 duration context and 2 instant contexts";
        check.passed_ = check.duration_contexts_ <= 1 && check.instant_contexts_ <= 2;
    }
    else if (IsEquityStatement(statement_code))
    {
        check.rule_ = "any number of contexts";
        check.passed_ = true;
    }
    else
    {
        check.rule_ = "at most 1 context";
        check.passed_ = check.total_contexts_ <= 1;
    }
    return check;
} // -----  end of function CheckContextCoherence  -----

// ===  FUNCTION  ======================================================================
//         Name:  CheckSubtotals
//  Description:  a check is only made when every value it needs is there.
// =====================================================================================

std::vector<SubtotalCheck> CheckSubtotals(const StatementTable& table, sv statement_code)
{
    if (IsBalanceSheetFamily(statement_code))
    {
        const auto* assets = FirstValuedRowWithRole(table, SemanticRole::e_TotalAssets);
        const auto* liabilities_and_equity = FirstValuedRowWithRole(table, SemanticRole::e_TotalLiabilitiesAndEquity);
        if (assets == nullptr || liabilities_and_equity == nullptr)
        {
            return {};
        }
        return {CompareWithTolerance("assets_equals_liabilities_and_equity", *assets->value,
                                     *liabilities_and_equity->value, "direct")};
    }
    if (IsCashFlowFamily(statement_code))
    {
        return CheckCashRollForward(table);
    }
    return {};
} // -----  end of function CheckSubtotals  -----

// ===  FUNCTION  ======================================================================
//         Name:  SummarizeFiling
//  Description:
// =====================================================================================

FilingSummary SummarizeFiling(const std::map<std::string, StatementDiagnostics>& statements)
{
    FilingSummary summary;
    summary.statements_checked_ = static_cast<int>(statements.size());

    for (const auto& [statement_code, diagnostics] : statements)
    {
        summary.rows_total_ += diagnostics.coverage_.rows_total_;
        summary.rows_with_values_ += diagnostics.coverage_.rows_with_values_;
        if (! diagnostics.structural_parity_.passed_)
        {
            ++summary.structural_failures_;
        }
        if (! diagnostics.context_coherence_.passed_)
        {
            ++summary.context_warnings_;
        }
        summary.duplicate_candidate_rows_ += diagnostics.duplicate_candidates_.duplicate_rows_;
        summary.conflicting_candidate_rows_ += diagnostics.duplicate_candidates_.conflict_rows_;
        summary.subtotal_failures_ += static_cast<int>(rng::count_if(diagnostics.subtotal_checks_,
                                                                     [](const SubtotalCheck& check) { return ! check.passed_; }));
        summary.unexpected_missing_ += diagnostics.missing_values_.unexpected_missing_;
    }
    summary.overall_coverage_ratio_ =
        summary.rows_total_ > 0 ? static_cast<double>(summary.rows_with_values_) / summary.rows_total_ : 0.0;

    if (summary.structural_failures_ > 0 || summary.subtotal_failures_ > 0)
    {
        summary.status_ = ValidationStatus::e_Fail;
    }
    else if (summary.context_warnings_ > 0 || summary.conflicting_candidate_rows_ > 0)
    {
        summary.status_ = ValidationStatus::e_Warn;
    }
    else
    {
        summary.status_ = ValidationStatus::e_Pass;
    }
    return summary;
} // -----  end of function SummarizeFiling  -----

// ===  FUNCTION  ======================================================================
//         Name:  ValidateStatement
//  Description:
// =====================================================================================

StatementDiagnostics ValidateStatement(const ReconContext& context, const FilingID& filing_ID, sv statement_code)
{
    const auto table = ReconstructStatement(context, filing_ID, statement_code);

    StatementDiagnostics diagnostics;
    diagnostics.statement_code_ = statement_code;
    diagnostics.coverage_ = CoverageFromTable(table, statement_code);
    diagnostics.structural_parity_ =
        CheckStructuralParity(context.presentation_.StructureFor(filing_ID, statement_code), table);
    diagnostics.duplicate_candidates_ = CheckDuplicateCandidates(table);
    diagnostics.missing_values_ = ClassifyMissingValues(table);
    diagnostics.context_coherence_ = CheckContextCoherence(table, statement_code);
    diagnostics.subtotal_checks_ = CheckSubtotals(table, statement_code);
    return diagnostics;
} // -----  end of function ValidateStatement  -----

// ===  FUNCTION  ======================================================================
//         Name:  ValidateFiling
//  Description:
// =====================================================================================

FilingValidation ValidateFiling(const ReconContext& context, const FilingID& filing_ID,
                                const std::vector<std::string>& statement_codes)
{
    CheckFilingID(filing_ID);

    FilingValidation validation;
    validation.filing_ID_ = filing_ID;
    for (const auto& statement_code : statement_codes)
    {
        validation.statements_[statement_code] = ValidateStatement(context, filing_ID, statement_code);
    }
    validation.summary_ = SummarizeFiling(validation.statements_);

    spdlog::debug(catenate("Validated filing: ", filing_ID.get(), ". status: ", ToString(validation.summary_.status_)));
    return validation;
} // -----  end of function ValidateFiling  -----

// ===  FUNCTION  ======================================================================
//         Name:  ValidateBatch
//  Description:  each filing is independent so they can all run at once. the merge
//                at the end only adds counts so result order doesn't matter.
// =====================================================================================

BatchValidation ValidateBatch(const ReconContext& context, const FilingIDList& filing_IDs,
                              const std::vector<std::string>& statement_codes)
{
    // check arguments here. an exception escaping a parallel algorithm ends the program.

    for (const auto& filing_ID : filing_IDs)
    {
        CheckFilingID(filing_ID);
    }
    for (const auto& statement_code : statement_codes)
    {
        CheckStatementCode(statement_code);
    }

    // results are keyed by filing so each filing is only counted once.

    FilingIDList unique_filings;
    std::set<std::string> seen;
    for (const auto& filing_ID : filing_IDs)
    {
        if (seen.insert(filing_ID.get()).second)
        {
            unique_filings.push_back(filing_ID);
        }
    }

    std::vector<FilingValidation> validations(unique_filings.size());
    std::transform(std::execution::par, unique_filings.begin(), unique_filings.end(), validations.begin(),
                   [&context, &statement_codes](const FilingID& filing_ID)
                   { return ValidateFiling(context, filing_ID, statement_codes); });

    BatchValidation batch;
    batch.count_ = static_cast<int>(unique_filings.size());
    batch.status_counts_ = {{"pass", 0}, {"warn", 0}, {"fail", 0}};

    for (auto& validation : validations)
    {
        ++batch.status_counts_[ToString(validation.summary_.status_)];
        auto key = validation.filing_ID_.get();
        batch.results_[key] = std::move(validation);
    }
    return batch;
} // -----  end of function ValidateBatch  -----

// ===  FUNCTION  ======================================================================
//         Name:  SummarizeBatch
//  Description:
// =====================================================================================

BatchScoreboard SummarizeBatch(const BatchValidation& batch)
{
    BatchScoreboard scoreboard;
    scoreboard.batch_count_ = batch.count_;
    scoreboard.status_counts_ = batch.status_counts_;

    std::vector<double> coverage_values;

    for (const auto& [filing_ID, validation] : batch.results_)
    {
        const auto& summary = validation.summary_;
        scoreboard.aggregate_structural_failures_ += summary.structural_failures_;
        scoreboard.aggregate_context_warnings_ += summary.context_warnings_;
        scoreboard.aggregate_subtotal_failures_ += summary.subtotal_failures_;
        scoreboard.aggregate_duplicate_candidate_rows_ += summary.duplicate_candidate_rows_;

        for (const auto& [statement_code, diagnostics] : validation.statements_)
        {
            coverage_values.push_back(diagnostics.coverage_.coverage_ratio_);

            auto& health = scoreboard.per_statement_health_[statement_code];
            ++health.total_count_;
            if (diagnostics.Passed())
            {
                ++health.pass_count_;
            }
        }
    }
    for (auto& [statement_code, health] : scoreboard.per_statement_health_)
    {
        health.pass_ratio_ = health.total_count_ > 0 ? static_cast<double>(health.pass_count_) / health.total_count_ : 0.0;
    }
    if (! coverage_values.empty())
    {
        double total = 0.0;
        for (auto value : coverage_values)
        {
            total += value;
        }
        scoreboard.avg_statement_coverage_ratio_ = total / coverage_values.size();
        scoreboard.min_statement_coverage_ratio_ = *rng::min_element(coverage_values);
    }
    return scoreboard;
} // -----  end of function SummarizeBatch  -----

}		// namespace StatementRecon
