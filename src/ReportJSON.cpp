// =====================================================================================
//
//       Filename:  ReportJSON.cpp
//
//    Description:  JSON form of statement rows and validation reports
//
//        Version:  1.0
//        Created:  09/15/2026 02:20:03 PM
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

#include "ReportJSON.h"

#include <fstream>

#include "Recon_Utils.h"

namespace
{
    template <typename T>
    nlohmann::json OrNull(const std::optional<T>& value)
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    nlohmann::json OrNull(const std::optional<date::year_month_day>& value)
    {
        return value ? nlohmann::json(FormatDataSetDate(*value)) : nlohmann::json(nullptr);
    }

    nlohmann::json LineItemsAsJSON(const SR::LineItems& items)
    {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& [label, value] : items)
        {
            result.push_back(nlohmann::json{{"label", label}, {"value", value}});
        }
        return result;
    }
}		// namespace

namespace StatementRecon
{

void to_json(nlohmann::json& j, const ResolvedContext& context)
{
    j = nlohmann::json{{"ddate", OrNull(context.end_date)}, {"qtrs", OrNull(context.duration)}};
}

void to_json(nlohmann::json& j, const StatementRow& row)
{
    const auto& presentation = row.presentation;
    j = nlohmann::json{{"adsh", presentation.filing_ID.get()},
                       {"stmt", presentation.statement_code},
                       {"report", presentation.report},
                       {"line", presentation.line},
                       {"inpth", presentation.depth},
                       {"rfile", presentation.source_file},
                       {"tag", presentation.tag},
                       {"version", presentation.version},
                       {"label", presentation.label},
                       {"negating", presentation.negating},
                       {"value", OrNull(row.value)},
                       {"display_value", OrNull(row.display_value)},
                       {"formatted_value", OrNull(row.formatted_value)},
                       {"uom", row.units},
                       {"ddate", OrNull(row.end_date)},
                       {"qtrs", OrNull(row.duration)},
                       {"segments", row.segments},
                       {"coreg", row.coreg},
                       {"candidate_count", row.candidate_count},
                       {"candidate_unique_values", row.candidate_unique_values},
                       {"candidate_conflict", row.candidate_conflict},
                       {"has_value", row.has_value}};
}

void to_json(nlohmann::json& j, const CoverageStats& coverage)
{
    j = nlohmann::json{{"stmt", coverage.statement_code_},
                       {"rows_total", coverage.rows_total_},
                       {"rows_with_values", coverage.rows_with_values_},
                       {"rows_missing_values", coverage.rows_missing_values_},
                       {"coverage_ratio", coverage.coverage_ratio_},
                       {"missing_tags", coverage.missing_tags_}};
}

void to_json(nlohmann::json& j, const StructuralParityCheck& check)
{
    j = nlohmann::json{{"applicable", check.applicable_},
                       {"passed", check.passed_},
                       {"expected_rows", check.expected_rows_},
                       {"actual_rows", check.actual_rows_},
                       {"first_mismatch", OrNull(check.first_mismatch_)}};
}

void to_json(nlohmann::json& j, const CandidateRowDetail& detail)
{
    j = nlohmann::json{{"report", detail.report_},
                       {"line", detail.line_},
                       {"tag", detail.tag_},
                       {"candidate_count", detail.candidate_count_},
                       {"candidate_unique_values", detail.unique_values_},
                       {"candidate_conflict", detail.conflict_}};
}

void to_json(nlohmann::json& j, const DuplicateCandidateCheck& check)
{
    j = nlohmann::json{{"duplicate_rows", check.duplicate_rows_},
                       {"conflict_rows", check.conflict_rows_},
                       {"rows", check.rows_}};
}

void to_json(nlohmann::json& j, const MissingValueCheck& check)
{
    j = nlohmann::json{{"expected_missing", check.expected_missing_},
                       {"unexpected_missing", check.unexpected_missing_},
                       {"expected_tags", check.expected_tags_},
                       {"unexpected_tags", check.unexpected_tags_}};
}

void to_json(nlohmann::json& j, const ContextCoherenceCheck& check)
{
    j = nlohmann::json{{"passed", check.passed_},
                       {"rule", check.rule_},
                       {"duration_contexts", check.duration_contexts_},
                       {"instant_contexts", check.instant_contexts_},
                       {"total_contexts", check.total_contexts_},
                       {"contexts", check.contexts_}};
}

void to_json(nlohmann::json& j, const SubtotalCheck& check)
{
    j = nlohmann::json{{"name", check.name_},
                       {"passed", check.passed_},
                       {"lhs", check.lhs_},
                       {"rhs", check.rhs_},
                       {"delta", check.delta_},
                       {"tolerance", check.tolerance_},
                       {"variant", check.variant_}};
}

void to_json(nlohmann::json& j, const StatementDiagnostics& diagnostics)
{
    j = nlohmann::json{{"stmt", diagnostics.statement_code_},
                       {"coverage", diagnostics.coverage_},
                       {"structural_parity", diagnostics.structural_parity_},
                       {"duplicate_candidates", diagnostics.duplicate_candidates_},
                       {"missing_values", diagnostics.missing_values_},
                       {"context_coherence", diagnostics.context_coherence_},
                       {"subtotal_checks", diagnostics.subtotal_checks_}};
}

void to_json(nlohmann::json& j, const FilingSummary& summary)
{
    j = nlohmann::json{{"statements_checked", summary.statements_checked_},
                       {"rows_total", summary.rows_total_},
                       {"rows_with_values", summary.rows_with_values_},
                       {"overall_coverage_ratio", summary.overall_coverage_ratio_},
                       {"structural_failures", summary.structural_failures_},
                       {"context_warnings", summary.context_warnings_},
                       {"duplicate_candidate_rows", summary.duplicate_candidate_rows_},
                       {"conflicting_candidate_rows", summary.conflicting_candidate_rows_},
                       {"subtotal_failures", summary.subtotal_failures_},
                       {"unexpected_missing", summary.unexpected_missing_},
                       {"status", ToString(summary.status_)}};
}

void to_json(nlohmann::json& j, const FilingValidation& validation)
{
    j = nlohmann::json{{"adsh", validation.filing_ID_.get()},
                       {"statements", validation.statements_},
                       {"summary", validation.summary_}};
}

void to_json(nlohmann::json& j, const BatchValidation& batch)
{
    j = nlohmann::json{{"count", batch.count_}, {"status_counts", batch.status_counts_}, {"results", batch.results_}};
}

void to_json(nlohmann::json& j, const StatementHealth& health)
{
    j = nlohmann::json{{"pass_count", health.pass_count_},
                       {"total_count", health.total_count_},
                       {"pass_ratio", health.pass_ratio_}};
}

void to_json(nlohmann::json& j, const BatchScoreboard& scoreboard)
{
    j = nlohmann::json{{"batch_count", scoreboard.batch_count_},
                       {"status_counts", scoreboard.status_counts_},
                       {"avg_statement_coverage_ratio", scoreboard.avg_statement_coverage_ratio_},
                       {"min_statement_coverage_ratio", scoreboard.min_statement_coverage_ratio_},
                       {"aggregate_structural_failures", scoreboard.aggregate_structural_failures_},
                       {"aggregate_context_warnings", scoreboard.aggregate_context_warnings_},
                       {"aggregate_subtotal_failures", scoreboard.aggregate_subtotal_failures_},
                       {"aggregate_duplicate_candidate_rows", scoreboard.aggregate_duplicate_candidate_rows_},
                       {"per_statement_health", scoreboard.per_statement_health_}};
}

void to_json(nlohmann::json& j, const CompanyInfo& company)
{
    j = nlohmann::json{{"cik", company.CIK_}, {"name", company.name_}};
}

void to_json(nlohmann::json& j, const BalanceSheetView& view)
{
    j = nlohmann::json{{"company", view.company_},
                       {"as_of_date", FormatDataSetDate(view.as_of_date_)},
                       {"assets", LineItemsAsJSON(view.assets_)},
                       {"liabilities", LineItemsAsJSON(view.liabilities_)},
                       {"equity", LineItemsAsJSON(view.equity_)}};
}

void to_json(nlohmann::json& j, const IncomeStatementView& view)
{
    j = nlohmann::json{{"company", view.company_},
                       {"period_start", FormatDataSetDate(view.period_start_)},
                       {"period_end", FormatDataSetDate(view.period_end_)},
                       {"revenues", LineItemsAsJSON(view.revenues_)},
                       {"expenses", LineItemsAsJSON(view.expenses_)},
                       {"net_income", LineItemsAsJSON(view.income_)}};
}

void to_json(nlohmann::json& j, const CashFlowView& view)
{
    j = nlohmann::json{{"company", view.company_},
                       {"period_start", FormatDataSetDate(view.period_start_)},
                       {"period_end", FormatDataSetDate(view.period_end_)},
                       {"operating_activities", LineItemsAsJSON(view.operating_activities_)},
                       {"investing_activities", LineItemsAsJSON(view.investing_activities_)},
                       {"financing_activities", LineItemsAsJSON(view.financing_activities_)}};
}

void to_json(nlohmann::json& j, const FinancialStatementView& view)
{
    j = nlohmann::json{{"company", view.company_},
                       {"adsh", view.filing_ID_.get()},
                       {"period", view.period_},
                       {"filing_date", FormatDataSetDate(view.filing_date_)},
                       {"balance_sheet", OrNull(view.balance_sheet_)},
                       {"income_statement", OrNull(view.income_statement_)},
                       {"cash_flow", OrNull(view.cash_flow_)}};
}

// ===  FUNCTION  ======================================================================
//         Name:  WriteJSONFile
//  Description:
// =====================================================================================

void WriteJSONFile(const FileName& file_name, const nlohmann::json& payload)
{
    std::ofstream output{file_name.get(), std::ios::out | std::ios::binary | std::ios::trunc};
    if (! output)
    {
        throw ReconException(catenate("Unable to open file for output: ", file_name.get()));
    }
    output << payload.dump(2) << '\n';
    output.close();
    if (! output)
    {
        throw ReconException(catenate("Unable to write file: ", file_name.get()));
    }
} // -----  end of function WriteJSONFile  -----

}		// namespace StatementRecon
