// =====================================================================================
//
//       Filename:  Validator.h
//
//    Description:  consistency checks on reconstructed statements, rolled up to
//                  filing and batch level.
//
//        Version:  1.0
//        Created:  09/15/2026 09:12:08 AM
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

#ifndef VALIDATOR_H_
#define VALIDATOR_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "FilingDataSources.h"
#include "StatementCodes.h"
#include "StatementRecon.h"
#include "TableAssembler.h"

namespace StatementRecon
{
    constexpr double kSubtotalTolerance = 1.0;

    enum class ValidationStatus
    {
        e_Pass,
        e_Warn,
        e_Fail
    };

    std::string ToString(ValidationStatus status);

    struct StructuralParityCheck
    {
        bool applicable_ = false;
        bool passed_ = true;
        int expected_rows_ = 0;
        int actual_rows_ = 0;

        // position of the first row which does not line up, if any.
        std::optional<int> first_mismatch_;
    };

    struct CandidateRowDetail
    {
        int report_ = 0;
        int line_ = 0;
        std::string tag_;
        int candidate_count_ = 0;
        int unique_values_ = 0;
        bool conflict_ = false;
    };

    struct DuplicateCandidateCheck
    {
        int duplicate_rows_ = 0;
        int conflict_rows_ = 0;
        std::vector<CandidateRowDetail> rows_;
    };

    struct MissingValueCheck
    {
        int expected_missing_ = 0;
        int unexpected_missing_ = 0;
        std::vector<std::string> expected_tags_;
        std::vector<std::string> unexpected_tags_;
    };

    struct ContextCoherenceCheck
    {
        bool passed_ = true;
        int duration_contexts_ = 0;
        int instant_contexts_ = 0;
        int total_contexts_ = 0;
        std::vector<ResolvedContext> contexts_;
        std::string rule_;
    };

    // lhs and rhs are the two sides being compared. delta is lhs - rhs.

    struct SubtotalCheck
    {
        std::string name_;
        bool passed_ = false;
        double lhs_ = 0.0;
        double rhs_ = 0.0;
        double delta_ = 0.0;
        double tolerance_ = kSubtotalTolerance;
        std::string variant_;
    };

    struct StatementDiagnostics
    {
        std::string statement_code_;
        CoverageStats coverage_;
        StructuralParityCheck structural_parity_;
        DuplicateCandidateCheck duplicate_candidates_;
        MissingValueCheck missing_values_;
        ContextCoherenceCheck context_coherence_;
        std::vector<SubtotalCheck> subtotal_checks_;

        [[nodiscard]] bool SubtotalsPassed() const;
        [[nodiscard]] bool Passed() const;
    };

    struct FilingSummary
    {
        int statements_checked_ = 0;
        int rows_total_ = 0;
        int rows_with_values_ = 0;
        double overall_coverage_ratio_ = 0.0;
        int structural_failures_ = 0;
        int context_warnings_ = 0;
        int duplicate_candidate_rows_ = 0;
        int conflicting_candidate_rows_ = 0;
        int subtotal_failures_ = 0;
        int unexpected_missing_ = 0;
        ValidationStatus status_ = ValidationStatus::e_Pass;
    };

    struct FilingValidation
    {
        FilingID filing_ID_;
        std::map<std::string, StatementDiagnostics> statements_;
        FilingSummary summary_;
    };

    struct BatchValidation
    {
        int count_ = 0;
        std::map<std::string, int> status_counts_;
        std::map<std::string, FilingValidation> results_;
    };

    struct StatementHealth
    {
        int pass_count_ = 0;
        int total_count_ = 0;
        double pass_ratio_ = 0.0;
    };

    struct BatchScoreboard
    {
        int batch_count_ = 0;
        std::map<std::string, int> status_counts_;
        double avg_statement_coverage_ratio_ = 0.0;
        double min_statement_coverage_ratio_ = 0.0;
        int aggregate_structural_failures_ = 0;
        int aggregate_context_warnings_ = 0;
        int aggregate_subtotal_failures_ = 0;
        int aggregate_duplicate_candidate_rows_ = 0;
        std::map<std::string, StatementHealth> per_statement_health_;
    };

    // the individual checks. each one only looks at its own inputs.

    StructuralParityCheck CheckStructuralParity(PresentationRows structure, const StatementTable& table);

    DuplicateCandidateCheck CheckDuplicateCandidates(const StatementTable& table);

    MissingValueCheck ClassifyMissingValues(const StatementTable& table);

    ContextCoherenceCheck CheckContextCoherence(const StatementTable& table, sv statement_code);

    std::vector<SubtotalCheck> CheckSubtotals(const StatementTable& table, sv statement_code);

    FilingSummary SummarizeFiling(const std::map<std::string, StatementDiagnostics>& statements);

    StatementDiagnostics ValidateStatement(const ReconContext& context, const FilingID& filing_ID, sv statement_code);

    FilingValidation ValidateFiling(const ReconContext& context, const FilingID& filing_ID,
                                    const std::vector<std::string>& statement_codes = kCoreStatementCodes);

    // filings are validated in parallel. the sources must be safe to read from
    // several threads at once.

    BatchValidation ValidateBatch(const ReconContext& context, const FilingIDList& filing_IDs,
                                  const std::vector<std::string>& statement_codes = kCoreStatementCodes);

    BatchScoreboard SummarizeBatch(const BatchValidation& batch);

}		// namespace StatementRecon

#endif /* end of include guard: VALIDATOR_H_ */
