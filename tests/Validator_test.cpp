// =====================================================================================
//
//       Filename:  Validator_test.cpp
//
//    Description:  tests for the statement checks and the batch scoreboard
//
//        Version:  1.0
//        Created:  09/17/2026 03:31:09 PM
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

#include <map>
#include <utility>

#include <gtest/gtest.h>

#include "ReconTestData.h"
#include "Recon_Utils.h"
#include "Validator.h"

using namespace testing;
using namespace ReconTestData;

namespace
{
    // just enough of a row for the checks to work with.

    SR::StatementRow ValuedRow(const std::string& tag, const std::string& label, std::optional<double> value,
                               SR::sv ddate = "20240331", int qtrs = 0)
    {
        SR::StatementRow row;
        row.presentation.statement_code = "BS";
        row.presentation.tag = tag;
        row.presentation.label = label;
        row.value = value;
        row.display_value = value;
        row.has_value = value.has_value();
        row.end_date = YMD(ddate);
        row.duration = qtrs;
        return row;
    }

    const std::string kUnbalancedFiling{"0000789019-24-000020"};

    void LoadUnbalancedFiling(SR::SEC_DataSet& data_set)
    {
        const auto& f = kUnbalancedFiling;
        data_set.AddPresentationRow(Row(f, "BS", 2, 1, "Assets", "Total assets"));
        data_set.AddPresentationRow(Row(f, "BS", 2, 2, "LiabilitiesAndStockholdersEquity", "Total liabilities and equity"));
        data_set.AddFact(Fact(f, "Assets", "20240630", 0, 1000000));
        data_set.AddFact(Fact(f, "LiabilitiesAndStockholdersEquity", "20240630", 0, 999000));
    }
}		// namespace

TEST(CheckSubtotals, BalanceSheetMustBalance)
{
    SR::StatementTable table{ValuedRow("Assets", "Total assets", 1000000),
                             ValuedRow("LiabilitiesAndStockholdersEquity", "Total liabilities and equity", 999000)};

    auto checks = SR::CheckSubtotals(table, "BS");

    ASSERT_EQ(checks.size(), 1u);
    EXPECT_EQ(checks[0].name_, "assets_equals_liabilities_and_equity");
    EXPECT_EQ(checks[0].variant_, "direct");
    EXPECT_FALSE(checks[0].passed_);
    EXPECT_DOUBLE_EQ(checks[0].delta_, 1000.0);
    EXPECT_DOUBLE_EQ(checks[0].tolerance_, 1.0);
}

TEST(CheckSubtotals, WithinTolerancePasses)
{
    SR::StatementTable table{ValuedRow("Assets", "Total assets", 1000000.5),
                             ValuedRow("LiabilitiesAndStockholdersEquity", "Total liabilities and equity", 1000000)};

    auto checks = SR::CheckSubtotals(table, "BS");

    ASSERT_EQ(checks.size(), 1u);
    EXPECT_TRUE(checks[0].passed_);
}

TEST(CheckSubtotals, SkippedWhenAnInputIsMissing)
{
    SR::StatementTable table{ValuedRow("Assets", "Total assets", 1000000),
                             ValuedRow("LiabilitiesAndStockholdersEquity", "Total liabilities and equity", std::nullopt)};

    EXPECT_TRUE(SR::CheckSubtotals(table, "BS").empty());
    EXPECT_TRUE(SR::CheckSubtotals(table, "IS").empty());
}

TEST(CheckSubtotals, CashRollForwardWithExchangeRateEffect)
{
    SR::StatementTable table{
        ValuedRow(kNetChangeInCash, "Net increase in cash", 45000, "20240331", 1),
        ValuedRow("EffectOfExchangeRateOnCashCashEquivalentsRestrictedCashAndRestrictedCashEquivalents",
                  "Effect of exchange rates", 5000, "20240331", 1),
        ValuedRow("CashAndCashEquivalentsAtCarryingValue", "Cash at beginning of period", 200000, "20231231"),
        ValuedRow("CashAndCashEquivalentsAtCarryingValue", "Cash at end of period", 250000, "20240331")};

    auto checks = SR::CheckSubtotals(table, "CF");

    ASSERT_EQ(checks.size(), 1u);
    EXPECT_EQ(checks[0].name_, "net_change_equals_ending_less_beginning_cash");
    EXPECT_EQ(checks[0].variant_, "net_change_plus_fx");
    EXPECT_TRUE(checks[0].passed_);
    EXPECT_DOUBLE_EQ(checks[0].lhs_, 50000.0);
    EXPECT_DOUBLE_EQ(checks[0].rhs_, 50000.0);
}

TEST(CheckSubtotals, CashRollForwardFailure)
{
    SR::StatementTable table{
        ValuedRow(kNetChangeInCash, "Net increase in cash", 10000, "20240331", 1),
        ValuedRow("CashAndCashEquivalentsAtCarryingValue", "Cash at beginning of period", 200000, "20231231"),
        ValuedRow("CashAndCashEquivalentsAtCarryingValue", "Cash at end of period", 250000, "20240331")};

    auto checks = SR::CheckSubtotals(table, "CF");

    ASSERT_EQ(checks.size(), 1u);
    EXPECT_EQ(checks[0].variant_, "none");
    EXPECT_FALSE(checks[0].passed_);
    EXPECT_DOUBLE_EQ(checks[0].delta_, -40000.0);
}

TEST(CheckSubtotals, CashBalancesFoundByDateWhenLabelsSayNothing)
{
    SR::StatementTable table{
        ValuedRow(kNetChangeInCash, "Net increase in cash", 50000, "20240331", 1),
        ValuedRow("CashAndCashEquivalentsAtCarryingValue", "Cash and equivalents", 250000, "20240331"),
        ValuedRow("CashAndCashEquivalentsAtCarryingValue", "Cash and equivalents", 200000, "20231231")};

    auto checks = SR::CheckSubtotals(table, "CF");

    ASSERT_EQ(checks.size(), 1u);
    EXPECT_TRUE(checks[0].passed_);
    EXPECT_EQ(checks[0].variant_, "net_change");
}

TEST(CheckContextCoherence, CashFlowAllowsTwoInstants)
{
    SR::StatementTable table{ValuedRow("NetIncomeLoss", "Net income", 1, "20240331", 1),
                             ValuedRow("Cash", "Cash at beginning of period", 2, "20231231"),
                             ValuedRow("Cash", "Cash at end of period", 3, "20240331")};

    auto check = SR::CheckContextCoherence(table, "CF");
    EXPECT_TRUE(check.passed_);
    EXPECT_EQ(check.duration_contexts_, 1);
    EXPECT_EQ(check.instant_contexts_, 2);
    EXPECT_EQ(check.total_contexts_, 3);

    table.push_back(ValuedRow("Cash", "Cash", 4, "20221231"));

    auto too_many = SR::CheckContextCoherence(table, "CF");
    EXPECT_FALSE(too_many.passed_);
    EXPECT_EQ(too_many.instant_contexts_, 3);
    EXPECT_EQ(too_many.rule_, "at most 1 duration context and 2 instant contexts");
}

TEST(CheckContextCoherence, OtherStatementsWantOneContext)
{
    SR::StatementTable table{ValuedRow("Revenues", "Revenues", 1, "20240331", 1),
                             ValuedRow("Revenues", "Revenues", 2, "20230331", 1),
                             ValuedRow("Goodwill", "Goodwill", std::nullopt, "20220331", 1)};

    auto check = SR::CheckContextCoherence(table, "IS");
    EXPECT_FALSE(check.passed_);
    EXPECT_EQ(check.total_contexts_, 2);
    EXPECT_EQ(check.rule_, "at most 1 context");

    EXPECT_TRUE(SR::CheckContextCoherence(table, "EQ").passed_);
    EXPECT_TRUE(SR::CheckContextCoherence({}, "IS").passed_);
}

TEST(CheckStructuralParity, RowsMustLineUp)
{
    SR::SEC_DataSet data_set;
    LoadSampleFiling(data_set);
    SR::ReconContext context{data_set, data_set, &data_set};
    const SR::FilingID filing_ID{kSampleFiling};

    auto structure = data_set.StructureFor(filing_ID, "BS");
    auto table = SR::ReconstructStatement(context, filing_ID, "BS");

    auto check = SR::CheckStructuralParity(structure, table);
    EXPECT_TRUE(check.applicable_);
    EXPECT_TRUE(check.passed_);
    EXPECT_EQ(check.expected_rows_, 4);
    EXPECT_FALSE(check.first_mismatch_);

    table.pop_back();

    auto short_table = SR::CheckStructuralParity(structure, table);
    EXPECT_FALSE(short_table.passed_);
    EXPECT_EQ(short_table.actual_rows_, 3);
    EXPECT_EQ(short_table.first_mismatch_, 3);

    std::swap(table[0], table[1]);

    auto out_of_order = SR::CheckStructuralParity(structure, table);
    EXPECT_EQ(out_of_order.first_mismatch_, 0);

    auto no_structure = SR::CheckStructuralParity({}, table);
    EXPECT_FALSE(no_structure.applicable_);
    EXPECT_TRUE(no_structure.passed_);
}

TEST(CheckDuplicateCandidates, CountsAndConflicts)
{
    SR::StatementTable table(3);
    table[0].candidate_count = 2;
    table[0].candidate_unique_values = 2;
    table[0].candidate_conflict = true;
    table[0].presentation.tag = "Revenues";
    table[1].candidate_count = 3;
    table[1].candidate_unique_values = 1;
    table[2].candidate_count = 1;

    auto check = SR::CheckDuplicateCandidates(table);

    EXPECT_EQ(check.duplicate_rows_, 2);
    EXPECT_EQ(check.conflict_rows_, 1);
    ASSERT_EQ(check.rows_.size(), 2u);
    EXPECT_EQ(check.rows_[0].tag_, "Revenues");
    EXPECT_TRUE(check.rows_[0].conflict_);
    EXPECT_EQ(check.rows_[1].candidate_count_, 3);
}

TEST(ClassifyMissingValues, HeadersAreExpected)
{
    SR::StatementTable table{ValuedRow("AssetsAbstract", "Assets [Abstract]", std::nullopt),
                             ValuedRow("CommitmentsAndContingencies", "Commitments", std::nullopt),
                             ValuedRow("Goodwill", "Goodwill", std::nullopt),
                             ValuedRow("Assets", "Total assets", 10)};

    auto check = SR::ClassifyMissingValues(table);

    EXPECT_EQ(check.expected_missing_, 2);
    EXPECT_EQ(check.unexpected_missing_, 1);
    EXPECT_EQ(check.unexpected_tags_, std::vector<std::string>{"Goodwill"});
}

TEST(SummarizeFiling, StatusFromChecks)
{
    SR::StatementDiagnostics clean;
    clean.coverage_.rows_total_ = 4;
    clean.coverage_.rows_with_values_ = 3;

    std::map<std::string, SR::StatementDiagnostics> statements{{"BS", clean}};
    auto summary = SR::SummarizeFiling(statements);
    EXPECT_EQ(summary.status_, SR::ValidationStatus::e_Pass);
    EXPECT_DOUBLE_EQ(summary.overall_coverage_ratio_, 0.75);

    auto warned = clean;
    warned.context_coherence_.passed_ = false;
    statements["IS"] = warned;
    summary = SR::SummarizeFiling(statements);
    EXPECT_EQ(summary.status_, SR::ValidationStatus::e_Warn);
    EXPECT_EQ(summary.context_warnings_, 1);

    auto failed = clean;
    failed.subtotal_checks_.push_back(SR::SubtotalCheck{.name_ = "assets_equals_liabilities_and_equity", .passed_ = false});
    statements["CF"] = failed;
    summary = SR::SummarizeFiling(statements);
    EXPECT_EQ(summary.status_, SR::ValidationStatus::e_Fail);
    EXPECT_EQ(summary.subtotal_failures_, 1);
    EXPECT_EQ(summary.statements_checked_, 3);

    EXPECT_EQ(SR::ToString(SR::ValidationStatus::e_Warn), "warn");
}

TEST(ValidateFiling, SampleFilingPasses)
{
    SR::SEC_DataSet data_set;
    LoadSampleFiling(data_set);
    SR::ReconContext context{data_set, data_set, &data_set};

    auto validation = SR::ValidateFiling(context, SR::FilingID{kSampleFiling});

    EXPECT_EQ(validation.filing_ID_.get(), kSampleFiling);
    EXPECT_EQ(validation.statements_.size(), 5u);

    const auto& summary = validation.summary_;
    EXPECT_EQ(summary.status_, SR::ValidationStatus::e_Pass);
    EXPECT_EQ(summary.statements_checked_, 5);
    EXPECT_EQ(summary.rows_total_, 18);
    EXPECT_EQ(summary.rows_with_values_, 17);
    EXPECT_EQ(summary.unexpected_missing_, 0);
    EXPECT_EQ(summary.subtotal_failures_, 0);
    EXPECT_EQ(summary.structural_failures_, 0);
    EXPECT_EQ(summary.context_warnings_, 0);

    const auto& cash_flow = validation.statements_.at("CF");
    ASSERT_EQ(cash_flow.subtotal_checks_.size(), 1u);
    EXPECT_TRUE(cash_flow.subtotal_checks_[0].passed_);
    EXPECT_EQ(cash_flow.subtotal_checks_[0].variant_, "net_change");
    EXPECT_TRUE(cash_flow.Passed());

    const auto& balance_sheet = validation.statements_.at("BS");
    EXPECT_EQ(balance_sheet.missing_values_.expected_missing_, 1);
    EXPECT_TRUE(balance_sheet.structural_parity_.applicable_);

    EXPECT_FALSE(validation.statements_.at("CI").structural_parity_.applicable_);
}

class BatchOfFilings : public Test
{
public:
    void SetUp() override
    {
        LoadSampleFiling(data_set_);
        LoadUnbalancedFiling(data_set_);
    }

    SR::SEC_DataSet data_set_;
    SR::ReconContext context_{data_set_, data_set_, &data_set_};
};

TEST_F(BatchOfFilings, CountsAndScoreboard)
{
    SR::FilingIDList filings{SR::FilingID{kSampleFiling}, SR::FilingID{kUnbalancedFiling}};

    auto batch = SR::ValidateBatch(context_, filings);

    EXPECT_EQ(batch.count_, 2);
    EXPECT_EQ(batch.status_counts_["pass"], 1);
    EXPECT_EQ(batch.status_counts_["warn"], 0);
    EXPECT_EQ(batch.status_counts_["fail"], 1);
    ASSERT_EQ(batch.results_.size(), 2u);
    EXPECT_EQ(batch.results_.at(kUnbalancedFiling).summary_.status_, SR::ValidationStatus::e_Fail);

    auto scoreboard = SR::SummarizeBatch(batch);

    EXPECT_EQ(scoreboard.batch_count_, 2);
    EXPECT_EQ(scoreboard.aggregate_subtotal_failures_, 1);
    EXPECT_EQ(scoreboard.aggregate_structural_failures_, 0);

    // statements with no rows count as 0 coverage.

    EXPECT_DOUBLE_EQ(scoreboard.min_statement_coverage_ratio_, 0.0);
    EXPECT_NEAR(scoreboard.avg_statement_coverage_ratio_, 5.75 / 10.0, 1e-9);

    const auto& balance_sheet = scoreboard.per_statement_health_.at("BS");
    EXPECT_EQ(balance_sheet.total_count_, 2);
    EXPECT_EQ(balance_sheet.pass_count_, 1);
    EXPECT_DOUBLE_EQ(balance_sheet.pass_ratio_, 0.5);
    EXPECT_DOUBLE_EQ(scoreboard.per_statement_health_.at("IS").pass_ratio_, 1.0);
}

TEST_F(BatchOfFilings, RepeatedFilingCountedOnce)
{
    SR::FilingIDList filings{SR::FilingID{kUnbalancedFiling}, SR::FilingID{kSampleFiling},
                             SR::FilingID{kUnbalancedFiling}};

    auto batch = SR::ValidateBatch(context_, filings);

    EXPECT_EQ(batch.count_, 2);
    EXPECT_EQ(batch.status_counts_["pass"], 1);
    EXPECT_EQ(batch.status_counts_["fail"], 1);
    EXPECT_EQ(batch.results_.size(), 2u);
    EXPECT_EQ(SR::SummarizeBatch(batch).aggregate_subtotal_failures_, 1);
}

TEST_F(BatchOfFilings, EmptyBatchStillHasStatusKeys)
{
    auto batch = SR::ValidateBatch(context_, {});

    EXPECT_EQ(batch.count_, 0);
    EXPECT_EQ(batch.status_counts_.size(), 3u);
    EXPECT_EQ(batch.status_counts_.at("pass"), 0);
    EXPECT_EQ(batch.status_counts_.at("fail"), 0);

    auto scoreboard = SR::SummarizeBatch(batch);
    EXPECT_EQ(scoreboard.batch_count_, 0);
    EXPECT_DOUBLE_EQ(scoreboard.avg_statement_coverage_ratio_, 0.0);
    EXPECT_TRUE(scoreboard.per_statement_health_.empty());
}

TEST_F(BatchOfFilings, BadStatementCodeFailsBeforeAnyWork)
{
    SR::FilingIDList filings{SR::FilingID{kSampleFiling}};

    EXPECT_THROW(SR::ValidateBatch(context_, filings, {"BS", "XX"}), AssertionException);
}
