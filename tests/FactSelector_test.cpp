// =====================================================================================
//
//       Filename:  FactSelector_test.cpp
//
//    Description:  tests for choosing one fact for a presentation row
//
//        Version:  1.0
//        Created:  09/17/2026 11:20:37 AM
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

#include <limits>

#include <gtest/gtest.h>

#include "FactSelector.h"
#include "ReconTestData.h"

using namespace testing;
using namespace ReconTestData;

namespace
{
    const std::string kFiling{"0000000002-24-000002"};
}

TEST(SelectFact, NothingForUnknownTag)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 500)};

    SR::SelectionRequest request{.tag_ = "Goodwill", .statement_code_ = "BS", .label_ = "Goodwill"};
    auto selection = SR::SelectFact(facts, request);

    EXPECT_FALSE(selection.chosen_);
    EXPECT_EQ(selection.candidate_count_, 0);
    EXPECT_EQ(selection.unique_values_, 0);
}

TEST(SelectFact, VersionMustMatchUnlessEmpty)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 500)};

    SR::SelectionRequest wrong_version{.tag_ = "Revenues", .version_ = "us-gaap/2022", .statement_code_ = "IS"};
    EXPECT_FALSE(SR::SelectFact(facts, wrong_version).chosen_);

    SR::SelectionRequest any_version{.tag_ = "Revenues", .statement_code_ = "IS"};
    EXPECT_TRUE(SR::SelectFact(facts, any_version).chosen_);
}

TEST(SelectFact, BalanceSheetUsesTargetDate)
{
    SR::NumericFacts facts{Fact(kFiling, "Cash", "20231231", 0, 200000), Fact(kFiling, "Cash", "20240331", 0, 250000)};

    SR::SelectionRequest request{.tag_ = "Cash",
                                 .version_ = "us-gaap/2023",
                                 .statement_code_ = "BS",
                                 .label_ = "Cash",
                                 .target_date_ = YMD("20240331"),
                                 .target_duration_ = 0};
    auto selection = SR::SelectFact(facts, request);

    ASSERT_TRUE(selection.chosen_);
    EXPECT_EQ(selection.chosen_->value, 250000);
    EXPECT_EQ(selection.candidate_count_, 1);
}

TEST(SelectFact, ConsolidatedBeatsCoregistrant)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 900000, "SubsidiaryMember"),
                           Fact(kFiling, "Revenues", "20240331", 1, 500000)};

    SR::SelectionRequest request{.tag_ = "Revenues",
                                 .statement_code_ = "IS",
                                 .label_ = "Total revenues",
                                 .target_date_ = YMD("20240331"),
                                 .target_duration_ = 1};
    auto selection = SR::SelectFact(facts, request);

    ASSERT_TRUE(selection.chosen_);
    EXPECT_EQ(selection.chosen_->value, 500000);
    EXPECT_TRUE(selection.chosen_->coreg.empty());
    EXPECT_EQ(selection.candidate_count_, 1);
}

TEST(SelectFact, DateThatMatchesNothingIsIgnored)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 500000)};

    SR::SelectionRequest request{.tag_ = "Revenues",
                                 .statement_code_ = "IS",
                                 .target_date_ = YMD("20240630"),
                                 .target_duration_ = 1};
    auto selection = SR::SelectFact(facts, request);

    ASSERT_TRUE(selection.chosen_);
    EXPECT_EQ(selection.chosen_->value, 500000);
}

TEST(SelectFact, ConflictingCandidatesAreCounted)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 480000),
                           Fact(kFiling, "Revenues", "20240331", 1, 500000),
                           Fact(kFiling, "Revenues", "20240331", 1, 500000)};

    SR::SelectionRequest request{.tag_ = "Revenues",
                                 .statement_code_ = "IS",
                                 .target_date_ = YMD("20240331"),
                                 .target_duration_ = 1};
    auto selection = SR::SelectFact(facts, request);

    ASSERT_TRUE(selection.chosen_);
    EXPECT_EQ(selection.candidate_count_, 3);
    EXPECT_EQ(selection.unique_values_, 2);

    // largest absolute value wins the ranking.

    EXPECT_EQ(selection.chosen_->value, 500000);
}

TEST(SelectFact, CashFlowBeginningAndEndingBalances)
{
    SR::NumericFacts facts{Fact(kFiling, "Cash", "20221231", 0, 150000), Fact(kFiling, "Cash", "20231231", 0, 200000),
                           Fact(kFiling, "Cash", "20240331", 0, 250000)};

    SR::SelectionRequest beginning{.tag_ = "Cash",
                                   .statement_code_ = "CF",
                                   .label_ = "Cash at beginning of period",
                                   .target_date_ = YMD("20240331"),
                                   .target_duration_ = 1};
    auto begin_selection = SR::SelectFact(facts, beginning);

    ASSERT_TRUE(begin_selection.chosen_);
    EXPECT_EQ(begin_selection.chosen_->value, 200000);
    EXPECT_EQ(begin_selection.chosen_->duration, 0);

    SR::SelectionRequest ending{.tag_ = "Cash",
                                .statement_code_ = "CF",
                                .label_ = "Cash, end of period",
                                .target_date_ = YMD("20240331"),
                                .target_duration_ = 1};
    auto end_selection = SR::SelectFact(facts, ending);

    ASSERT_TRUE(end_selection.chosen_);
    EXPECT_EQ(end_selection.chosen_->value, 250000);
}

TEST(SelectFact, EquityBalancesSpanTheFilingUnlessPinned)
{
    SR::NumericFacts facts{Fact(kFiling, "StockholdersEquity", "20221231", 0, 400000),
                           Fact(kFiling, "StockholdersEquity", "20231231", 0, 500000),
                           Fact(kFiling, "StockholdersEquity", "20240331", 0, 580000)};

    SR::SelectionRequest request{.tag_ = "StockholdersEquity",
                                 .statement_code_ = "EQ",
                                 .label_ = "Balance, beginning of period",
                                 .target_date_ = YMD("20240331"),
                                 .target_duration_ = 1};

    auto outer = SR::SelectFact(facts, request);
    ASSERT_TRUE(outer.chosen_);
    EXPECT_EQ(outer.chosen_->value, 400000);

    request.date_pinned_ = true;

    auto pinned = SR::SelectFact(facts, request);
    ASSERT_TRUE(pinned.chosen_);
    EXPECT_EQ(pinned.chosen_->value, 500000);
}

TEST(SelectFact, EquityKeepsSegmentedCandidates)
{
    SR::NumericFacts facts{Fact(kFiling, "StockholdersEquity", "20240331", 0, 300000, "", "EquityComponents=RetainedEarnings"),
                           Fact(kFiling, "StockholdersEquity", "20240331", 0, 580000)};

    SR::SelectionRequest request{.tag_ = "StockholdersEquity",
                                 .statement_code_ = "EQ",
                                 .label_ = "Balance, end of period",
                                 .target_date_ = YMD("20240331"),
                                 .target_duration_ = 1};
    auto selection = SR::SelectFact(facts, request);

    ASSERT_TRUE(selection.chosen_);
    EXPECT_EQ(selection.candidate_count_, 2);
    EXPECT_EQ(selection.unique_values_, 2);
    EXPECT_EQ(selection.chosen_->value, 580000);
}

TEST(SelectFact, SegmentsDroppedOutsideEquity)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 900000, "", "ProductOrService=Phones"),
                           Fact(kFiling, "Revenues", "20240331", 1, 500000)};

    SR::SelectionRequest request{.tag_ = "Revenues",
                                 .statement_code_ = "IS",
                                 .target_date_ = YMD("20240331"),
                                 .target_duration_ = 1};
    auto selection = SR::SelectFact(facts, request);

    ASSERT_TRUE(selection.chosen_);
    EXPECT_EQ(selection.candidate_count_, 1);
    EXPECT_EQ(selection.chosen_->value, 500000);
}

TEST(RankCandidates, OrderOfPreference)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 999999, "SubsidiaryMember"),
                           Fact(kFiling, "Revenues", "20240331", 1, 700000, "", "ProductOrService=Phones"),
                           Fact(kFiling, "Revenues", "20231231", 1, -500000),
                           Fact(kFiling, "Revenues", "20240331", 1, 500000),
                           Fact(kFiling, "Revenues", "20240331", 1, 100)};

    SR::FactPtrs candidates{&facts[0], &facts[1], &facts[2], &facts[3], &facts[4]};
    auto ranked = SR::RankCandidates(candidates, true);

    ASSERT_EQ(ranked.size(), 5u);

    // same absolute value so the later date comes first.

    EXPECT_EQ(ranked[0], &facts[3]);
    EXPECT_EQ(ranked[1], &facts[2]);
    EXPECT_EQ(ranked[2], &facts[4]);
    EXPECT_EQ(ranked[3], &facts[1]);
    EXPECT_EQ(ranked[4], &facts[0]);

    // segments only count when asked.

    auto segments_ok = SR::RankCandidates(candidates, false);
    EXPECT_EQ(segments_ok[0], &facts[1]);
}

TEST(CountUniqueValues, IgnoresAbsentValues)
{
    auto no_value = Fact(kFiling, "Revenues", "20240331", 1, 0);
    no_value.value.reset();
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, 10), Fact(kFiling, "Revenues", "20240331", 1, 10),
                           no_value};

    EXPECT_EQ(SR::CountUniqueValues({&facts[0], &facts[1], &facts[2]}), 1);
    EXPECT_EQ(SR::CountUniqueValues({}), 0);
}

TEST(CountUniqueValues, NotANumberDoesNotHideConflict)
{
    SR::NumericFacts facts{Fact(kFiling, "Revenues", "20240331", 1, std::numeric_limits<double>::quiet_NaN()),
                           Fact(kFiling, "Revenues", "20240331", 1, 5),
                           Fact(kFiling, "Revenues", "20240331", 1, 7)};

    EXPECT_EQ(SR::CountUniqueValues({&facts[0], &facts[1], &facts[2]}), 2);

    SR::SelectionRequest request{.tag_ = "Revenues",
                                 .statement_code_ = "IS",
                                 .target_date_ = YMD("20240331"),
                                 .target_duration_ = 1};
    auto selection = SR::SelectFact(facts, request);

    ASSERT_TRUE(selection.chosen_);
    EXPECT_EQ(selection.candidate_count_, 3);
    EXPECT_EQ(selection.unique_values_, 2);
    EXPECT_EQ(selection.chosen_->value, 7);
}
