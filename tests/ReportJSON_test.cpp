// =====================================================================================
//
//       Filename:  ReportJSON_test.cpp
//
//    Description:  tests for the JSON form of tables and reports
//
//        Version:  1.0
//        Created:  09/18/2026 10:37:21 AM
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

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "ReconTestData.h"
#include "Recon_Utils.h"
#include "ReportJSON.h"

using namespace testing;
using namespace ReconTestData;

TEST(ReportJSON, RowWithoutValueUsesNulls)
{
    SR::StatementRow row;
    row.presentation = Row(kSampleFiling, "BS", 2, 1, "AssetsAbstract", "Assets [Abstract]");

    nlohmann::json j = row;

    EXPECT_EQ(j["adsh"], kSampleFiling);
    EXPECT_EQ(j["stmt"], "BS");
    EXPECT_EQ(j["report"], 2);
    EXPECT_EQ(j["line"], 1);
    EXPECT_EQ(j["rfile"], "H");
    EXPECT_EQ(j["negating"], false);
    EXPECT_TRUE(j["value"].is_null());
    EXPECT_TRUE(j["display_value"].is_null());
    EXPECT_TRUE(j["formatted_value"].is_null());
    EXPECT_TRUE(j["ddate"].is_null());
    EXPECT_TRUE(j["qtrs"].is_null());
    EXPECT_EQ(j["has_value"], false);
}

TEST(ReportJSON, ReconstructedRowsCarryValuesAndDates)
{
    SR::SEC_DataSet data_set;
    LoadSampleFiling(data_set);
    SR::ReconContext context{data_set, data_set, &data_set};

    auto table = SR::ReconstructStatement(context, SR::FilingID{kSampleFiling}, "CF");
    ASSERT_EQ(table.size(), 6u);

    nlohmann::json rows = table;
    ASSERT_TRUE(rows.is_array());

    const auto& repurchase = rows[1];
    EXPECT_EQ(repurchase["tag"], "PaymentsForRepurchaseOfCommonStock");
    EXPECT_EQ(repurchase["value"], 40000.0);
    EXPECT_EQ(repurchase["display_value"], -40000.0);
    EXPECT_EQ(repurchase["formatted_value"], "(40,000)");
    EXPECT_EQ(repurchase["ddate"], "20240331");
    EXPECT_EQ(repurchase["qtrs"], 1);
    EXPECT_EQ(repurchase["uom"], "USD");
    EXPECT_EQ(repurchase["candidate_count"], 1);
    EXPECT_EQ(repurchase["candidate_conflict"], false);

    EXPECT_EQ(rows[4]["ddate"], "20231231");
    EXPECT_EQ(rows[4]["qtrs"], 0);
}

TEST(ReportJSON, FilingReportLayout)
{
    SR::SEC_DataSet data_set;
    LoadSampleFiling(data_set);
    SR::ReconContext context{data_set, data_set, &data_set};

    nlohmann::json report = SR::ValidateFiling(context, SR::FilingID{kSampleFiling});

    EXPECT_EQ(report["adsh"], kSampleFiling);
    ASSERT_TRUE(report["statements"].is_object());
    EXPECT_EQ(report["statements"].size(), 5u);

    const auto& summary = report["summary"];
    EXPECT_EQ(summary["status"], "pass");
    EXPECT_EQ(summary["statements_checked"], 5);
    EXPECT_EQ(summary["rows_total"], 18);
    EXPECT_EQ(summary["rows_with_values"], 17);

    const auto& balance_sheet = report["statements"]["BS"];
    EXPECT_EQ(balance_sheet["stmt"], "BS");
    EXPECT_EQ(balance_sheet["coverage"]["coverage_ratio"], 0.75);
    EXPECT_EQ(balance_sheet["coverage"]["missing_tags"][0], "AssetsAbstract");
    EXPECT_EQ(balance_sheet["structural_parity"]["applicable"], true);
    EXPECT_TRUE(balance_sheet["structural_parity"]["first_mismatch"].is_null());
    EXPECT_EQ(balance_sheet["missing_values"]["expected_tags"][0], "AssetsAbstract");
    EXPECT_EQ(balance_sheet["context_coherence"]["rule"], "at most 1 context");
    EXPECT_EQ(balance_sheet["context_coherence"]["contexts"][0]["ddate"], "20240331");
    EXPECT_EQ(balance_sheet["context_coherence"]["contexts"][0]["qtrs"], 0);
    EXPECT_EQ(balance_sheet["subtotal_checks"][0]["name"], "assets_equals_liabilities_and_equity");
    EXPECT_EQ(balance_sheet["subtotal_checks"][0]["variant"], "direct");
    EXPECT_EQ(balance_sheet["duplicate_candidates"]["duplicate_rows"], 0);
    EXPECT_TRUE(balance_sheet["duplicate_candidates"]["rows"].empty());
}

TEST(ReportJSON, BatchAndScoreboardLayout)
{
    SR::SEC_DataSet data_set;
    LoadSampleFiling(data_set);
    SR::ReconContext context{data_set, data_set, &data_set};

    auto batch = SR::ValidateBatch(context, {SR::FilingID{kSampleFiling}});
    nlohmann::json batch_report = batch;

    EXPECT_EQ(batch_report["count"], 1);
    EXPECT_EQ(batch_report["status_counts"]["pass"], 1);
    EXPECT_EQ(batch_report["status_counts"]["warn"], 0);
    EXPECT_EQ(batch_report["status_counts"]["fail"], 0);
    EXPECT_TRUE(batch_report["results"].contains(kSampleFiling));

    nlohmann::json scoreboard = SR::SummarizeBatch(batch);

    EXPECT_EQ(scoreboard["batch_count"], 1);
    EXPECT_EQ(scoreboard["per_statement_health"]["CF"]["pass_count"], 1);
    EXPECT_EQ(scoreboard["per_statement_health"]["CF"]["total_count"], 1);
    EXPECT_EQ(scoreboard["per_statement_health"]["CF"]["pass_ratio"], 1.0);
    EXPECT_EQ(scoreboard["min_statement_coverage_ratio"], 0.75);
    for (const auto* key : {"avg_statement_coverage_ratio", "aggregate_structural_failures", "aggregate_context_warnings",
                            "aggregate_subtotal_failures", "aggregate_duplicate_candidate_rows", "status_counts"})
    {
        EXPECT_TRUE(scoreboard.contains(key)) << key;
    }
}

class WriteJSON : public Test
{
public:
    void SetUp() override
    {
        const auto* test_name = UnitTest::GetInstance()->current_test_info()->name();
        output_dir_ = fs::temp_directory_path() / "Statement_Recon_test" / "ReportJSON" / test_name;
        fs::remove_all(output_dir_);
        fs::create_directories(output_dir_);
    }

    void TearDown() override { fs::remove_all(output_dir_); }

    fs::path output_dir_;
};

TEST_F(WriteJSON, WritesPrettyPrintedFile)
{
    nlohmann::json payload = SR::ResolvedContext{YMD("20240331"), 1};
    const auto file_name = output_dir_ / "context.json";

    SR::WriteJSONFile(SR::FileName{file_name}, payload);

    ASSERT_TRUE(fs::exists(file_name));
    std::ifstream input{file_name};
    auto read_back = nlohmann::json::parse(input);
    EXPECT_EQ(read_back["ddate"], "20240331");
    EXPECT_EQ(read_back["qtrs"], 1);

    const auto text = LoadDataFileForUse(SR::FileName{file_name});
    EXPECT_NE(text.find("\n  \"ddate\""), std::string::npos);
}

TEST_F(WriteJSON, UnwritableLocationThrows)
{
    EXPECT_THROW(SR::WriteJSONFile(SR::FileName{output_dir_ / "no_such_dir" / "x.json"}, nlohmann::json::object()),
                 ReconException);
}
