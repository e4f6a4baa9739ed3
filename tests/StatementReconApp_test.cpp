// =====================================================================================
//
//       Filename:  StatementReconApp_test.cpp
//
//    Description:  end to end runs of the program against a small data set
//
//        Version:  1.0
//        Created:  09/18/2026 03:02:55 PM
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
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include "ReconTestData.h"
#include "Recon_Utils.h"
#include "StatementReconApp.h"

using namespace testing;
using namespace ReconTestData;

class RunRecon : public Test
{
public:
    void SetUp() override
    {
        const auto* test_name = UnitTest::GetInstance()->current_test_info()->name();
        work_dir_ = fs::temp_directory_path() / "Statement_Recon_test" / "App" / test_name;
        fs::remove_all(work_dir_);
        data_dir_ = work_dir_ / "2024q1";
        output_dir_ = work_dir_ / "output";
        WriteSampleDataSet(data_dir_);
    }

    void TearDown() override { fs::remove_all(work_dir_); }

    std::vector<std::string> BaseTokens() const
    {
        return {"--data-dir", data_dir_.string(), "--log-level", "none"};
    }

    static std::vector<std::string> NonEmptyLines(const fs::path& file_name)
    {
        const auto content = LoadDataFileForUse(SR::FileName{file_name});
        std::vector<std::string> lines;
        for (auto& line : split_string<std::string>(content, '\n'))
        {
            if (! line.empty())
            {
                lines.push_back(std::move(line));
            }
        }
        return lines;
    }

    static nlohmann::json ReadJSON(const fs::path& file_name)
    {
        std::ifstream input{file_name};
        return nlohmann::json::parse(input);
    }

    fs::path work_dir_;
    fs::path data_dir_;
    fs::path output_dir_;
};

TEST_F(RunRecon, ReconstructWritesOneFilePerStatement)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "reconstruct", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto [success, skipped, errors] = app.Run();
    app.Shutdown();

    EXPECT_EQ(success, 1);
    EXPECT_EQ(skipped, 0);
    EXPECT_EQ(errors, 0);

    for (const auto* code : {"BS", "IS", "CF", "EQ", "CI"})
    {
        EXPECT_TRUE(fs::exists(output_dir_ / fmt::format("{}_{}.tsv", kSampleFiling, code))) << code;
    }

    auto lines = NonEmptyLines(output_dir_ / fmt::format("{}_CF.tsv", kSampleFiling));
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0].substr(0, 11), "report\tline");
    EXPECT_NE(lines[2].find("PaymentsForRepurchaseOfCommonStock"), std::string::npos);
    EXPECT_NE(lines[2].find("(40,000)"), std::string::npos);

    // nothing in the data set for these so just the header.

    EXPECT_EQ(NonEmptyLines(output_dir_ / fmt::format("{}_EQ.tsv", kSampleFiling)).size(), 1u);
}

TEST_F(RunRecon, PinnedEndDate)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--statements", "BS", "--end-date", "20231231", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    auto lines = NonEmptyLines(output_dir_ / fmt::format("{}_BS.tsv", kSampleFiling));
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_NE(lines[1].find("\t200000\t"), std::string::npos);
    EXPECT_NE(lines[1].find("\t20231231\t"), std::string::npos);
    EXPECT_FALSE(fs::exists(output_dir_ / fmt::format("{}_IS.tsv", kSampleFiling)));
}

TEST_F(RunRecon, NamedFilingWithNoDataIsSkipped)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(),
                  {"--filing", kSampleFiling + ",0000000000-24-000000", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(1, 1, 0));
}

TEST_F(RunRecon, FilingListFile)
{
    const auto list_file = work_dir_ / "filings.txt";
    WriteTextFile(list_file, "\n" + kSampleFiling + "\n\n");

    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "validate", "--filing-list", list_file.string(), "--output-dir",
                                 output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));
    EXPECT_TRUE(fs::exists(output_dir_ / (kSampleFiling + ".json")));
}

TEST_F(RunRecon, CoverageReport)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "coverage", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    auto lines = NonEmptyLines(output_dir_ / "coverage.tsv");
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0], "adsh\tstmt\trows_total\trows_with_values\trows_missing_values\tcoverage_ratio");
    EXPECT_EQ(lines[1], kSampleFiling + "\tBS\t3\t3\t0\t1.0000");
    EXPECT_EQ(lines[4], kSampleFiling + "\tEQ\t0\t0\t0\t0.0000");
}

TEST_F(RunRecon, ValidateWritesReport)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "validate", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    auto report = ReadJSON(output_dir_ / (kSampleFiling + ".json"));
    EXPECT_EQ(report["adsh"], kSampleFiling);
    EXPECT_EQ(report["summary"]["status"], "pass");
    EXPECT_EQ(report["summary"]["rows_total"], 10);
    EXPECT_EQ(report["statements"]["CF"]["subtotal_checks"][0]["passed"], true);
}

TEST_F(RunRecon, BatchWritesReportsAndScoreboard)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "batch", "--save-per-filing", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));

    auto batch = ReadJSON(output_dir_ / "batch_report.json");
    EXPECT_EQ(batch["count"], 1);
    EXPECT_EQ(batch["status_counts"]["pass"], 1);
    EXPECT_EQ(batch["status_counts"]["fail"], 0);

    auto scoreboard = ReadJSON(output_dir_ / "summary_scoreboard.json");
    EXPECT_EQ(scoreboard["batch_count"], 1);
    EXPECT_EQ(scoreboard["aggregate_subtotal_failures"], 0);

    EXPECT_TRUE(fs::exists(output_dir_ / "filings" / (kSampleFiling + ".json")));
}

TEST_F(RunRecon, StatementViewsFromSubmission)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "statements", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(1, 0, 0));

    auto view = ReadJSON(output_dir_ / (kSampleFiling + "_statements.json"));
    EXPECT_EQ(view["adsh"], kSampleFiling);
    EXPECT_EQ(view["company"]["cik"], "320193");
    EXPECT_EQ(view["company"]["name"], "APPLE INC");
    EXPECT_EQ(view["period"], "Q1-2024");
    EXPECT_EQ(view["filing_date"], "20240503");

    EXPECT_EQ(view["balance_sheet"]["as_of_date"], "20240331");
    ASSERT_EQ(view["balance_sheet"]["assets"].size(), 1u);
    EXPECT_EQ(view["balance_sheet"]["assets"][0]["label"], "Total assets");
    EXPECT_EQ(view["balance_sheet"]["assets"][0]["value"], 1000000.0);

    ASSERT_EQ(view["income_statement"]["revenues"].size(), 1u);
    EXPECT_EQ(view["income_statement"]["revenues"][0]["value"], 500000.0);
    EXPECT_EQ(view["income_statement"]["net_income"][0]["label"], "Net income");
}

TEST_F(RunRecon, NamedFilingWithNoStatementsHasNoView)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "statements", "--filing", "0000000000-00-000000", "--output-dir",
            output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(0, 1, 0));
    EXPECT_FALSE(fs::exists(output_dir_ / "0000000000-00-000000_statements.json"));
}

TEST_F(RunRecon, GoldenModeComparesWithApprovedTables)
{
    // approve today's output, then check against it.

    const auto approved_dir = work_dir_ / "approved";
    auto approve = BaseTokens();
    approve.insert(approve.end(), {"--mode", "reconstruct", "--statements", "BS,IS", "--output-dir", approved_dir.string()});
    StatementReconApp approve_app{approve};
    ASSERT_TRUE(approve_app.Startup());
    ASSERT_EQ(approve_app.Run(), std::make_tuple(1, 0, 0));

    const auto manifest = work_dir_ / "manifest.json";
    WriteTextFile(manifest, fmt::format(R"({{"cases": [
        {{"adsh": "{0}", "stmt": "BS", "expected_tsv": "approved/{0}_BS.tsv"}},
        {{"adsh": "{0}", "stmt": "IS", "expected_tsv": "approved/{0}_IS.tsv"}}
    ]}})", kSampleFiling));

    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "golden", "--golden-manifest", manifest.string(), "--output-dir",
            output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(2, 0, 0));

    auto report = ReadJSON(output_dir_ / "golden_report.json");
    ASSERT_EQ(report.size(), 2u);
    EXPECT_EQ(report[0]["stmt"], "BS");
    EXPECT_EQ(report[0]["passed"], true);
    EXPECT_EQ(report[1]["passed"], true);

    // now an approved value no longer matches.

    const auto approved_IS = approved_dir / fmt::format("{}_IS.tsv", kSampleFiling);
    auto content = LoadDataFileForUse(SR::FileName{approved_IS});
    auto where = content.find("500,000");
    ASSERT_NE(where, std::string::npos);
    content.replace(where, 7, "500,001");
    WriteTextFile(approved_IS, content);

    StatementReconApp changed_app{tokens};
    ASSERT_TRUE(changed_app.Startup());
    EXPECT_EQ(changed_app.Run(), std::make_tuple(1, 0, 1));

    auto changed_report = ReadJSON(output_dir_ / "golden_report.json");
    EXPECT_EQ(changed_report[1]["passed"], false);
    EXPECT_NE(changed_report[1]["message"].get<std::string>().find("formatted_value"), std::string::npos);
}

TEST_F(RunRecon, GoldenModeNeedsCases)
{
    const auto manifest = work_dir_ / "manifest.json";
    WriteTextFile(manifest, R"({"cases": []})");

    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "golden", "--golden-manifest", manifest.string(), "--output-dir",
            output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(0, 0, 1));
    EXPECT_FALSE(fs::exists(output_dir_ / "golden_report.json"));
}

TEST_F(RunRecon, FormFilterAndLimit)
{
    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "coverage", "--form", "10-K", "--output-dir", output_dir_.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    EXPECT_EQ(app.Run(), std::make_tuple(0, 0, 0));

    auto limited = BaseTokens();
    limited.insert(limited.end(), {"--mode", "coverage", "--max-filings", "0", "--output-dir", output_dir_.string()});

    StatementReconApp limited_app{limited};
    ASSERT_TRUE(limited_app.Startup());
    EXPECT_EQ(limited_app.Run(), std::make_tuple(0, 0, 0));
}

TEST_F(RunRecon, ConfigFileSuppliesOptions)
{
    const auto config_file = work_dir_ / "recon.conf";
    WriteTextFile(config_file, fmt::format("mode = coverage\noutput-dir = {}\nlog-level = none\n", output_dir_.string()));

    std::vector<std::string> tokens{"--data-dir", data_dir_.string(), "--config-file", config_file.string()};

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    auto counters = app.Run();

    EXPECT_EQ(counters, std::make_tuple(1, 0, 0));
    EXPECT_TRUE(fs::exists(output_dir_ / "coverage.tsv"));
}

TEST_F(RunRecon, CommandLineBeatsConfigFile)
{
    const auto config_file = work_dir_ / "recon.conf";
    WriteTextFile(config_file, fmt::format("mode = coverage\noutput-dir = {}\n", output_dir_.string()));

    auto tokens = BaseTokens();
    tokens.insert(tokens.end(), {"--mode", "validate", "--config-file", config_file.string()});

    StatementReconApp app{tokens};
    ASSERT_TRUE(app.Startup());
    app.Run();

    EXPECT_FALSE(fs::exists(output_dir_ / "coverage.tsv"));
    EXPECT_TRUE(fs::exists(output_dir_ / (kSampleFiling + ".json")));
}

TEST_F(RunRecon, BadArgumentsStopStartup)
{
    auto bad_mode = BaseTokens();
    bad_mode.insert(bad_mode.end(), {"--mode", "rebuild"});
    StatementReconApp bad_mode_app{bad_mode};
    EXPECT_FALSE(bad_mode_app.Startup());

    auto bad_statement = BaseTokens();
    bad_statement.insert(bad_statement.end(), {"--statements", "BS,XX"});
    StatementReconApp bad_statement_app{bad_statement};
    EXPECT_FALSE(bad_statement_app.Startup());

    auto bad_date = BaseTokens();
    bad_date.insert(bad_date.end(), {"--end-date", "2024-03-31"});
    StatementReconApp bad_date_app{bad_date};
    EXPECT_FALSE(bad_date_app.Startup());

    auto batch_without_output = BaseTokens();
    batch_without_output.insert(batch_without_output.end(), {"--mode", "batch"});
    StatementReconApp batch_app{batch_without_output};
    EXPECT_FALSE(batch_app.Startup());

    auto save_outside_batch = BaseTokens();
    save_outside_batch.insert(save_outside_batch.end(), {"--mode", "validate", "--save-per-filing"});
    StatementReconApp save_app{save_outside_batch};
    EXPECT_FALSE(save_app.Startup());

    auto bad_db_mode = BaseTokens();
    bad_db_mode.insert(bad_db_mode.end(), {"--DB-mode", "staging"});
    StatementReconApp db_app{bad_db_mode};
    EXPECT_FALSE(db_app.Startup());

    auto golden_without_manifest = BaseTokens();
    golden_without_manifest.insert(golden_without_manifest.end(), {"--mode", "golden"});
    StatementReconApp golden_app{golden_without_manifest};
    EXPECT_FALSE(golden_app.Startup());

    auto golden_missing_manifest = BaseTokens();
    golden_missing_manifest.insert(golden_missing_manifest.end(),
            {"--mode", "golden", "--golden-manifest", (work_dir_ / "manifest.json").string()});
    StatementReconApp golden_missing_app{golden_missing_manifest};
    EXPECT_FALSE(golden_missing_app.Startup());

    std::vector<std::string> no_data_dir{"--mode", "coverage", "--log-level", "none"};
    StatementReconApp no_data_app{no_data_dir};
    EXPECT_FALSE(no_data_app.Startup());

    std::vector<std::string> missing_data_dir{"--data-dir", (work_dir_ / "not_there").string(), "--log-level", "none"};
    StatementReconApp missing_data_app{missing_data_dir};
    EXPECT_FALSE(missing_data_app.Startup());
}
