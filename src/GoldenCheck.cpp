// =====================================================================================
//
//       Filename:  GoldenCheck.cpp
//
//    Description:  compare reconstructed statements against approved tables
//
//        Version:  1.0
//        Created:  10/19/2026 10:02:51 AM
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

#include "GoldenCheck.h"

#include <charconv>
#include <cmath>
#include <iterator>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <nlohmann/json.hpp>

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/mismatch.hpp>

#include <spdlog/spdlog.h>

namespace rng = ranges;

#include "Recon_Utils.h"
#include "StatementCodes.h"
#include "TableAssembler.h"

namespace
{
    // 'reconstruct' mode output layout.

    const std::vector<std::string> kTableColumns{"report", "line", "inpth", "tag", "label", "value", "display_value",
        "formatted_value", "uom", "ddate", "qtrs", "candidate_count", "has_value"};

    std::string NormalizeField(const std::string& field)
    {
        auto trimmed = boost::algorithm::trim_copy(field);
        double number = 0.0;
        auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
        if (ec == std::errc() && ptr == trimmed.data() + trimmed.size() && std::isfinite(number)
                && number == std::trunc(number) && std::fabs(number) < 1e15)
        {
            return fmt::format("{:.0f}", number);
        }
        return trimmed;
    }

    // the requested columns this table has, in requested order, with their positions.

    std::vector<std::pair<std::string, size_t>> ColumnsToCompare(const SR::TextTable& table,
            const std::vector<std::string>& compare_columns)
    {
        std::vector<std::pair<std::string, size_t>> result;
        for (const auto& name : compare_columns)
        {
            auto found = rng::find(table.columns_, name);
            if (found != table.columns_.end())
            {
                result.emplace_back(name, std::distance(table.columns_.begin(), found));
            }
        }
        return result;
    }

    std::vector<std::vector<std::string>> NormalizedRows(const SR::TextTable& table,
            const std::vector<std::pair<std::string, size_t>>& columns)
    {
        std::vector<std::vector<std::string>> result;
        for (const auto& row : table.rows_)
        {
            std::vector<std::string> fields;
            for (const auto& [name, position] : columns)
            {
                fields.push_back(position < row.size() ? NormalizeField(row[position]) : "");
            }
            result.push_back(std::move(fields));
        }
        return result;
    }

    std::vector<std::string> ColumnNames(const std::vector<std::pair<std::string, size_t>>& columns)
    {
        std::vector<std::string> names;
        for (const auto& column : columns)
        {
            names.push_back(column.first);
        }
        return names;
    }
}		// namespace

namespace StatementRecon
{

// ===  FUNCTION  ======================================================================
//         Name:  LoadGoldenManifest
//  Description:
// =====================================================================================

std::vector<GoldenCase> LoadGoldenManifest(const FileName& manifest_file)
{
    const auto manifest_text = LoadDataFileForUse(manifest_file);
    const auto base_directory = manifest_file.get().parent_path();

    std::vector<GoldenCase> cases;
    try
    {
        const auto manifest = nlohmann::json::parse(manifest_text);
        if (manifest.contains("cases"))
        {
            for (const auto& entry : manifest.at("cases"))
            {
                GoldenCase golden_case;
                golden_case.filing_ID_ = FilingID{entry.at("adsh").get<std::string>()};
                golden_case.statement_code_ = entry.at("stmt").get<std::string>();

                fs::path expected_file = entry.at("expected_tsv").get<std::string>();
                golden_case.expected_file_ = FileName{expected_file.is_absolute() ? expected_file
                                                                                   : base_directory / expected_file};
                if (entry.contains("compare_columns"))
                {
                    golden_case.compare_columns_ = entry.at("compare_columns").get<std::vector<std::string>>();
                }
                cases.push_back(std::move(golden_case));
            }
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw ReconException(catenate("Unable to read golden manifest: ", manifest_file.get(), ". ", e.what()));
    }

    if (cases.empty())
    {
        throw ReconException(catenate("Golden manifest: ", manifest_file.get(), " has no cases."));
    }
    for (const auto& golden_case : cases)
    {
        CheckStatementCode(golden_case.statement_code_);
    }
    return cases;
} // -----  end of function LoadGoldenManifest  -----

TextTable ReadTextTable(const FileName& table_file)
{
    const auto table_text = LoadDataFileForUse(table_file);

    TextTable table;
    bool have_header = false;
    for (auto line : split_string<std::string>(table_text, '\n'))
    {
        if (! line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            continue;
        }
        auto fields = split_string<std::string>(line, '\t');
        if (! have_header)
        {
            table.columns_ = std::move(fields);
            have_header = true;
            continue;
        }
        if (fields.size() < table.columns_.size())
        {
            fields.resize(table.columns_.size());
        }
        table.rows_.push_back(std::move(fields));
    }
    return table;
} // -----  end of function ReadTextTable  -----

TextTable StatementTableAsText(const StatementTable& table)
{
    TextTable result{kTableColumns, {}};
    for (const auto& row : table)
    {
        const auto& pres = row.presentation;
        result.rows_.push_back({
            fmt::format("{}", pres.report),
            fmt::format("{}", pres.line),
            fmt::format("{}", pres.depth),
            pres.tag,
            pres.label,
            row.value ? fmt::format("{}", *row.value) : "",
            row.display_value ? fmt::format("{}", *row.display_value) : "",
            row.formatted_value.value_or(""),
            row.units,
            row.end_date ? FormatDataSetDate(*row.end_date) : "",
            row.duration ? fmt::format("{}", *row.duration) : "",
            fmt::format("{}", row.candidate_count),
            row.has_value ? "true" : "false"});
    }
    return result;
} // -----  end of function StatementTableAsText  -----

// ===  FUNCTION  ======================================================================
//         Name:  CompareWithGolden
//  Description:  row count first, then the column set, then the first row that
//                differs along with the columns that differ in it.
// =====================================================================================

std::string CompareWithGolden(const TextTable& actual, const TextTable& expected,
                              const std::vector<std::string>& compare_columns)
{
    const auto actual_columns = ColumnsToCompare(actual, compare_columns);
    const auto expected_columns = ColumnsToCompare(expected, compare_columns);

    if (actual.rows_.size() != expected.rows_.size())
    {
        return catenate("row count mismatch actual=", actual.rows_.size(), " expected=", expected.rows_.size());
    }

    const auto actual_names = ColumnNames(actual_columns);
    const auto expected_names = ColumnNames(expected_columns);
    if (actual_names != expected_names)
    {
        return catenate("column mismatch actual=[", boost::algorithm::join(actual_names, ","), "] expected=[",
                        boost::algorithm::join(expected_names, ","), ']');
    }

    const auto actual_rows = NormalizedRows(actual, actual_columns);
    const auto expected_rows = NormalizedRows(expected, expected_columns);

    auto [actual_row, expected_row] = rng::mismatch(actual_rows, expected_rows);
    if (actual_row == actual_rows.end())
    {
        return {};
    }

    std::vector<std::string> differences;
    for (size_t i = 0; i < actual_names.size(); ++i)
    {
        if ((*actual_row)[i] != (*expected_row)[i])
        {
            differences.push_back(catenate(actual_names[i], ": actual='", (*actual_row)[i], "' expected='",
                                           (*expected_row)[i], '\''));
        }
    }
    return catenate("first mismatch at row=", std::distance(actual_rows.begin(), actual_row), ' ',
                    boost::algorithm::join(differences, " "));
} // -----  end of function CompareWithGolden  -----

GoldenResult CheckGoldenCase(const ReconContext& context, const GoldenCase& golden_case)
{
    GoldenResult result{golden_case.filing_ID_, golden_case.statement_code_, false, {}};

    if (! fs::exists(golden_case.expected_file_.get()))
    {
        result.message_ = catenate("Missing golden file: ", golden_case.expected_file_.get());
        return result;
    }

    auto actual = StatementTableAsText(ReconstructStatement(context, golden_case.filing_ID_,
                                                            golden_case.statement_code_));
    auto expected = ReadTextTable(golden_case.expected_file_);

    result.message_ = CompareWithGolden(actual, expected, golden_case.compare_columns_);
    result.passed_ = result.message_.empty();
    if (! result.passed_)
    {
        spdlog::debug(catenate("Golden mismatch: ", golden_case.filing_ID_.get(), ' ', golden_case.statement_code_, ". ",
                               result.message_));
    }
    return result;
} // -----  end of function CheckGoldenCase  -----

}		// namespace StatementRecon
