// =====================================================================================
//
//       Filename:  GoldenCheck.h
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

#ifndef GOLDENCHECK_H_
#define GOLDENCHECK_H_

#include <string>
#include <vector>

#include "FilingDataSources.h"
#include "StatementRecon.h"

namespace StatementRecon
{
    // the columns a reader of the statement actually sees.

    inline const std::vector<std::string> kGoldenCompareColumns{"report", "line", "inpth", "tag", "label",
        "formatted_value", "ddate", "qtrs"};

    // a tab delimited table with a header line. the same layout 'reconstruct' mode writes.

    struct TextTable
    {
        std::vector<std::string> columns_;
        std::vector<std::vector<std::string>> rows_;
    };

    struct GoldenCase
    {
        FilingID filing_ID_;
        std::string statement_code_;
        FileName expected_file_;
        std::vector<std::string> compare_columns_ = kGoldenCompareColumns;
    };

    struct GoldenResult
    {
        FilingID filing_ID_;
        std::string statement_code_;
        bool passed_ = false;
        std::string message_;
    };

    // manifest is json: {"cases": [{"adsh": ..., "stmt": ..., "expected_tsv": ..., "compare_columns": [...]}]}
    // relative paths are taken from the manifest's directory.
    // throws ReconException if it can't be read or has no cases.

    std::vector<GoldenCase> LoadGoldenManifest(const FileName& manifest_file);

    // short rows are padded with empty fields.

    TextTable ReadTextTable(const FileName& table_file);

    TextTable StatementTableAsText(const StatementTable& table);

    // fields are trimmed and whole numbers compared as integers so '1500.0' matches '1500'.
    // only the listed columns present in a table are compared.
    // an empty message means the tables match.

    std::string CompareWithGolden(const TextTable& actual, const TextTable& expected,
                                  const std::vector<std::string>& compare_columns);

    GoldenResult CheckGoldenCase(const ReconContext& context, const GoldenCase& golden_case);

}		// namespace StatementRecon

#endif /* end of include guard: GOLDENCHECK_H_ */
