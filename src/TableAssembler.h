// =====================================================================================
//
//       Filename:  TableAssembler.h
//
//    Description:  builds row accurate statement tables from the presentation
//                  structure and the filing's numeric facts
//
//        Version:  1.0
//        Created:  09/14/2026 03:40:12 PM
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

#ifndef TABLEASSEMBLER_H_
#define TABLEASSEMBLER_H_

#include <optional>
#include <string>
#include <vector>

#include "FilingDataSources.h"
#include "StatementCodes.h"
#include "StatementRecon.h"

namespace StatementRecon
{
    struct CoverageStats
    {
        std::string statement_code_;
        int rows_total_ = 0;
        int rows_with_values_ = 0;
        int rows_missing_values_ = 0;
        double coverage_ratio_ = 0.0;
        std::vector<std::string> missing_tags_;
    };

    // one output row per presentation row, in (report, line) order.
    // an end date or duration given here overrides the one resolved from the facts.
    // a comprehensive income statement with no presentation rows is built from
    // the numeric facts directly.

    StatementTable ReconstructStatement(const ReconContext& context, const FilingID& filing_ID, sv statement_code,
                                        std::optional<date::year_month_day> end_date = std::nullopt,
                                        std::optional<int> duration = std::nullopt);

    FilingTables ReconstructFiling(const ReconContext& context, const FilingID& filing_ID,
                                   const std::vector<std::string>& statement_codes = kCoreStatementCodes);

    CoverageStats StatementCoverage(const ReconContext& context, const FilingID& filing_ID, sv statement_code);

    CoverageStats CoverageFromTable(const StatementTable& table, sv statement_code);

}		// namespace StatementRecon

#endif /* end of include guard: TABLEASSEMBLER_H_ */
