// =====================================================================================
//
//       Filename:  StatementCodes.h
//
//    Description:  statement code families and argument checks
//
//        Version:  1.0
//        Created:  09/14/2026 11:20:44 AM
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

#ifndef STATEMENTCODES_H_
#define STATEMENTCODES_H_

#include <string>
#include <vector>

#include "StatementRecon.h"

namespace StatementRecon
{
    // the 5 statements we reconstruct unless told otherwise.

    inline const std::vector<std::string> kCoreStatementCodes{"BS", "IS", "CF", "EQ", "CI"};

    bool IsBalanceSheetFamily(sv statement_code);
    bool IsCashFlowFamily(sv statement_code);
    bool IsIncomeStatementFamily(sv statement_code);

    inline bool IsEquityStatement(sv statement_code) { return statement_code == "EQ"; }
    inline bool IsComprehensiveIncome(sv statement_code) { return statement_code == "CI"; }

    bool IsKnownStatementCode(sv statement_code);

    // these are programmer errors, not data problems. they throw AssertionException.

    void CheckStatementCode(sv statement_code);
    void CheckFilingID(const FilingID& filing_ID);

}		// namespace StatementRecon

#endif /* end of include guard: STATEMENTCODES_H_ */
