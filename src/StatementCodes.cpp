// =====================================================================================
//
//       Filename:  StatementCodes.cpp
//
//    Description:  statement code families and argument checks
//
//        Version:  1.0
//        Created:  09/14/2026 11:24:02 AM
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

#include "StatementCodes.h"

#include <array>

#include <range/v3/algorithm/find.hpp>

namespace rng = ranges;

#include "Recon_Utils.h"

namespace
{
    // these are the codes which show up in the 'stmt' column of pre.txt
    // UN is 'unclassifiable', CP is the cover page.

    constexpr std::array<SR::sv, 3> kBalanceSheetCodes{"BS", "BS-LND", "BS-ALT"};
    constexpr std::array<SR::sv, 3> kCashFlowCodes{"CF", "CF-INDIRECT", "CF-DIRECT"};
    constexpr std::array<SR::sv, 2> kIncomeStatementCodes{"IS", "IS-COND"};
    constexpr std::array<SR::sv, 5> kOtherCodes{"EQ", "CI", "SI", "UN", "CP"};
}

namespace StatementRecon
{

bool IsBalanceSheetFamily(sv statement_code)
{
    return rng::find(kBalanceSheetCodes, statement_code) != kBalanceSheetCodes.end();
}

bool IsCashFlowFamily(sv statement_code)
{
    return rng::find(kCashFlowCodes, statement_code) != kCashFlowCodes.end();
}

bool IsIncomeStatementFamily(sv statement_code)
{
    return rng::find(kIncomeStatementCodes, statement_code) != kIncomeStatementCodes.end();
}

bool IsKnownStatementCode(sv statement_code)
{
    return IsBalanceSheetFamily(statement_code) || IsCashFlowFamily(statement_code)
           || IsIncomeStatementFamily(statement_code)
           || rng::find(kOtherCodes, statement_code) != kOtherCodes.end();
}

// ===  FUNCTION  ======================================================================
//         Name:  CheckStatementCode
//  Description:
// =====================================================================================

void CheckStatementCode(sv statement_code)
{
    BOOST_ASSERT_MSG(! statement_code.empty(), "Statement code must not be empty.");
    BOOST_ASSERT_MSG(IsKnownStatementCode(statement_code),
                     catenate("Unknown statement code: '", statement_code, "'.").c_str());
} // -----  end of function CheckStatementCode  -----

// ===  FUNCTION  ======================================================================
//         Name:  CheckFilingID
//  Description:
// =====================================================================================

void CheckFilingID(const FilingID& filing_ID)
{
    BOOST_ASSERT_MSG(! filing_ID.get().empty(), "Filing ID must not be empty.");
} // -----  end of function CheckFilingID  -----

}		// namespace StatementRecon
