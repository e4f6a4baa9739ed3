// =====================================================================================
//
//       Filename:  SignNormalizer.h
//
//    Description:  statement sign conventions and display formatting
//
//        Version:  1.0
//        Created:  09/14/2026 03:02:41 PM
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

#ifndef SIGNNORMALIZER_H_
#define SIGNNORMALIZER_H_

#include <optional>
#include <string>

#include "StatementRecon.h"

namespace StatementRecon
{
    // the negating flag from pre.txt is applied first. then, on the cash flow
    // statement, outflows are forced negative and inflows positive. on the equity
    // statement, reductions are forced negative.

    double ApplySignRules(sv statement_code, sv tag, double value, bool negating);

    // 2 places, grouped thousands, negative values in parentheses.
    // whole numbers drop the decimals.

    std::optional<std::string> FormatDisplayValue(std::optional<double> display_value);

}		// namespace StatementRecon

#endif /* end of include guard: SIGNNORMALIZER_H_ */
