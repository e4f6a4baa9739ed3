// =====================================================================================
//
//       Filename:  SignNormalizer.cpp
//
//    Description:  statement sign conventions and display formatting
//
//        Version:  1.0
//        Created:  09/14/2026 03:09:55 PM
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

#include "SignNormalizer.h"

#include <cmath>

#include <fmt/format.h>

#include "SemanticRoles.h"
#include "StatementCodes.h"

namespace
{
    // put commas into a string of digits with an optional fractional part.

    std::string GroupThousands(const std::string& digits)
    {
        const auto point = digits.find('.');
        const std::string whole = digits.substr(0, point);
        const std::string fraction = point == std::string::npos ? std::string{} : digits.substr(point);

        std::string grouped;
        grouped.reserve(whole.size() + whole.size() / 3 + fraction.size());
        int count = 0;
        for (auto it = whole.rbegin(); it != whole.rend(); ++it)
        {
            if (count > 0 && count % 3 == 0)
            {
                grouped.insert(grouped.begin(), ',');
            }
            grouped.insert(grouped.begin(), *it);
            ++count;
        }
        return grouped + fraction;
    }
}		// namespace

namespace StatementRecon
{

// ===  FUNCTION  ======================================================================
//         Name:  ApplySignRules
//  Description:  the tag overrides win over the negating flag.
// =====================================================================================

double ApplySignRules(sv statement_code, sv tag, double value, bool negating)
{
    double signed_value = negating ? -value : value;

    if (IsCashFlowFamily(statement_code))
    {
        if (HasRole(SemanticRole::e_CashOutflow, tag))
        {
            signed_value = -std::fabs(signed_value);
        }
        else if (HasRole(SemanticRole::e_CashInflow, tag))
        {
            signed_value = std::fabs(signed_value);
        }
    }
    else if (IsEquityStatement(statement_code))
    {
        if (HasRole(SemanticRole::e_EquityReduction, tag))
        {
            signed_value = -std::fabs(signed_value);
        }
    }
    return signed_value;
} // -----  end of function ApplySignRules  -----

// ===  FUNCTION  ======================================================================
//         Name:  FormatDisplayValue
//  Description:
// =====================================================================================

std::optional<std::string> FormatDisplayValue(std::optional<double> display_value)
{
    if (! display_value || ! std::isfinite(*display_value))
    {
        return std::nullopt;
    }

    // fmt rounds the exact binary value so 0.125 -> 0.12 and 2.675 -> 2.67.

    std::string fixed_text = fmt::format("{:.2f}", std::fabs(*display_value));
    const bool is_zero = fixed_text == "0.00";
    if (fixed_text.ends_with(".00"))
    {
        fixed_text.resize(fixed_text.size() - 3);
    }
    std::string abs_text = GroupThousands(fixed_text);

    if (*display_value < 0.0 && ! is_zero)
    {
        return fmt::format("({})", abs_text);
    }
    return abs_text;
} // -----  end of function FormatDisplayValue  -----

}		// namespace StatementRecon
