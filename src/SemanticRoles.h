// =====================================================================================
//
//       Filename:  SemanticRoles.h
//
//    Description:  one place for all the tag and label keyword rules used to infer
//                  the accounting role of a row.
//
//        Version:  1.0
//        Created:  09/14/2026 11:47:19 AM
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

#ifndef SEMANTICROLES_H_
#define SEMANTICROLES_H_

#include <optional>
#include <string>
#include <vector>

#include <boost/regex.hpp>

#include "StatementRecon.h"

namespace StatementRecon
{
    enum class SemanticRole
    {
        // matched against concept tags

        e_CashOutflow,
        e_CashInflow,
        e_EquityReduction,
        e_CashRollForward,
        e_NetChangeInCash,
        e_ExchangeRateEffect,
        e_TotalAssets,
        e_TotalLiabilitiesAndEquity,
        e_ComprehensiveIncome,
        e_NonNumericDisclosure,

        // line item buckets for the categorized statement views

        e_AssetItem,
        e_LiabilityItem,
        e_EquityItem,
        e_RevenueItem,
        e_ExpenseItem,
        e_IncomeItem,
        e_OperatingItem,
        e_InvestingItem,
        e_FinancingItem,

        // matched against presentation labels

        e_BeginningLabel,
        e_EndingLabel,
        e_BalanceLabel
    };

    enum class BalanceBoundary
    {
        e_None,
        e_Beginning,
        e_Ending
    };

    // all matching is case insensitive. a rule matches when 'include' is found
    // anywhere in the text and 'exclude' (when there is one) is not.

    struct RoleRule
    {
        SemanticRole role_;
        std::string name_;
        boost::regex include_;
        std::optional<boost::regex> exclude_;
    };

    const std::vector<RoleRule>& RoleRules();

    const RoleRule& RuleFor(SemanticRole role);

    bool HasRole(SemanticRole role, sv text);

    // beginning wins if a label somehow mentions both.

    BalanceBoundary BoundaryFromLabel(sv label);

    bool IsBalanceLabel(sv label);

}		// namespace StatementRecon

#endif /* end of include guard: SEMANTICROLES_H_ */
