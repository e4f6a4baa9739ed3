// =====================================================================================
//
//       Filename:  SemanticRoles.cpp
//
//    Description:  one place for all the tag and label keyword rules used to infer
//                  the accounting role of a row.
//
//        Version:  1.0
//        Created:  09/14/2026 11:52:36 AM
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

#include "SemanticRoles.h"

#include <range/v3/algorithm/find_if.hpp>

namespace rng = ranges;

#include "Recon_Utils.h"

namespace StatementRecon
{

// ===  FUNCTION  ======================================================================
//         Name:  RoleRules
//  Description:  the table is built once. boost::regex objects are safe to share
//                between threads as long as nobody modifies them.
// =====================================================================================

const std::vector<RoleRule>& RoleRules()
{
    static const auto icase = boost::regex_constants::normal | boost::regex_constants::icase;

    static const std::vector<RoleRule> rules{
        {SemanticRole::e_CashOutflow, "cash outflow", boost::regex{R"***(payment|repurchase|repay|purchase)***", icase},
         std::nullopt},
        {SemanticRole::e_CashInflow, "cash inflow", boost::regex{R"***(proceeds|issuance|borrowings|borrow)***", icase},
         std::nullopt},
        {SemanticRole::e_EquityReduction, "equity reduction",
         boost::regex{R"***(dividend|repurchase|purchases|payment)***", icase}, std::nullopt},

        // the balance which gets rolled forward on the cash flow statement.
        // the flows themselves also start with 'Cash' so keep them out.

        {SemanticRole::e_CashRollForward, "cash roll forward", boost::regex{R"***(^cash)***", icase},
         boost::regex{R"***(PeriodIncreaseDecrease|ProvidedBy|UsedIn|Paid|Received|Acquired|Divested)***", icase}},
        {SemanticRole::e_NetChangeInCash, "net change in cash", boost::regex{R"***(^cash.*PeriodIncreaseDecrease)***", icase},
         std::nullopt},
        {SemanticRole::e_ExchangeRateEffect, "exchange rate effect",
         boost::regex{R"***(^EffectOfExchangeRateOnCash)***", icase}, std::nullopt},
        {SemanticRole::e_TotalAssets, "total assets", boost::regex{R"***(^Assets$)***", icase}, std::nullopt},
        {SemanticRole::e_TotalLiabilitiesAndEquity, "total liabilities and equity",
         boost::regex{R"***(^LiabilitiesAndStockholdersEquity$)***", icase}, std::nullopt},
        {SemanticRole::e_ComprehensiveIncome, "comprehensive income", boost::regex{R"***(ComprehensiveIncome)***", icase},
         std::nullopt},

        // rows which are not expected to carry a number.

        {SemanticRole::e_NonNumericDisclosure, "non-numeric disclosure",
         boost::regex{R"***(CommitmentsAndContingencies|TextBlock$|Abstract$|Policy$|PolicyTextBlock$)***", icase},
         std::nullopt},

        // each view tries its buckets in order so a tag lands in the first one it matches.

        {SemanticRole::e_AssetItem, "asset item", boost::regex{R"***(asset)***", icase}, std::nullopt},
        {SemanticRole::e_LiabilityItem, "liability item", boost::regex{R"***(liab|payable)***", icase}, std::nullopt},
        {SemanticRole::e_EquityItem, "equity item", boost::regex{R"***(equity|stockholders|common)***", icase},
         std::nullopt},
        {SemanticRole::e_RevenueItem, "revenue item", boost::regex{R"***(revenue|sales)***", icase}, std::nullopt},
        {SemanticRole::e_ExpenseItem, "expense item", boost::regex{R"***(expense|cost|depreciation)***", icase},
         std::nullopt},
        {SemanticRole::e_IncomeItem, "income item", boost::regex{R"***(earnings|profit|loss|income)***", icase},
         std::nullopt},
        {SemanticRole::e_OperatingItem, "operating item",
         boost::regex{R"***(operating|depreciation|amortization)***", icase}, std::nullopt},
        {SemanticRole::e_InvestingItem, "investing item", boost::regex{R"***(invest|capital|property)***", icase},
         std::nullopt},
        {SemanticRole::e_FinancingItem, "financing item", boost::regex{R"***(financ|debt|equity|dividend)***", icase},
         std::nullopt},

        {SemanticRole::e_BeginningLabel, "beginning label", boost::regex{R"***(\bbeginning\b)***", icase}, std::nullopt},
        {SemanticRole::e_EndingLabel, "ending label",
         boost::regex{R"***(\bending\b|\bend of (the )?(period|year|quarter)\b)***", icase}, std::nullopt},
        {SemanticRole::e_BalanceLabel, "balance label", boost::regex{R"***(\bbalances?\b)***", icase}, std::nullopt}};

    return rules;
} // -----  end of function RoleRules  -----

// ===  FUNCTION  ======================================================================
//         Name:  RuleFor
//  Description:
// =====================================================================================

const RoleRule& RuleFor(SemanticRole role)
{
    const auto& rules = RoleRules();
    auto found = rng::find_if(rules, [role](const auto& rule) { return rule.role_ == role; });
    BOOST_ASSERT_MSG(found != rules.end(), "Every semantic role must have a rule.");
    return *found;
} // -----  end of function RuleFor  -----

// ===  FUNCTION  ======================================================================
//         Name:  HasRole
//  Description:
// =====================================================================================

bool HasRole(SemanticRole role, sv text)
{
    if (text.empty())
    {
        return false;
    }
    const auto& rule = RuleFor(role);
    if (! boost::regex_search(text.begin(), text.end(), rule.include_))
    {
        return false;
    }
    if (rule.exclude_ && boost::regex_search(text.begin(), text.end(), *rule.exclude_))
    {
        return false;
    }
    return true;
} // -----  end of function HasRole  -----

BalanceBoundary BoundaryFromLabel(sv label)
{
    if (HasRole(SemanticRole::e_BeginningLabel, label))
    {
        return BalanceBoundary::e_Beginning;
    }
    if (HasRole(SemanticRole::e_EndingLabel, label))
    {
        return BalanceBoundary::e_Ending;
    }
    return BalanceBoundary::e_None;
} // -----  end of function BoundaryFromLabel  -----

bool IsBalanceLabel(sv label)
{
    return HasRole(SemanticRole::e_BalanceLabel, label);
} // -----  end of function IsBalanceLabel  -----

}		// namespace StatementRecon
