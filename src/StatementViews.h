// =====================================================================================
//
//       Filename:  StatementViews.h
//
//    Description:  statement tables regrouped into the usual buckets: assets,
//                  liabilities and equity, revenues, expenses and income,
//                  operating, investing and financing
//
//        Version:  1.0
//        Created:  10/19/2026 09:14:37 AM
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

#ifndef STATEMENTVIEWS_H_
#define STATEMENTVIEWS_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <date/date.h>

#include "FilingDataSources.h"
#include "StatementRecon.h"

namespace StatementRecon
{
    // label -> display value, in presentation order. a label seen again keeps
    // its first position and takes the later value.

    using LineItems = std::vector<std::pair<std::string, double>>;

    struct CompanyInfo
    {
        std::string CIK_;
        std::string name_;
    };

    struct BalanceSheetView
    {
        CompanyInfo company_;
        date::year_month_day as_of_date_;
        LineItems assets_;
        LineItems liabilities_;
        LineItems equity_;
    };

    struct IncomeStatementView
    {
        CompanyInfo company_;
        date::year_month_day period_start_;
        date::year_month_day period_end_;
        LineItems revenues_;
        LineItems expenses_;
        LineItems income_;
    };

    struct CashFlowView
    {
        CompanyInfo company_;
        date::year_month_day period_start_;
        date::year_month_day period_end_;
        LineItems operating_activities_;
        LineItems investing_activities_;
        LineItems financing_activities_;
    };

    struct FinancialStatementView
    {
        CompanyInfo company_;
        FilingID filing_ID_;
        std::string period_;
        date::year_month_day filing_date_;
        std::optional<BalanceSheetView> balance_sheet_;
        std::optional<IncomeStatementView> income_statement_;
        std::optional<CashFlowView> cash_flow_;
    };

    // first day of a period of 'quarters' quarters ending on 'period_end'.
    // no duration (or an instant) gives back the end date.

    date::year_month_day DerivePeriodStart(date::year_month_day period_end, std::optional<int> quarters);

    // only rows with values are bucketed. a row whose tag matches no bucket is left out.
    // an empty table gives no view. dates not given are taken from the valued rows.

    std::optional<BalanceSheetView> BuildBalanceSheetView(const StatementTable& table, const CompanyInfo& company,
                                                          std::optional<date::year_month_day> as_of_date = std::nullopt);

    std::optional<IncomeStatementView> BuildIncomeStatementView(const StatementTable& table, const CompanyInfo& company,
            std::optional<date::year_month_day> period_start = std::nullopt,
            std::optional<date::year_month_day> period_end = std::nullopt);

    std::optional<CashFlowView> BuildCashFlowView(const StatementTable& table, const CompanyInfo& company,
                                                  std::optional<date::year_month_day> period_start = std::nullopt,
                                                  std::optional<date::year_month_day> period_end = std::nullopt);

    // reconstructs BS, IS and CF. nothing if all 3 are empty.

    std::optional<FinancialStatementView> BuildFinancialStatementView(const ReconContext& context,
                                                                      const FilingID& filing_ID,
                                                                      const CompanyInfo& company,
                                                                      date::year_month_day filing_date);

}		// namespace StatementRecon

#endif /* end of include guard: STATEMENTVIEWS_H_ */
