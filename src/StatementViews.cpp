// =====================================================================================
//
//       Filename:  StatementViews.cpp
//
//    Description:  statement tables regrouped into the usual buckets
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

#include "StatementViews.h"

#include <chrono>
#include <map>
#include <tuple>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/max_element.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace rng = ranges;

#include "ContextResolver.h"
#include "SemanticRoles.h"
#include "TableAssembler.h"

namespace
{
    using RowPtrs = std::vector<const SR::StatementRow*>;

    date::year_month_day Today()
    {
        return date::year_month_day{date::floor<date::days>(std::chrono::system_clock::now())};
    }

    RowPtrs ValuedRows(const SR::StatementTable& table)
    {
        return table
            | rng::views::filter([](const SR::StatementRow& row) { return row.has_value && row.display_value; })
            | rng::views::transform([](const SR::StatementRow& row) { return &row; })
            | rng::to<std::vector>();
    }

    std::optional<date::year_month_day> LatestDate(const RowPtrs& rows)
    {
        std::optional<date::year_month_day> latest;
        for (const auto* row : rows)
        {
            if (row->end_date && (! latest || *row->end_date > *latest))
            {
                latest = row->end_date;
            }
        }
        return latest;
    }

    // the most common duration. a tie goes to the shorter one.

    std::optional<int> MostCommonDuration(const RowPtrs& rows)
    {
        std::map<int, int> counts;
        for (const auto* row : rows)
        {
            if (row->duration)
            {
                ++counts[*row->duration];
            }
        }
        if (counts.empty())
        {
            return std::nullopt;
        }
        return rng::max_element(counts, {}, [](const auto& entry) { return entry.second; })->first;
    }

    void SetLineItem(SR::LineItems& items, const std::string& label, double value)
    {
        auto found = rng::find_if(items, [&label](const auto& item) { return item.first == label; });
        if (found != items.end())
        {
            found->second = value;
            return;
        }
        items.emplace_back(label, value);
    }

    // with nothing valued we assume a single quarter.

    std::pair<date::year_month_day, date::year_month_day> PeriodFromRows(const RowPtrs& valued,
            std::optional<date::year_month_day> period_start, std::optional<date::year_month_day> period_end)
    {
        const auto derived_end = LatestDate(valued).value_or(Today());
        const auto quarters = valued.empty() ? std::optional<int>{1} : MostCommonDuration(valued);
        const auto derived_start = SR::DerivePeriodStart(derived_end, quarters);
        return {period_start.value_or(derived_start), period_end.value_or(derived_end)};
    }
}		// namespace

namespace StatementRecon
{

// ===  FUNCTION  ======================================================================
//         Name:  DerivePeriodStart
//  Description:  a month end steps back to a month end so 06-30 gives 04-01.
//                otherwise a day past the end of a short month is pulled back
//                to that month's last day.
// =====================================================================================

date::year_month_day DerivePeriodStart(date::year_month_day period_end, std::optional<int> quarters)
{
    if (! quarters || *quarters <= 0)
    {
        return period_end;
    }
    const date::year_month_day_last end_of_month{period_end.year(), date::month_day_last{period_end.month()}};
    auto start = period_end - date::months{*quarters * 3};
    if (period_end == date::year_month_day{end_of_month} || ! start.ok())
    {
        start = date::year_month_day{start.year() / start.month() / date::last};
    }
    return date::year_month_day{date::sys_days{start} + date::days{1}};
} // -----  end of function DerivePeriodStart  -----

std::optional<BalanceSheetView> BuildBalanceSheetView(const StatementTable& table, const CompanyInfo& company,
                                                      std::optional<date::year_month_day> as_of_date)
{
    if (table.empty())
    {
        return std::nullopt;
    }
    const auto valued = ValuedRows(table);

    BalanceSheetView view;
    view.company_ = company;
    view.as_of_date_ = as_of_date ? *as_of_date : LatestDate(valued).value_or(Today());

    for (const auto* row : valued)
    {
        const auto& tag = row->presentation.tag;
        const auto& label = row->presentation.label;
        if (HasRole(SemanticRole::e_AssetItem, tag))
        {
            SetLineItem(view.assets_, label, *row->display_value);
        }
        else if (HasRole(SemanticRole::e_LiabilityItem, tag))
        {
            SetLineItem(view.liabilities_, label, *row->display_value);
        }
        else if (HasRole(SemanticRole::e_EquityItem, tag))
        {
            SetLineItem(view.equity_, label, *row->display_value);
        }
    }
    return view;
} // -----  end of function BuildBalanceSheetView  -----

std::optional<IncomeStatementView> BuildIncomeStatementView(const StatementTable& table, const CompanyInfo& company,
        std::optional<date::year_month_day> period_start, std::optional<date::year_month_day> period_end)
{
    if (table.empty())
    {
        return std::nullopt;
    }
    const auto valued = ValuedRows(table);

    IncomeStatementView view;
    view.company_ = company;
    std::tie(view.period_start_, view.period_end_) = PeriodFromRows(valued, period_start, period_end);

    for (const auto* row : valued)
    {
        const auto& tag = row->presentation.tag;
        const auto& label = row->presentation.label;
        if (HasRole(SemanticRole::e_RevenueItem, tag))
        {
            SetLineItem(view.revenues_, label, *row->display_value);
        }
        else if (HasRole(SemanticRole::e_ExpenseItem, tag))
        {
            SetLineItem(view.expenses_, label, *row->display_value);
        }
        else if (HasRole(SemanticRole::e_IncomeItem, tag))
        {
            SetLineItem(view.income_, label, *row->display_value);
        }
    }
    return view;
} // -----  end of function BuildIncomeStatementView  -----

std::optional<CashFlowView> BuildCashFlowView(const StatementTable& table, const CompanyInfo& company,
                                              std::optional<date::year_month_day> period_start,
                                              std::optional<date::year_month_day> period_end)
{
    if (table.empty())
    {
        return std::nullopt;
    }
    const auto valued = ValuedRows(table);

    CashFlowView view;
    view.company_ = company;
    std::tie(view.period_start_, view.period_end_) = PeriodFromRows(valued, period_start, period_end);

    for (const auto* row : valued)
    {
        const auto& tag = row->presentation.tag;
        const auto& label = row->presentation.label;
        if (HasRole(SemanticRole::e_OperatingItem, tag))
        {
            SetLineItem(view.operating_activities_, label, *row->display_value);
        }
        else if (HasRole(SemanticRole::e_InvestingItem, tag))
        {
            SetLineItem(view.investing_activities_, label, *row->display_value);
        }
        else if (HasRole(SemanticRole::e_FinancingItem, tag))
        {
            SetLineItem(view.financing_activities_, label, *row->display_value);
        }
    }
    return view;
} // -----  end of function BuildCashFlowView  -----

// ===  FUNCTION  ======================================================================
//         Name:  BuildFinancialStatementView
//  Description:  the period label falls back to the filing year when the facts
//                don't give us a period.
// =====================================================================================

std::optional<FinancialStatementView> BuildFinancialStatementView(const ReconContext& context,
                                                                  const FilingID& filing_ID,
                                                                  const CompanyInfo& company,
                                                                  date::year_month_day filing_date)
{
    auto balance_sheet = BuildBalanceSheetView(ReconstructStatement(context, filing_ID, "BS"), company);
    auto income_statement = BuildIncomeStatementView(ReconstructStatement(context, filing_ID, "IS"), company);
    auto cash_flow = BuildCashFlowView(ReconstructStatement(context, filing_ID, "CF"), company);

    if (! balance_sheet && ! income_statement && ! cash_flow)
    {
        return std::nullopt;
    }

    FinancialStatementView view;
    view.company_ = company;
    view.filing_ID_ = filing_ID;
    view.period_ = DerivePeriodLabel(ResolveFilingPeriod(context.facts_.FactsFor(filing_ID)),
                                     static_cast<int>(filing_date.year()));
    view.filing_date_ = filing_date;
    view.balance_sheet_ = std::move(balance_sheet);
    view.income_statement_ = std::move(income_statement);
    view.cash_flow_ = std::move(cash_flow);
    return view;
} // -----  end of function BuildFinancialStatementView  -----

}		// namespace StatementRecon
