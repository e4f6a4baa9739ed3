// =====================================================================================
//
//       Filename:  ReportJSON.h
//
//    Description:  JSON form of statement rows and validation reports
//
//        Version:  1.0
//        Created:  09/15/2026 02:11:36 PM
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

#ifndef REPORTJSON_H_
#define REPORTJSON_H_

#include <nlohmann/json.hpp>

#include "StatementRecon.h"
#include "StatementViews.h"
#include "TableAssembler.h"
#include "Validator.h"

namespace StatementRecon
{
    // found by ADL so 'nlohmann::json j = report;' just works.
    // absent values become null. dates are written the way the data sets do, 'YYYYMMDD'.

    void to_json(nlohmann::json& j, const ResolvedContext& context);
    void to_json(nlohmann::json& j, const StatementRow& row);
    void to_json(nlohmann::json& j, const CoverageStats& coverage);
    void to_json(nlohmann::json& j, const StructuralParityCheck& check);
    void to_json(nlohmann::json& j, const CandidateRowDetail& detail);
    void to_json(nlohmann::json& j, const DuplicateCandidateCheck& check);
    void to_json(nlohmann::json& j, const MissingValueCheck& check);
    void to_json(nlohmann::json& j, const ContextCoherenceCheck& check);
    void to_json(nlohmann::json& j, const SubtotalCheck& check);
    void to_json(nlohmann::json& j, const StatementDiagnostics& diagnostics);
    void to_json(nlohmann::json& j, const FilingSummary& summary);
    void to_json(nlohmann::json& j, const FilingValidation& validation);
    void to_json(nlohmann::json& j, const BatchValidation& batch);
    void to_json(nlohmann::json& j, const StatementHealth& health);
    void to_json(nlohmann::json& j, const BatchScoreboard& scoreboard);

    // line items go out as an array of {label, value} so presentation order survives.

    void to_json(nlohmann::json& j, const CompanyInfo& company);
    void to_json(nlohmann::json& j, const BalanceSheetView& view);
    void to_json(nlohmann::json& j, const IncomeStatementView& view);
    void to_json(nlohmann::json& j, const CashFlowView& view);
    void to_json(nlohmann::json& j, const FinancialStatementView& view);

    // pretty printed with 2 space indent. throws ReconException if the file
    // can't be written.

    void WriteJSONFile(const FileName& file_name, const nlohmann::json& payload);

}		// namespace StatementRecon

#endif /* end of include guard: REPORTJSON_H_ */
