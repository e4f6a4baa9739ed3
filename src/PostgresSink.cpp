// =====================================================================================
//
//       Filename:  PostgresSink.cpp
//
//    Description:  saves reconstructed statements and validation reports to
//                  PostgreSQL
//
//        Version:  1.0
//        Created:  09/16/2026 09:52:40 AM
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

#include "PostgresSink.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <pqxx/pqxx>

#include "Recon_Utils.h"
#include "ReportJSON.h"
#include "StatementCodes.h"

namespace
{
    // optional columns go in as SQL NULL when empty.

    template <typename T>
    std::string NumberOrNull(const std::optional<T>& value)
    {
        return value ? fmt::format("{}", *value) : "NULL";
    }

    std::string TextOrNull(pqxx::work& trxn, const std::optional<std::string>& value)
    {
        return value ? trxn.quote(*value) : "NULL";
    }

    std::string DateOrNull(pqxx::work& trxn, const std::optional<date::year_month_day>& value)
    {
        return value ? trxn.quote(FormatDataSetDate(*value)) : "NULL";
    }
}		// namespace

namespace StatementRecon
{

PostgresSink::PostgresSink(std::string connection_string, std::string schema_name)
    : connection_string_{std::move(connection_string)}, schema_name_{std::move(schema_name)}
{
    BOOST_ASSERT_MSG(! connection_string_.empty(), "Must provide a database connection string.");
    BOOST_ASSERT_MSG(! schema_name_.empty(), "Must provide a database schema name.");
} // -----  end of method PostgresSink::PostgresSink  (constructor)  -----

std::string PostgresSink::SchemaForMode(sv DB_mode)
{
    if (DB_mode == "test")
    {
        return "sec_recon";
    }
    if (DB_mode == "live")
    {
        return "live_sec_recon";
    }
    throw ReconException(catenate("Unknown DB mode: '", DB_mode, "'. Must be 'test' or 'live'."));
} // -----  end of method PostgresSink::SchemaForMode  -----

// ===  FUNCTION  ======================================================================
//         Name:  EnsureSchema
//  Description:  creates the schema and both tables if they are not already there.
// =====================================================================================

void PostgresSink::EnsureSchema() const
{
    pqxx::connection c{connection_string_};
    pqxx::work trxn{c};

    trxn.exec(fmt::format("CREATE SCHEMA IF NOT EXISTS {0}", schema_name_));

    auto create_rows_cmd = fmt::format("CREATE TABLE IF NOT EXISTS {0}.statement_rows ("
        " adsh TEXT NOT NULL, stmt TEXT NOT NULL, report INTEGER NOT NULL, line INTEGER NOT NULL,"
        " depth INTEGER, rfile TEXT, tag TEXT, version TEXT, label TEXT, negating BOOLEAN,"
        " value DOUBLE PRECISION, display_value DOUBLE PRECISION, formatted_value TEXT,"
        " uom TEXT, ddate TEXT, qtrs INTEGER, segments TEXT, coreg TEXT,"
        " candidate_count INTEGER, has_value BOOLEAN,"
        " inserted_at TIMESTAMPTZ NOT NULL DEFAULT NOW(), updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
        " PRIMARY KEY (adsh, stmt, report, line))",
            schema_name_)
            ;
    trxn.exec(create_rows_cmd);

    auto create_reports_cmd = fmt::format("CREATE TABLE IF NOT EXISTS {0}.validation_reports ("
        " adsh TEXT PRIMARY KEY, summary_status TEXT, summary_rows_total INTEGER,"
        " summary_rows_with_values INTEGER, summary_coverage_ratio DOUBLE PRECISION,"
        " report_json JSONB NOT NULL,"
        " inserted_at TIMESTAMPTZ NOT NULL DEFAULT NOW(), updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW())",
            schema_name_)
            ;
    trxn.exec(create_reports_cmd);

    trxn.commit();
} // -----  end of method PostgresSink::EnsureSchema  -----

// ===  FUNCTION  ======================================================================
//         Name:  WriteStatementTables
//  Description:  all rows for the filing go in one transaction.
// =====================================================================================

int PostgresSink::WriteStatementTables(const FilingID& filing_ID, const FilingTables& tables) const
{
    CheckFilingID(filing_ID);
    EnsureSchema();

    pqxx::connection c{connection_string_};
    pqxx::work trxn{c};

    int counter = 0;
    for (const auto& [statement_code, table] : tables)
    {
        for (const auto& row : table)
        {
            const auto& pres = row.presentation;
            auto upsert_cmd = fmt::format("INSERT INTO {0}.statement_rows"
                " (adsh, stmt, report, line, depth, rfile, tag, version, label, negating, value,"
                " display_value, formatted_value, uom, ddate, qtrs, segments, coreg, candidate_count, has_value)"
                " VALUES ({1}, {2}, {3}, {4}, {5}, {6}, {7}, {8}, {9}, {10}, {11}, {12}, {13}, {14}, {15}, {16},"
                " {17}, {18}, {19}, {20})"
                " ON CONFLICT (adsh, stmt, report, line) DO UPDATE SET"
                " depth = EXCLUDED.depth, rfile = EXCLUDED.rfile, tag = EXCLUDED.tag,"
                " version = EXCLUDED.version, label = EXCLUDED.label, negating = EXCLUDED.negating,"
                " value = EXCLUDED.value, display_value = EXCLUDED.display_value,"
                " formatted_value = EXCLUDED.formatted_value, uom = EXCLUDED.uom, ddate = EXCLUDED.ddate,"
                " qtrs = EXCLUDED.qtrs, segments = EXCLUDED.segments, coreg = EXCLUDED.coreg,"
                " candidate_count = EXCLUDED.candidate_count, has_value = EXCLUDED.has_value,"
                " updated_at = NOW()",
                    schema_name_,
                    trxn.quote(filing_ID.get()),
                    trxn.quote(statement_code),
                    pres.report,
                    pres.line,
                    pres.depth,
                    trxn.quote(pres.source_file),
                    trxn.quote(pres.tag),
                    trxn.quote(pres.version),
                    trxn.quote(pres.label),
                    pres.negating ? "TRUE" : "FALSE",
                    NumberOrNull(row.value),
                    NumberOrNull(row.display_value),
                    TextOrNull(trxn, row.formatted_value),
                    trxn.quote(row.units),
                    DateOrNull(trxn, row.end_date),
                    NumberOrNull(row.duration),
                    trxn.quote(row.segments),
                    trxn.quote(row.coreg),
                    row.candidate_count,
                    row.has_value ? "TRUE" : "FALSE")
                    ;
            trxn.exec(upsert_cmd);
            ++counter;
        }
    }
    trxn.commit();

    spdlog::debug(catenate("Saved: ", counter, " statement rows for filing: ", filing_ID.get()));
    return counter;
} // -----  end of method PostgresSink::WriteStatementTables  -----

// ===  FUNCTION  ======================================================================
//         Name:  WriteValidationReport
//  Description:
// =====================================================================================

void PostgresSink::WriteValidationReport(const FilingValidation& validation) const
{
    CheckFilingID(validation.filing_ID_);
    EnsureSchema();

    nlohmann::json report = validation;

    pqxx::connection c{connection_string_};
    pqxx::work trxn{c};

    auto upsert_cmd = fmt::format("INSERT INTO {0}.validation_reports"
        " (adsh, summary_status, summary_rows_total, summary_rows_with_values, summary_coverage_ratio, report_json)"
        " VALUES ({1}, {2}, {3}, {4}, {5}, {6}::jsonb)"
        " ON CONFLICT (adsh) DO UPDATE SET"
        " summary_status = EXCLUDED.summary_status, summary_rows_total = EXCLUDED.summary_rows_total,"
        " summary_rows_with_values = EXCLUDED.summary_rows_with_values,"
        " summary_coverage_ratio = EXCLUDED.summary_coverage_ratio, report_json = EXCLUDED.report_json,"
        " updated_at = NOW()",
            schema_name_,
            trxn.quote(validation.filing_ID_.get()),
            trxn.quote(ToString(validation.summary_.status_)),
            validation.summary_.rows_total_,
            validation.summary_.rows_with_values_,
            validation.summary_.overall_coverage_ratio_,
            trxn.quote(report.dump()))
            ;
    trxn.exec(upsert_cmd);
    trxn.commit();

    spdlog::debug(catenate("Saved validation report for filing: ", validation.filing_ID_.get()));
} // -----  end of method PostgresSink::WriteValidationReport  -----

}		// namespace StatementRecon
