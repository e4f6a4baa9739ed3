// =====================================================================================
//
//       Filename:  PostgresSink_test.cpp
//
//    Description:  tests for saving tables and reports to Postgres
//
//        Version:  1.0
//        Created:  09/18/2026 01:48:03 PM
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

#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <pqxx/pqxx>

#include "PostgresSink.h"
#include "ReconTestData.h"
#include "Recon_Utils.h"
#include "TableAssembler.h"

using namespace testing;
using namespace ReconTestData;

TEST(PostgresSink, SchemaFollowsMode)
{
    EXPECT_EQ(SR::PostgresSink::SchemaForMode("test"), "sec_recon");
    EXPECT_EQ(SR::PostgresSink::SchemaForMode("live"), "live_sec_recon");
    EXPECT_THROW(SR::PostgresSink::SchemaForMode("staging"), ReconException);
}

TEST(PostgresSink, NeedsConnectionAndSchema)
{
    EXPECT_THROW(SR::PostgresSink("", "sec_recon"), AssertionException);
    EXPECT_THROW(SR::PostgresSink("dbname=sec_extracts", ""), AssertionException);

    SR::PostgresSink sink{"dbname=sec_extracts user=extractor_pg", "sec_recon"};
    EXPECT_EQ(sink.GetSchemaName(), "sec_recon");
}

// these need a database we can write to. set STATEMENT_RECON_TEST_DB to a libpq
// connection string to run them.

class SaveToDatabase : public Test
{
public:
    void SetUp() override
    {
        const char* connection = std::getenv("STATEMENT_RECON_TEST_DB");
        if (connection == nullptr)
        {
            GTEST_SKIP() << "STATEMENT_RECON_TEST_DB not set.";
        }
        connection_ = connection;
        LoadSampleFiling(data_set_);
    }

    template <typename T>
    T QueryValue(const std::string& query_cmd) const
    {
        pqxx::connection c{connection_};
        pqxx::work trxn{c};
        auto result = trxn.query_value<T>(query_cmd);
        trxn.commit();
        return result;
    }

    std::string connection_;
    SR::SEC_DataSet data_set_;
    SR::ReconContext context_{data_set_, data_set_, &data_set_};
};

TEST_F(SaveToDatabase, RowsAreUpserted)
{
    SR::PostgresSink sink{connection_, "sec_recon"};
    const SR::FilingID filing_ID{kSampleFiling};

    auto tables = SR::ReconstructFiling(context_, filing_ID);
    auto first_count = sink.WriteStatementTables(filing_ID, tables);
    EXPECT_EQ(first_count, 18);

    // writing again replaces rather than adds.

    sink.WriteStatementTables(filing_ID, tables);

    auto saved = QueryValue<int>(fmt::format("SELECT count(*) FROM sec_recon.statement_rows WHERE adsh = '{}'",
                                             kSampleFiling));
    EXPECT_EQ(saved, 18);

    auto repurchase = QueryValue<double>(
        fmt::format("SELECT display_value FROM sec_recon.statement_rows WHERE adsh = '{}' AND stmt = 'CF' AND line = 2",
                    kSampleFiling));
    EXPECT_EQ(repurchase, -40000.0);
}

TEST_F(SaveToDatabase, ValidationReportSaved)
{
    SR::PostgresSink sink{connection_, "sec_recon"};

    auto validation = SR::ValidateFiling(context_, SR::FilingID{kSampleFiling});
    sink.WriteValidationReport(validation);
    sink.WriteValidationReport(validation);

    auto status = QueryValue<std::string>(
        fmt::format("SELECT report_json->'summary'->>'status' FROM sec_recon.validation_reports WHERE adsh = '{}'",
                    kSampleFiling));
    EXPECT_EQ(status, "pass");
}
