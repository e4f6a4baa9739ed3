// =====================================================================================
//
//       Filename:  PostgresSink.h
//
//    Description:  saves reconstructed statements and validation reports to
//                  PostgreSQL
//
//        Version:  1.0
//        Created:  09/16/2026 09:40:12 AM
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

#ifndef POSTGRESSINK_H_
#define POSTGRESSINK_H_

#include <string>

#include "StatementRecon.h"
#include "Validator.h"

namespace StatementRecon
{
    // =====================================================================================
    //        Class:  PostgresSink
    //  Description:  writes are upserts so a filing can be processed any number of times.
    //                each call uses its own connection and transaction.
    // =====================================================================================

    class PostgresSink
    {
    public:
        // ====================  LIFECYCLE     =======================================

        PostgresSink(std::string connection_string, std::string schema_name);

        PostgresSink() = delete;
        PostgresSink(const PostgresSink& rhs) = default;
        PostgresSink(PostgresSink&& rhs) = default;

        ~PostgresSink() = default;

        // ====================  ACCESSORS     =======================================

        [[nodiscard]] const std::string& GetSchemaName() const { return schema_name_; }

        // 'test' and 'live' are the only modes.

        static std::string SchemaForMode(sv DB_mode);

        // ====================  MUTATORS      =======================================

        void EnsureSchema() const;

        // returns the number of rows written. empty tables are skipped.

        int WriteStatementTables(const FilingID& filing_ID, const FilingTables& tables) const;

        void WriteValidationReport(const FilingValidation& validation) const;

        // ====================  OPERATORS     =======================================

        PostgresSink& operator=(const PostgresSink& rhs) = default;
        PostgresSink& operator=(PostgresSink&& rhs) = default;

    private:
        // ====================  DATA MEMBERS  =======================================

        std::string connection_string_;
        std::string schema_name_;

    }; // -----  end of class PostgresSink  -----

}		// namespace StatementRecon

#endif /* end of include guard: POSTGRESSINK_H_ */
