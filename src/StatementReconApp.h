// =====================================================================================
//
//       Filename:  StatementReconApp.h
//
//    Description:  command line driver for reconstructing and validating
//                  financial statements from an SEC data set
//
//        Version:  1.0
//        Created:  09/16/2026 01:15:08 PM
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

// =====================================================================================
//        Class:  StatementReconApp
//  Description:
// =====================================================================================

#ifndef STATEMENTRECONAPP_H_
#define STATEMENTRECONAPP_H_

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

#include "FilingDataSources.h"
#include "PostgresSink.h"
#include "SEC_DataSet.h"
#include "StatementRecon.h"

class StatementReconApp
{
public:
    StatementReconApp(int argc, char *argv[]);

    // use ctor below for testing with predefined options

    explicit StatementReconApp(const std::vector<std::string> &tokens);

    StatementReconApp() = delete;
    StatementReconApp(const StatementReconApp &rhs) = delete;
    StatementReconApp(StatementReconApp &&rhs) = delete;

    ~StatementReconApp() = default;

    StatementReconApp &operator=(const StatementReconApp &rhs) = delete;
    StatementReconApp &operator=(StatementReconApp &&rhs) = delete;

    static bool SignalReceived()
    {
        return had_signal_;
    }

    bool Startup();

    // success, skipped, error counts. one count per filing.

    std::tuple<int, int, int> Run();
    void Shutdown();

protected:
    enum class RunMode
    {
        e_Reconstruct,
        e_Coverage,
        e_Validate,
        e_Batch,
        e_Statements,
        e_Golden
    };

    //	Setup for parsing program options.

    void SetupProgramOptions();
    void ParseProgramOptions();
    void ParseProgramOptions(const std::vector<std::string> &tokens);
    void ParseConfigFile();

    void ConfigureLogging();

    bool CheckArgs();

    void LoadDataSet();
    void BuildListOfFilingsToProcess();

    std::tuple<int, int, int> ReconstructFilings();
    std::tuple<int, int, int> ReportCoverage();
    std::tuple<int, int, int> ValidateFilings();
    std::tuple<int, int, int> ValidateBatchOfFilings();
    std::tuple<int, int, int> BuildStatementViews();
    std::tuple<int, int, int> CheckAgainstGolden();

    std::tuple<int, int, int> ReconstructSingleFiling(const SR::FilingID &filing_ID);
    std::tuple<int, int, int> ValidateSingleFiling(const SR::FilingID &filing_ID);
    std::tuple<int, int, int> BuildSingleStatementView(const SR::FilingID &filing_ID);

    void ExportStatementTable(const SR::FilingID &filing_ID, const std::string &statement_code,
                              const SR::StatementTable &table) const;

    [[nodiscard]] std::string PeriodLabelFor(const SR::FilingID &filing_ID) const;

private:
    static void HandleSignal(int signal);

    // ====================  DATA MEMBERS  =======================================

    std::unique_ptr<po::options_description> mNewOptions; //	new style options (with identifiers)
    po::variables_map mVariableMap;

    int mArgc = 0;
    char **mArgv = nullptr;
    const std::vector<std::string> tokens_;

    SR::SEC_DataSet data_set_;
    std::optional<SR::PostgresSink> sink_;

    RunMode run_mode_{RunMode::e_Reconstruct};

    std::optional<date::year_month_day> end_date_;
    std::optional<int> duration_;

    std::string mode_{"reconstruct"};
    std::string filings_;
    std::string form_{"10-Q,10-K"};
    std::string statements_{"BS,IS,CF,EQ,CI"};
    std::string end_date_i_;
    std::string DB_mode_{"test"};
    std::string DB_connection_{"dbname=sec_extracts user=extractor_pg"};
    std::string logging_level_{"information"};

    std::vector<std::string> form_list_;
    std::vector<std::string> statement_codes_;

    SR::FileName data_directory_;
    SR::FileName list_of_filings_path_;
    SR::FileName output_directory_;
    SR::FileName golden_manifest_path_;
    SR::FileName log_file_path_name_;
    SR::FileName config_file_path_name_;

    SR::FilingIDList filings_to_process_;

    std::shared_ptr<spdlog::logger> logger_;

    int max_filings_to_process_{-1}; // mainly for testing
    int duration_i_{-1};

    bool one_per_company_{false};
    bool save_per_filing_{false};
    bool persist_{false};

    static bool had_signal_;

}; // -----  end of class StatementReconApp  -----

#endif /* STATEMENTRECONAPP_H_ */
