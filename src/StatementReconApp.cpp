// =====================================================================================
//
//       Filename:  StatementReconApp.cpp
//
//    Description:  command line driver for reconstructing and validating
//                  financial statements from an SEC data set
//
//        Version:  1.0
//        Created:  09/16/2026 01:42:51 PM
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

#include "StatementReconApp.h"

#include <csignal>
#include <exception>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <boost/algorithm/string/join.hpp>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/for_each.hpp>

#include <date/date.h>

#include <spdlog/sinks/basic_file_sink.h>

#include <pqxx/pqxx>

#include "ContextResolver.h"
#include "GoldenCheck.h"
#include "Recon_Utils.h"
#include "ReportJSON.h"
#include "StatementCodes.h"
#include "StatementViews.h"
#include "TableAssembler.h"
#include "Validator.h"

namespace rng = ranges;

using namespace std::string_literals;

bool StatementReconApp::had_signal_ = false;

namespace
{
    // one tab delimited line per row. absent values are left blank.

    void WriteTableRows(std::ostream& output, const SR::StatementTable& table)
    {
        const auto text = SR::StatementTableAsText(table);
        output << boost::algorithm::join(text.columns_, "\t") << '\n';
        for (const auto& row : text.rows_)
        {
            output << boost::algorithm::join(row, "\t") << '\n';
        }
    }
}		// namespace

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StatementReconApp
 *      Method:  StatementReconApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
StatementReconApp::StatementReconApp (int argc, char* argv[])
    : mArgc{argc}, mArgv{argv}
{
}  /* -----  end of method StatementReconApp::StatementReconApp  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  StatementReconApp
 *      Method:  StatementReconApp
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
StatementReconApp::StatementReconApp (const std::vector<std::string>& tokens)
    : tokens_{tokens}
{
}  /* -----  end of method StatementReconApp::StatementReconApp  (constructor)  ----- */

void StatementReconApp::ConfigureLogging()
{
    // we need to set log level if specified and also log file.

    if (! log_file_path_name_.get().empty())
    {
        // if we are running inside our test harness, logging may already by
        // running so we don't want to clobber it.
        // different tests may use different names.

        auto logger_name = log_file_path_name_.get().filename().string();
        logger_ = spdlog::get(logger_name);
        if (! logger_)
        {
            fs::path log_dir = log_file_path_name_.get().parent_path();
            if (! log_dir.empty() && ! fs::exists(log_dir))
            {
                fs::create_directories(log_dir);
            }

            logger_ = spdlog::basic_logger_mt(logger_name, log_file_path_name_.get().string());
            spdlog::set_default_logger(logger_);
        }
    }

    // we are running before 'CheckArgs' so we need to do a little editiing ourselves.

    const std::map<std::string, spdlog::level::level_enum> levels
    {
        {"none", spdlog::level::off},
        {"error", spdlog::level::err},
        {"information", spdlog::level::info},
        {"debug", spdlog::level::debug}
    };

    auto which_level = levels.find(logging_level_);
    if (which_level != levels.end())
    {
        spdlog::set_level(which_level->second);
    }
}		/* -----  end of method StatementReconApp::ConfigureLogging  ----- */

bool StatementReconApp::Startup()
{
    spdlog::info(catenate("\n\n*** Begin run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
    bool result{true};
	try
	{
		SetupProgramOptions();
        if (tokens_.empty())
        {
            ParseProgramOptions();
        }
        else
        {
            ParseProgramOptions(tokens_);
        }
        ParseConfigFile();
        ConfigureLogging();
		result = CheckArgs ();
	}
	catch(std::exception& e)
	{
        spdlog::error(catenate("Problem in startup: ", e.what(), '\n'));
		//	we're outta here!

		this->Shutdown();
        result = false;
    }
    return result;
}		/* -----  end of method StatementReconApp::Startup  ----- */

void StatementReconApp::SetupProgramOptions ()
{
    mNewOptions = std::make_unique<po::options_description>();

	mNewOptions->add_options()
		("help,h", "produce help message")
		("data-dir", po::value<SR::FileName>(&data_directory_)->required(),
         "directory containing the data set files: num.txt, pre.txt, tag.txt and sub.txt.")
		("mode,m", po::value<std::string>(&mode_)->default_value("reconstruct"),
         "Must be 'reconstruct|coverage|validate|batch|statements|golden'. Default is 'reconstruct'.")
		("filing,f", po::value<std::string>(&filings_),
         "accession number (adsh) of filing[s] to process. May be comma-delimited list.")
		("filing-list", po::value<SR::FileName>(&list_of_filings_path_),
         "path to file with list of accession numbers to process. One per line.")
		("form", po::value<std::string>(&form_)->default_value("10-Q,10-K"),
         "form type[s] to select from sub.txt when no filings are named. May be comma-delimited list. Default is '10-Q,10-K'.")
		("max-filings", po::value<int>(&max_filings_to_process_)->default_value(-1),
         "Maximun number of filings to process. Default of -1 means no limit.")
		("unique-cik", po::value<bool>(&one_per_company_)->default_value(false)->implicit_value(true),
         "only use the newest filing for each company. Default is 'false'")
		("statements", po::value<std::string>(&statements_)->default_value("BS,IS,CF,EQ,CI"),
         "statement code[s] to process. May be comma-delimited list. Default is 'BS,IS,CF,EQ,CI'.")
		("end-date", po::value<std::string>(&end_date_i_),
         "use this period end date (YYYYMMDD) instead of the resolved one.")
		("duration", po::value<int>(&duration_i_)->default_value(-1),
         "use this duration in quarters instead of the resolved one. 0 means instant.")
		("golden-manifest", po::value<SR::FileName>(&golden_manifest_path_),
         "json manifest of filings, statements and approved tables to compare against. Required for 'golden' mode.")
		("output-dir", po::value<SR::FileName>(&output_directory_), "directory to write tables and reports to.")
		("save-per-filing", po::value<bool>(&save_per_filing_)->default_value(false)->implicit_value(true),
         "in batch mode, also write a report for each filing. Default is 'false'")
		("persist", po::value<bool>(&persist_)->default_value(false)->implicit_value(true),
         "save tables and reports to the database. Default is 'false'")
		("DB-mode", po::value<std::string>(&DB_mode_)->default_value("test"),
         "Must be either 'test' or 'live'. Default is 'test'.")
		("db-connection", po::value<std::string>(&DB_connection_)->default_value("dbname=sec_extracts user=extractor_pg"),
         "libpq connection string.")
		("log-level,l", po::value<std::string>(&logging_level_)->default_value("information"),
         "logging level. Must be 'none|error|information|debug'. Default is 'information'.")
		("log-path", po::value<SR::FileName>(&log_file_path_name_),	"path name for log file.")
		("config-file", po::value<SR::FileName>(&config_file_path_name_),
         "file of 'name = value' lines using the option names above. Command line values win.")
		;
}		/* -----  end of method StatementReconApp::SetupProgramOptions  ----- */

void StatementReconApp::ParseProgramOptions ()
{
	auto options = po::parse_command_line(mArgc, mArgv, *mNewOptions);
	po::store(options, mVariableMap);
	if (this->mArgc == 1 ||	mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
}		/* -----  end of method StatementReconApp::ParseProgramOptions  ----- */

void StatementReconApp::ParseProgramOptions (const std::vector<std::string>& tokens)
{
	auto options = po::command_line_parser(tokens).options(*mNewOptions).run();
	po::store(options, mVariableMap);
	if (mVariableMap.count("help") == 1)
	{
		std::cout << *mNewOptions << "\n";
		throw std::runtime_error("\nExiting after 'help'.");
	}
}		/* -----  end of method StatementReconApp::ParseProgramOptions  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  ParseConfigFile
//  Description:  values already stored from the command line are not replaced.
//                'notify' is delayed until here so required options can come from
//                either place.
// =====================================================================================

void StatementReconApp::ParseConfigFile ()
{
    if (mVariableMap.count("config-file") == 1)
    {
        auto config_file_name = mVariableMap["config-file"].as<SR::FileName>();
        BOOST_ASSERT_MSG(fs::exists(config_file_name.get()),
                catenate("Can't find config file: ", config_file_name.get()).c_str());

        std::ifstream config_file{config_file_name.get()};
        if (! config_file)
        {
            throw ReconException(catenate("Unable to open config file: ", config_file_name.get()));
        }
        po::store(po::parse_config_file(config_file, *mNewOptions), mVariableMap);
    }
	po::notify(mVariableMap);
}		/* -----  end of method StatementReconApp::ParseConfigFile  ----- */

bool StatementReconApp::CheckArgs ()
{
    const std::map<std::string, RunMode> modes
    {
        {"reconstruct", RunMode::e_Reconstruct},
        {"coverage", RunMode::e_Coverage},
        {"validate", RunMode::e_Validate},
        {"batch", RunMode::e_Batch},
        {"statements", RunMode::e_Statements},
        {"golden", RunMode::e_Golden}
    };
    auto which_mode = modes.find(mode_);
    BOOST_ASSERT_MSG(which_mode != modes.end(),
            "Mode must be: 'reconstruct', 'coverage', 'validate', 'batch', 'statements' or 'golden'.");
    run_mode_ = which_mode->second;

    BOOST_ASSERT_MSG(DB_mode_ == "test" || DB_mode_ == "live", "DB-mode must be: 'test' or 'live'.");

    BOOST_ASSERT_MSG(fs::exists(data_directory_.get()), catenate("Can't find data set directory: ",
                data_directory_.get()).c_str());
    BOOST_ASSERT_MSG(fs::is_directory(data_directory_.get()),
            catenate("Path: ", data_directory_.get(), " is not a directory.").c_str());

    //  the user may specify multiple statements in a comma delimited list.

    statement_codes_ = SplitCommaList(statements_);
    BOOST_ASSERT_MSG(! statement_codes_.empty(), "Must specify at least 1 statement code.");
    rng::for_each(statement_codes_, [](const auto& code) { SR::CheckStatementCode(code); });

    form_list_ = SplitCommaList(form_);

    if (! end_date_i_.empty())
    {
        end_date_ = StringToDateYMD("%Y%m%d", end_date_i_);
        BOOST_ASSERT_MSG(end_date_.has_value(), catenate("Unable to parse end date: ", end_date_i_).c_str());
    }

    if (duration_i_ >= 0)
    {
        duration_ = duration_i_;
    }

    auto list_of_filings_path_val = list_of_filings_path_.get();
    if (! list_of_filings_path_val.empty())
    {
        BOOST_ASSERT_MSG(fs::exists(list_of_filings_path_val),
                catenate("Can't find file: ", list_of_filings_path_val).c_str());
        BOOST_ASSERT_MSG(fs::is_regular_file(list_of_filings_path_val),
                catenate("Path: ", list_of_filings_path_val, " is not a regular file.").c_str());
    }

    if (run_mode_ == RunMode::e_Batch)
    {
        BOOST_ASSERT_MSG(! output_directory_.get().empty(), "Must specify output directory for 'batch' mode.");
    }

    if (run_mode_ == RunMode::e_Golden)
    {
        BOOST_ASSERT_MSG(! golden_manifest_path_.get().empty(), "Must specify golden manifest for 'golden' mode.");
        BOOST_ASSERT_MSG(fs::exists(golden_manifest_path_.get()),
                catenate("Can't find golden manifest: ", golden_manifest_path_.get()).c_str());
    }

    if (save_per_filing_)
    {
        BOOST_ASSERT_MSG(run_mode_ == RunMode::e_Batch, "'save-per-filing' only applies to 'batch' mode.");
    }

    if (! output_directory_.get().empty() && ! fs::exists(output_directory_.get()))
    {
        fs::create_directories(output_directory_.get());
    }

    if (persist_)
    {
        sink_.emplace(DB_connection_, SR::PostgresSink::SchemaForMode(DB_mode_));
    }

    return true;
}       // -----  end of method StatementReconApp::CheckArgs  -----

void StatementReconApp::LoadDataSet()
{
    data_set_ = SR::SEC_DataSet{data_directory_};

    const auto& stats = data_set_.GetLoadStats();
    spdlog::info(catenate("Loaded data set from: ", data_directory_.get(), ". Facts: ", stats.num_rows_,
            " (skipped: ", stats.num_rows_skipped_, "). Presentation rows: ", stats.pre_rows_,
            " (skipped: ", stats.pre_rows_skipped_, "). Tags: ", stats.tag_rows_, ". Submissions: ", stats.sub_rows_, '.'));
}		/* -----  end of method StatementReconApp::LoadDataSet  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  BuildListOfFilingsToProcess
//  Description:  named filings come first, then the list file. if neither is given
//                we pick from the submissions using the form filter.
// =====================================================================================

void StatementReconApp::BuildListOfFilingsToProcess()
{
    filings_to_process_.clear();      //  in case of reprocessing.

    for (const auto& filing : SplitCommaList(filings_))
    {
        filings_to_process_.emplace_back(filing);
    }

    if (! list_of_filings_path_.get().empty())
    {
        const auto file_list_data = LoadDataFileForUse(list_of_filings_path_);
        for (const auto& filing : split_string<std::string>(file_list_data, '\n'))
        {
            auto trimmed = SplitCommaList(filing);
            if (! trimmed.empty())
            {
                filings_to_process_.emplace_back(trimmed.front());
            }
        }
    }

    if (filings_to_process_.empty())
    {
        filings_to_process_ = data_set_.SelectFilings(form_list_, max_filings_to_process_, one_per_company_);
    }
    else if (max_filings_to_process_ >= 0 && filings_to_process_.size() > static_cast<size_t>(max_filings_to_process_))
    {
        filings_to_process_.resize(max_filings_to_process_);
    }

    spdlog::info(catenate("Found: ", filings_to_process_.size(), " filings to process."));
}		/* -----  end of method StatementReconApp::BuildListOfFilingsToProcess  ----- */

std::tuple<int, int, int> StatementReconApp::Run()
{
    struct sigaction sa_old{};
    struct sigaction sa_new{};

    sa_new.sa_handler = StatementReconApp::HandleSignal;
    sigemptyset(&sa_new.sa_mask);
    sa_new.sa_flags = 0;
    sigaction(SIGINT, &sa_new, &sa_old);

    StatementReconApp::had_signal_= false;

    LoadDataSet();

    // the manifest names what 'golden' mode checks.

    if (run_mode_ != RunMode::e_Golden)
    {
        BuildListOfFilingsToProcess();
    }

    std::tuple<int, int, int> counters{0, 0, 0};

    switch (run_mode_)
    {
        case RunMode::e_Reconstruct:
            counters = ReconstructFilings();
            break;

        case RunMode::e_Coverage:
            counters = ReportCoverage();
            break;

        case RunMode::e_Validate:
            counters = ValidateFilings();
            break;

        case RunMode::e_Batch:
            counters = ValidateBatchOfFilings();
            break;

        case RunMode::e_Statements:
            counters = BuildStatementViews();
            break;

        case RunMode::e_Golden:
            counters = CheckAgainstGolden();
            break;
    }

    sigaction(SIGINT, &sa_old, nullptr);

    auto [success_counter, skipped_counter, error_counter] = counters;

    spdlog::info(catenate("Processed: ", SumT(counters), " filings. Successes: ",
            success_counter, ". Skips: ", skipped_counter , ". Errors: ", error_counter, "."));

    return counters;
}		/* -----  end of method StatementReconApp::Run  ----- */

std::tuple<int, int, int> StatementReconApp::ReconstructFilings()
{
    std::tuple<int, int, int> counters{0, 0, 0};

    for (const auto& filing_ID : filings_to_process_)
    {
        if (StatementReconApp::SignalReceived())
        {
            spdlog::info("Signal received. Stopping.");
            break;
        }
        counters = AddTs(counters, ReconstructSingleFiling(filing_ID));
    }
    return counters;
}		/* -----  end of method StatementReconApp::ReconstructFilings  ----- */

std::tuple<int, int, int> StatementReconApp::ReconstructSingleFiling(const SR::FilingID& filing_ID)
{
    SR::ReconContext context{data_set_, data_set_, &data_set_};

    try
    {
        SR::FilingTables tables;
        for (const auto& code : statement_codes_)
        {
            auto table = SR::ReconstructStatement(context, filing_ID, code, end_date_, duration_);
            if (table.empty())
            {
                spdlog::info(catenate("Filing: ", filing_ID.get(), " has no data for statement: ", code, '.'));
            }
            ExportStatementTable(filing_ID, code, table);
            tables[code] = std::move(table);
        }

        auto have_data = rng::any_of(tables, [](const auto& entry) { return ! entry.second.empty(); });
        if (! have_data)
        {
            spdlog::info(catenate("Filing: ", filing_ID.get(), ". No statements to reconstruct. Skipped."));
            return {0, 1, 0};
        }

        if (sink_)
        {
            auto rows_saved = sink_->WriteStatementTables(filing_ID, tables);
            spdlog::info(catenate("Filing: ", filing_ID.get(), ". Saved: ", rows_saved, " rows."));
        }

        spdlog::info(catenate("Reconstructed filing: ", filing_ID.get(), " period: ", PeriodLabelFor(filing_ID)));
        return {1, 0, 0};
    }
    catch(const pqxx::sql_error& e)
    {
        spdlog::error(catenate("Database error: ", e.what()));
        spdlog::error(catenate("Query was: ", e.query()));
    }
    catch(const AssertionException& e)
    {
        spdlog::error(catenate("Problem processing filing: ", filing_ID.get(), ". ", e.what()));
    }
    catch(const ReconException& e)
    {
        spdlog::error(catenate("Problem processing filing: ", filing_ID.get(), ". ", e.what()));
    }
    return {0, 0, 1};
}		/* -----  end of method StatementReconApp::ReconstructSingleFiling  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  ExportStatementTable
//  Description:  to stdout unless we have an output directory.
// =====================================================================================

void StatementReconApp::ExportStatementTable(const SR::FilingID& filing_ID, const std::string& statement_code,
        const SR::StatementTable& table) const
{
    if (output_directory_.get().empty())
    {
        std::cout << fmt::format("# {} {}\n", filing_ID.get(), statement_code);
        WriteTableRows(std::cout, table);
        return;
    }

    auto output_file_name = output_directory_.get() / fmt::format("{}_{}.tsv", filing_ID.get(), statement_code);
    std::ofstream output{output_file_name, std::ios::out | std::ios::trunc};
    if (! output)
    {
        throw ReconException(catenate("Unable to open file for output: ", output_file_name));
    }
    WriteTableRows(output, table);
    output.close();
    if (! output)
    {
        throw ReconException(catenate("Unable to write file: ", output_file_name));
    }
}		/* -----  end of method StatementReconApp::ExportStatementTable  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  PeriodLabelFor
//  Description:  the submission's fiscal period year is used when the facts don't
//                tell us.
// =====================================================================================

std::string StatementReconApp::PeriodLabelFor(const SR::FilingID& filing_ID) const
{
    int fallback_year = static_cast<int>(date::year_month_day{
        date::floor<date::days>(std::chrono::system_clock::now())}.year());

    auto submission = data_set_.SubmissionFor(filing_ID);
    if (submission && submission->period_)
    {
        fallback_year = static_cast<int>(submission->period_->year());
    }
    return SR::DerivePeriodLabel(SR::ResolveFilingPeriod(data_set_.FactsFor(filing_ID)), fallback_year);
}		/* -----  end of method StatementReconApp::PeriodLabelFor  ----- */

std::tuple<int, int, int> StatementReconApp::ReportCoverage()
{
    SR::ReconContext context{data_set_, data_set_, &data_set_};

    std::ofstream coverage_file;
    if (! output_directory_.get().empty())
    {
        auto output_file_name = output_directory_.get() / "coverage.tsv";
        coverage_file.open(output_file_name, std::ios::out | std::ios::trunc);
        if (! coverage_file)
        {
            throw ReconException(catenate("Unable to open file for output: ", output_file_name));
        }
    }
    std::ostream& output = coverage_file.is_open() ? coverage_file : std::cout;
    output << "adsh\tstmt\trows_total\trows_with_values\trows_missing_values\tcoverage_ratio\n";

    std::tuple<int, int, int> counters{0, 0, 0};

    for (const auto& filing_ID : filings_to_process_)
    {
        if (StatementReconApp::SignalReceived())
        {
            spdlog::info("Signal received. Stopping.");
            break;
        }
        try
        {
            for (const auto& code : statement_codes_)
            {
                auto coverage = SR::StatementCoverage(context, filing_ID, code);
                output << fmt::format("{}\t{}\t{}\t{}\t{}\t{:.4f}\n", filing_ID.get(), coverage.statement_code_,
                        coverage.rows_total_, coverage.rows_with_values_, coverage.rows_missing_values_,
                        coverage.coverage_ratio_);
            }
            counters = AddTs(counters, {1, 0, 0});
        }
        catch(const AssertionException& e)
        {
            spdlog::error(catenate("Problem processing filing: ", filing_ID.get(), ". ", e.what()));
            counters = AddTs(counters, {0, 0, 1});
        }
    }
    return counters;
}		/* -----  end of method StatementReconApp::ReportCoverage  ----- */

std::tuple<int, int, int> StatementReconApp::ValidateFilings()
{
    std::tuple<int, int, int> counters{0, 0, 0};

    for (const auto& filing_ID : filings_to_process_)
    {
        if (StatementReconApp::SignalReceived())
        {
            spdlog::info("Signal received. Stopping.");
            break;
        }
        counters = AddTs(counters, ValidateSingleFiling(filing_ID));
    }
    return counters;
}		/* -----  end of method StatementReconApp::ValidateFilings  ----- */

std::tuple<int, int, int> StatementReconApp::ValidateSingleFiling(const SR::FilingID& filing_ID)
{
    SR::ReconContext context{data_set_, data_set_, &data_set_};

    try
    {
        auto validation = SR::ValidateFiling(context, filing_ID, statement_codes_);
        nlohmann::json report = validation;

        if (output_directory_.get().empty())
        {
            std::cout << report.dump(2) << '\n';
        }
        else
        {
            SR::WriteJSONFile(SR::FileName{output_directory_.get() / (filing_ID.get() + ".json")}, report);
        }

        if (sink_)
        {
            sink_->WriteValidationReport(validation);
        }

        spdlog::info(catenate("Validated filing: ", filing_ID.get(), ". Status: ", SR::ToString(validation.summary_.status_),
                ". Coverage: ", fmt::format("{:.4f}", validation.summary_.overall_coverage_ratio_)));
        return {1, 0, 0};
    }
    catch(const pqxx::sql_error& e)
    {
        spdlog::error(catenate("Database error: ", e.what()));
        spdlog::error(catenate("Query was: ", e.query()));
    }
    catch(const AssertionException& e)
    {
        spdlog::error(catenate("Problem processing filing: ", filing_ID.get(), ". ", e.what()));
    }
    catch(const ReconException& e)
    {
        spdlog::error(catenate("Problem processing filing: ", filing_ID.get(), ". ", e.what()));
    }
    return {0, 0, 1};
}		/* -----  end of method StatementReconApp::ValidateSingleFiling  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  ValidateBatchOfFilings
//  Description:  the whole batch is validated at once so a bad argument fails the
//                whole batch.
// =====================================================================================

std::tuple<int, int, int> StatementReconApp::ValidateBatchOfFilings()
{
    SR::ReconContext context{data_set_, data_set_, &data_set_};

    try
    {
        auto batch = SR::ValidateBatch(context, filings_to_process_, statement_codes_);
        auto scoreboard = SR::SummarizeBatch(batch);

        SR::WriteJSONFile(SR::FileName{output_directory_.get() / "batch_report.json"}, batch);
        SR::WriteJSONFile(SR::FileName{output_directory_.get() / "summary_scoreboard.json"}, scoreboard);

        if (save_per_filing_)
        {
            auto filings_directory = output_directory_.get() / "filings";
            fs::create_directories(filings_directory);
            for (const auto& [filing, validation] : batch.results_)
            {
                SR::WriteJSONFile(SR::FileName{filings_directory / (filing + ".json")}, validation);
            }
        }

        if (sink_)
        {
            for (const auto& [filing, validation] : batch.results_)
            {
                sink_->WriteValidationReport(validation);
            }
        }

        spdlog::info(catenate("Batch of: ", batch.count_, " filings. pass: ", batch.status_counts_["pass"],
                " warn: ", batch.status_counts_["warn"], " fail: ", batch.status_counts_["fail"],
                ". Average coverage: ", fmt::format("{:.4f}", scoreboard.avg_statement_coverage_ratio_)));

        return {batch.count_, 0, 0};
    }
    catch(const pqxx::sql_error& e)
    {
        spdlog::error(catenate("Database error: ", e.what()));
        spdlog::error(catenate("Query was: ", e.query()));
    }
    catch(const AssertionException& e)
    {
        spdlog::error(catenate("Problem processing batch: ", e.what()));
    }
    catch(const ReconException& e)
    {
        spdlog::error(catenate("Problem processing batch: ", e.what()));
    }
    return {0, 0, static_cast<int>(filings_to_process_.size())};
}		/* -----  end of method StatementReconApp::ValidateBatchOfFilings  ----- */

std::tuple<int, int, int> StatementReconApp::BuildStatementViews()
{
    std::tuple<int, int, int> counters{0, 0, 0};

    for (const auto& filing_ID : filings_to_process_)
    {
        if (StatementReconApp::SignalReceived())
        {
            spdlog::info("Signal received. Stopping.");
            break;
        }
        counters = AddTs(counters, BuildSingleStatementView(filing_ID));
    }
    return counters;
}		/* -----  end of method StatementReconApp::BuildStatementViews  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  BuildSingleStatementView
//  Description:  company info and filing date come from the submission. a filing
//                with no submission row still gets a view, dated today.
// =====================================================================================

std::tuple<int, int, int> StatementReconApp::BuildSingleStatementView(const SR::FilingID& filing_ID)
{
    SR::ReconContext context{data_set_, data_set_, &data_set_};

    try
    {
        SR::CompanyInfo company;
        auto filing_date = date::year_month_day{date::floor<date::days>(std::chrono::system_clock::now())};

        auto submission = data_set_.SubmissionFor(filing_ID);
        if (submission)
        {
            company = SR::CompanyInfo{submission->CIK_, submission->company_name_};
            if (submission->filed_)
            {
                filing_date = *submission->filed_;
            }
        }

        auto view = SR::BuildFinancialStatementView(context, filing_ID, company, filing_date);
        if (! view)
        {
            spdlog::info(catenate("Filing: ", filing_ID.get(), ". No balance sheet, income or cash flow statement. Skipped."));
            return {0, 1, 0};
        }

        nlohmann::json report = *view;
        if (output_directory_.get().empty())
        {
            std::cout << report.dump(2) << '\n';
        }
        else
        {
            SR::WriteJSONFile(SR::FileName{output_directory_.get() / (filing_ID.get() + "_statements.json")}, report);
        }

        spdlog::info(catenate("Built statement views for filing: ", filing_ID.get(), " period: ", view->period_));
        return {1, 0, 0};
    }
    catch(const AssertionException& e)
    {
        spdlog::error(catenate("Problem processing filing: ", filing_ID.get(), ". ", e.what()));
    }
    catch(const ReconException& e)
    {
        spdlog::error(catenate("Problem processing filing: ", filing_ID.get(), ". ", e.what()));
    }
    return {0, 0, 1};
}		/* -----  end of method StatementReconApp::BuildSingleStatementView  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  CheckAgainstGolden
//  Description:  counts are passed, skipped (always 0) and failed cases.
//                a case that throws counts as failed. a manifest we can't use
//                counts as 1 failure.
// =====================================================================================

std::tuple<int, int, int> StatementReconApp::CheckAgainstGolden()
{
    SR::ReconContext context{data_set_, data_set_, &data_set_};

    std::vector<SR::GoldenCase> cases;
    try
    {
        cases = SR::LoadGoldenManifest(golden_manifest_path_);
    }
    catch(const AssertionException& e)
    {
        spdlog::error(catenate("Problem with golden manifest: ", e.what()));
        return {0, 0, 1};
    }
    catch(const ReconException& e)
    {
        spdlog::error(catenate("Problem with golden manifest: ", e.what()));
        return {0, 0, 1};
    }

    std::vector<SR::GoldenResult> results;
    for (const auto& golden_case : cases)
    {
        if (StatementReconApp::SignalReceived())
        {
            spdlog::info("Signal received. Stopping.");
            break;
        }
        try
        {
            results.push_back(SR::CheckGoldenCase(context, golden_case));
        }
        catch(const AssertionException& e)
        {
            results.push_back(SR::GoldenResult{golden_case.filing_ID_, golden_case.statement_code_, false, e.what()});
        }
        catch(const ReconException& e)
        {
            results.push_back(SR::GoldenResult{golden_case.filing_ID_, golden_case.statement_code_, false, e.what()});
        }
    }

    std::tuple<int, int, int> counters{0, 0, 0};
    nlohmann::json report = nlohmann::json::array();
    for (const auto& result : results)
    {
        if (result.passed_)
        {
            counters = AddTs(counters, {1, 0, 0});
        }
        else
        {
            spdlog::error(catenate("Golden mismatch: ", result.filing_ID_.get(), ' ', result.statement_code_, ": ",
                    result.message_));
            counters = AddTs(counters, {0, 0, 1});
        }
        report.push_back(nlohmann::json{{"adsh", result.filing_ID_.get()}, {"stmt", result.statement_code_},
                {"passed", result.passed_}, {"message", result.message_}});
    }

    if (! output_directory_.get().empty())
    {
        SR::WriteJSONFile(SR::FileName{output_directory_.get() / "golden_report.json"}, report);
    }

    spdlog::info(catenate("Golden cases: ", results.size(), ". Passed: ", std::get<0>(counters), ". Failed: ",
            std::get<2>(counters), "."));
    return counters;
}		/* -----  end of method StatementReconApp::CheckAgainstGolden  ----- */

void StatementReconApp::HandleSignal(int signal)

{
    std::signal(SIGINT, StatementReconApp::HandleSignal);

    // only thing we need to do

    StatementReconApp::had_signal_ = true;

}		/* -----  end of method StatementReconApp::HandleSignal  ----- */

void StatementReconApp::Shutdown ()
{
    spdlog::info(catenate("\n\n*** End run ", LocalDateTimeAsString(std::chrono::system_clock::now()), " ***\n"));
}       // -----  end of method StatementReconApp::Shutdown  -----
