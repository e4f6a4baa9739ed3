// =====================================================================================
//
//       Filename:  SEC_DataSet.cpp
//
//    Description:  loads an SEC Financial Statement Data Set directory
//                  (num.txt, pre.txt, tag.txt and sub.txt) into memory
//
//        Version:  1.0
//        Created:  09/15/2026 11:20:45 AM
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

#include "SEC_DataSet.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <set>

#include <boost/algorithm/string/case_conv.hpp>

#include <range/v3/action/stable_sort.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>

namespace rng = ranges;

#include <spdlog/spdlog.h>

#include "Recon_Utils.h"

namespace
{
    // the first line of every data set file names the columns.
    // we look them up by name so column order does not matter.

    class ColumnMap
    {
    public:
        ColumnMap(SR::sv header_line, const SR::FileName& file_name)
            : file_name_{file_name}
        {
            auto names = split_string<SR::sv>(header_line, '\t');
            for (size_t i = 0; i < names.size(); ++i)
            {
                columns_.emplace(std::string{names[i]}, i);
            }
        }

        [[nodiscard]] size_t Required(const std::string& column_name) const
        {
            auto found = columns_.find(column_name);
            if (found == columns_.end())
            {
                throw DataSetException(catenate("Missing required column: '", column_name, "' in file: ",
                                                file_name_.get()));
            }
            return found->second;
        }

        [[nodiscard]] std::optional<size_t> Optional(const std::string& column_name) const
        {
            auto found = columns_.find(column_name);
            if (found == columns_.end())
            {
                return std::nullopt;
            }
            return found->second;
        }

    private:
        std::map<std::string, size_t> columns_;
        SR::FileName file_name_;
    };

    SR::sv Field(const std::vector<SR::sv>& fields, std::optional<size_t> column)
    {
        if (! column || *column >= fields.size())
        {
            return {};
        }
        return fields[*column];
    }

    std::optional<int> ToInt(SR::sv text)
    {
        int result = 0;
        if (text.empty())
        {
            return std::nullopt;
        }
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
        if (ec != std::errc() || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return result;
    }

    std::optional<double> ToDouble(SR::sv text)
    {
        double result = 0.0;
        if (text.empty())
        {
            return std::nullopt;
        }
        // from_chars takes 'nan' and 'inf'. those are not amounts.

        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
        if (ec != std::errc() || ptr != text.data() + text.size() || ! std::isfinite(result))
        {
            return std::nullopt;
        }
        return result;
    }

    // split a whole file into lines, dropping any '\r' and empty lines.

    std::vector<SR::sv> SplitLines(SR::sv file_content)
    {
        auto lines = split_string<SR::sv>(file_content, '\n');
        for (auto& line : lines)
        {
            if (! line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
        }
        return lines | rng::views::filter([](SR::sv line) { return ! line.empty(); }) | rng::to<std::vector>();
    }
}		// namespace

namespace StatementRecon
{

/*
 *--------------------------------------------------------------------------------------
 *       Class:  SEC_DataSet
 *      Method:  SEC_DataSet
 * Description:  constructor. num.txt, pre.txt and tag.txt must be there.
 *               sub.txt is nice to have.
 *--------------------------------------------------------------------------------------
 */
SEC_DataSet::SEC_DataSet(const FileName& data_directory)
{
    if (! fs::is_directory(data_directory.get()))
    {
        throw DataSetException(catenate("Can't find data set directory: ", data_directory.get()));
    }
    LoadNumericFacts(FileName{data_directory.get() / "num.txt"});
    LoadPresentationRows(FileName{data_directory.get() / "pre.txt"});
    LoadTags(FileName{data_directory.get() / "tag.txt"});

    const FileName sub_file{data_directory.get() / "sub.txt"};
    if (fs::exists(sub_file.get()))
    {
        LoadSubmissions(sub_file);
    }
    else
    {
        spdlog::info(catenate("No sub.txt in: ", data_directory.get(), ". Filing list will come from num.txt."));
    }

    spdlog::info(catenate("Loaded data set: ", data_directory.get(), ". facts: ", load_stats_.num_rows_,
                          " (skipped: ", load_stats_.num_rows_skipped_, ") presentation rows: ", load_stats_.pre_rows_,
                          " (skipped: ", load_stats_.pre_rows_skipped_, ") tags: ", load_stats_.tag_rows_,
                          " submissions: ", load_stats_.sub_rows_));
} /* -----  end of method SEC_DataSet::SEC_DataSet  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  SEC_DataSet
 *      Method:  SEC_DataSet::LoadNumericFacts
 * Description:  values or dates which won't parse are kept as 'absent'.
 *--------------------------------------------------------------------------------------
 */
void SEC_DataSet::LoadNumericFacts(const FileName& file_name)
{
    const std::string file_content = LoadDataFileForUse(file_name);
    const auto lines = SplitLines(file_content);
    if (lines.empty())
    {
        throw DataSetException(catenate("Empty data set file: ", file_name.get()));
    }
    const ColumnMap columns{lines.front(), file_name};
    const auto adsh = columns.Required("adsh");
    const auto tag = columns.Required("tag");
    const auto version = columns.Required("version");
    const auto ddate = columns.Required("ddate");
    const auto qtrs = columns.Required("qtrs");
    const auto uom = columns.Required("uom");
    const auto value = columns.Required("value");
    const auto coreg = columns.Optional("coreg");
    const auto segments = columns.Optional("segments");

    for (size_t i = 1; i < lines.size(); ++i)
    {
        const auto fields = split_string<sv>(lines[i], '\t');

        NumericFact fact;
        fact.filing_ID = FilingID{std::string{Field(fields, adsh)}};
        fact.tag = Field(fields, tag);
        if (fact.filing_ID.get().empty() || fact.tag.empty())
        {
            ++load_stats_.num_rows_skipped_;
            continue;
        }
        fact.version = Field(fields, version);
        fact.end_date = StringToDateYMD("%Y%m%d", Field(fields, ddate));
        fact.duration = ToInt(Field(fields, qtrs));
        if (fact.duration && *fact.duration < 0)
        {
            fact.duration.reset();
        }
        fact.units = Field(fields, uom);
        fact.coreg = Field(fields, coreg);
        fact.segments = Field(fields, segments);
        fact.value = ToDouble(Field(fields, value));

        AddFact(std::move(fact));
        ++load_stats_.num_rows_;
    }
} // -----  end of method SEC_DataSet::LoadNumericFacts  -----

void SEC_DataSet::LoadPresentationRows(const FileName& file_name)
{
    const std::string file_content = LoadDataFileForUse(file_name);
    const auto lines = SplitLines(file_content);
    if (lines.empty())
    {
        throw DataSetException(catenate("Empty data set file: ", file_name.get()));
    }
    const ColumnMap columns{lines.front(), file_name};
    const auto adsh = columns.Required("adsh");
    const auto report = columns.Required("report");
    const auto line = columns.Required("line");
    const auto stmt = columns.Required("stmt");
    const auto inpth = columns.Required("inpth");
    const auto tag = columns.Required("tag");
    const auto version = columns.Required("version");
    const auto plabel = columns.Required("plabel");
    const auto negating = columns.Required("negating");
    const auto rfile = columns.Optional("rfile");

    for (size_t i = 1; i < lines.size(); ++i)
    {
        const auto fields = split_string<sv>(lines[i], '\t');

        const auto report_nbr = ToInt(Field(fields, report));
        const auto line_nbr = ToInt(Field(fields, line));

        PresentationRow row;
        row.filing_ID = FilingID{std::string{Field(fields, adsh)}};
        row.statement_code = Field(fields, stmt);
        row.tag = Field(fields, tag);
        if (row.filing_ID.get().empty() || row.tag.empty() || row.statement_code.empty() || ! report_nbr || ! line_nbr)
        {
            ++load_stats_.pre_rows_skipped_;
            continue;
        }
        row.report = *report_nbr;
        row.line = *line_nbr;
        row.depth = std::max(0, ToInt(Field(fields, inpth)).value_or(0));
        row.source_file = Field(fields, rfile);
        row.version = Field(fields, version);
        row.label = Field(fields, plabel);
        row.negating = Field(fields, negating) == "1";

        AddPresentationRow(std::move(row));
        ++load_stats_.pre_rows_;
    }
} // -----  end of method SEC_DataSet::LoadPresentationRows  -----

void SEC_DataSet::LoadTags(const FileName& file_name)
{
    const std::string file_content = LoadDataFileForUse(file_name);
    const auto lines = SplitLines(file_content);
    if (lines.empty())
    {
        throw DataSetException(catenate("Empty data set file: ", file_name.get()));
    }
    const ColumnMap columns{lines.front(), file_name};
    const auto tag = columns.Required("tag");
    const auto tlabel = columns.Required("tlabel");

    for (size_t i = 1; i < lines.size(); ++i)
    {
        const auto fields = split_string<sv>(lines[i], '\t');
        const auto tag_name = Field(fields, tag);
        const auto label = Field(fields, tlabel);
        if (tag_name.empty() || label.empty())
        {
            continue;
        }
        AddLabel(std::string{tag_name}, std::string{label});
        ++load_stats_.tag_rows_;
    }
} // -----  end of method SEC_DataSet::LoadTags  -----

void SEC_DataSet::LoadSubmissions(const FileName& file_name)
{
    const std::string file_content = LoadDataFileForUse(file_name);
    const auto lines = SplitLines(file_content);
    if (lines.empty())
    {
        return;
    }
    const ColumnMap columns{lines.front(), file_name};
    const auto adsh = columns.Required("adsh");
    const auto cik = columns.Optional("cik");
    const auto name = columns.Optional("name");
    const auto form = columns.Optional("form");
    const auto period = columns.Optional("period");
    const auto filed = columns.Optional("filed");

    for (size_t i = 1; i < lines.size(); ++i)
    {
        const auto fields = split_string<sv>(lines[i], '\t');

        SubmissionInfo submission;
        submission.filing_ID_ = FilingID{std::string{Field(fields, adsh)}};
        if (submission.filing_ID_.get().empty())
        {
            continue;
        }
        submission.CIK_ = Field(fields, cik);
        submission.company_name_ = Field(fields, name);
        submission.form_ = Field(fields, form);
        submission.period_ = StringToDateYMD("%Y%m%d", Field(fields, period));
        submission.filed_ = StringToDateYMD("%Y%m%d", Field(fields, filed));

        AddSubmission(std::move(submission));
        ++load_stats_.sub_rows_;
    }
} // -----  end of method SEC_DataSet::LoadSubmissions  -----

NumericFacts SEC_DataSet::FactsFor(const FilingID& filing_ID) const
{
    auto found = facts_.find(filing_ID);
    return found != facts_.end() ? found->second : NumericFacts{};
} // -----  end of method SEC_DataSet::FactsFor  -----

PresentationRows SEC_DataSet::StructureFor(const FilingID& filing_ID, sv statement_code) const
{
    auto filing = presentation_.find(filing_ID);
    if (filing == presentation_.end())
    {
        return {};
    }
    auto statement = filing->second.find(statement_code);
    return statement != filing->second.end() ? statement->second : PresentationRows{};
} // -----  end of method SEC_DataSet::StructureFor  -----

std::optional<std::string> SEC_DataSet::LabelFor(sv tag) const
{
    auto found = labels_.find(tag);
    if (found == labels_.end())
    {
        return std::nullopt;
    }
    return found->second;
} // -----  end of method SEC_DataSet::LabelFor  -----

std::optional<SubmissionInfo> SEC_DataSet::SubmissionFor(const FilingID& filing_ID) const
{
    auto found = rng::find(submissions_, filing_ID, &SubmissionInfo::filing_ID_);
    if (found == submissions_.end())
    {
        return std::nullopt;
    }
    return *found;
} // -----  end of method SEC_DataSet::SubmissionFor  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  SEC_DataSet
 *      Method:  SEC_DataSet::SelectFilings
 * Description:  without sub.txt there is nothing to filter or order by so we hand
 *               back the filings which have facts.
 *--------------------------------------------------------------------------------------
 */
FilingIDList SEC_DataSet::SelectFilings(const std::vector<std::string>& forms, int max_filings,
                                        bool one_per_company) const
{
    FilingIDList result;

    if (submissions_.empty())
    {
        if (! forms.empty())
        {
            spdlog::info("No submission data so form filter is not applied.");
        }
        for (const auto& [filing_ID, facts] : facts_)
        {
            if (max_filings >= 0 && static_cast<int>(result.size()) >= max_filings)
            {
                break;
            }
            result.push_back(filing_ID);
        }
        return result;
    }

    std::set<std::string> form_set;
    for (const auto& form : forms)
    {
        form_set.insert(boost::algorithm::to_upper_copy(form));
    }

    auto candidates = submissions_
        | rng::views::filter([&form_set](const SubmissionInfo& submission)
                             { return form_set.empty() || form_set.contains(boost::algorithm::to_upper_copy(submission.form_)); })
        | rng::to<std::vector>();

    candidates |= rng::actions::stable_sort([](const SubmissionInfo& lhs, const SubmissionInfo& rhs)
                                            {
                                                if (lhs.filed_ != rhs.filed_)
                                                {
                                                    return lhs.filed_ > rhs.filed_;
                                                }
                                                return lhs.filing_ID_ < rhs.filing_ID_;
                                            });

    std::set<std::string> companies_seen;
    for (const auto& submission : candidates)
    {
        if (max_filings >= 0 && static_cast<int>(result.size()) >= max_filings)
        {
            break;
        }
        if (one_per_company && ! companies_seen.insert(submission.CIK_).second)
        {
            continue;
        }
        result.push_back(submission.filing_ID_);
    }
    return result;
} // -----  end of method SEC_DataSet::SelectFilings  -----

void SEC_DataSet::AddFact(NumericFact fact)
{
    if (fact.value && ! std::isfinite(*fact.value))
    {
        fact.value.reset();
    }
    auto filing_ID = fact.filing_ID;
    facts_[filing_ID].push_back(std::move(fact));
} // -----  end of method SEC_DataSet::AddFact  -----

void SEC_DataSet::AddPresentationRow(PresentationRow row)
{
    auto& statements = presentation_[row.filing_ID];
    auto statement_code = row.statement_code;
    statements[statement_code].push_back(std::move(row));
} // -----  end of method SEC_DataSet::AddPresentationRow  -----

void SEC_DataSet::AddLabel(const std::string& tag, const std::string& label)
{
    // first one wins

    labels_.emplace(tag, label);
} // -----  end of method SEC_DataSet::AddLabel  -----

void SEC_DataSet::AddSubmission(SubmissionInfo submission)
{
    submissions_.push_back(std::move(submission));
} // -----  end of method SEC_DataSet::AddSubmission  -----

}		// namespace StatementRecon
