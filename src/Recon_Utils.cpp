/*
 * =====================================================================================
 *
 *       Filename:  Recon_Utils.cpp
 *
 *    Description:  Routines shared by the loader, reconstruction and validation code.
 *
 *        Version:  1.0
 *        Created:  09/14/2026 10:52:08 AM
 *       Revision:  none
 *       Compiler:  gcc
 *
 *         Author:  David P. Riedel (), driedel@cox.net
 *   Organization:
 *
 * =====================================================================================
 */

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

#include "Recon_Utils.h"

#include <fstream>
#include <sstream>

#include <boost/algorithm/string/trim.hpp>

#include <range/v3/algorithm/remove_if.hpp>

namespace rng = ranges;

// ===  FUNCTION  ======================================================================
//         Name:  StringToDateYMD
//  Description:  the data sets are full of dates which may or may not be usable.
//                a bad one is not our problem to fix so just hand back nothing.
// =====================================================================================

std::optional<date::year_month_day> StringToDateYMD(const std::string& input_format, SR::sv the_date)
{
    if (the_date.empty())
    {
        return std::nullopt;
    }
    std::istringstream in{std::string{the_date}};
    date::sys_days tp;
    date::from_stream(in, input_format.data(), tp);
    if (in.fail() || in.bad())
    {
        return std::nullopt;
    }
    date::year_month_day result = tp;
    if (! result.ok())
    {
        return std::nullopt;
    }
    return result;
} // -----  end of function StringToDateYMD  -----

// ===  FUNCTION  ======================================================================
//         Name:  FormatDataSetDate
// =====================================================================================

std::string FormatDataSetDate(const date::year_month_day& the_date)
{
    return date::format("%Y%m%d", the_date);
} // -----  end of function FormatDataSetDate  -----

/*
 *--------------------------------------------------------------------------------------
 *       Class:  ReconException
 *      Method:  ReconException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
ReconException::ReconException(const char* text)
    : std::runtime_error(text)
{
} /* -----  end of method ReconException::ReconException  (constructor)  ----- */

ReconException::ReconException(const std::string& text)
    : std::runtime_error(text)
{
} /* -----  end of method ReconException::ReconException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  AssertionException
 *      Method:  AssertionException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
AssertionException::AssertionException(const char* text)
    : std::invalid_argument(text)
{
} /* -----  end of method AssertionException::AssertionException  (constructor)  ----- */

AssertionException::AssertionException(const std::string& text)
    : std::invalid_argument(text)
{
} /* -----  end of method AssertionException::AssertionException  (constructor)  ----- */

/*
 *--------------------------------------------------------------------------------------
 *       Class:  DataSetException
 *      Method:  DataSetException
 * Description:  constructor
 *--------------------------------------------------------------------------------------
 */
DataSetException::DataSetException(const char* text)
    : ReconException(text)
{
} /* -----  end of method DataSetException::DataSetException  (constructor)  ----- */

DataSetException::DataSetException(const std::string& text)
    : ReconException(text)
{
} /* -----  end of method DataSetException::DataSetException  (constructor)  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  LoadDataFileForUse
//  Description:
// =====================================================================================

std::string LoadDataFileForUse(const SR::FileName& file_name)
{
    if (! fs::exists(file_name.get()))
    {
        throw ReconException(catenate("Can't find file: ", file_name.get()));
    }
    std::string file_content(fs::file_size(file_name.get()), '\0');
    std::ifstream input_file{file_name.get(), std::ios_base::in | std::ios_base::binary};
    if (! input_file)
    {
        throw ReconException(catenate("Unable to open file: ", file_name.get()));
    }
    input_file.read(&file_content[0], file_content.size());
    input_file.close();

    return file_content;
} /* -----  end of function LoadDataFileForUse  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  SplitCommaList
//  Description:
// =====================================================================================

std::vector<std::string> SplitCommaList(const std::string& list_data)
{
    auto items = split_string<std::string>(list_data, ',');
    for (auto& item : items)
    {
        boost::algorithm::trim(item);
    }
    items.erase(rng::remove_if(items, [](const auto& item) { return item.empty(); }), items.end());
    return items;
} // -----  end of function SplitCommaList  -----

namespace boost
{
// these functions are declared in the library headers but left to the user to
// define. so here they are...
//
// ===  FUNCTION  ======================================================================
//         Name:  assertion_failed_msg
//  Description:  defined in boost header but left to us to implement.
// =====================================================================================

void assertion_failed_msg(char const* expr, char const* msg, char const* function, char const* file, long line)
{
    throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr, " in function: ", function,
                                      " from file: ", file, " at line: ", line, ".\nassertion msg: ", msg));
} /* -----  end of function assertion_failed_msg  ----- */

// ===  FUNCTION  ======================================================================
//         Name:  assertion_failed
//  Description:
// =====================================================================================

void assertion_failed(char const* expr, char const* function, char const* file, long line)
{
    throw AssertionException(catenate("\n*** Assertion failed *** test: ", expr, " in function: ", function,
                                      " from file: ", file, " at line: ", line));
} /* -----  end of function assertion_failed  ----- */
} /* end namespace boost */
