/*
 * =====================================================================================
 *
 *       Filename:  Recon_Utils.h
 *
 *    Description:  Routines shared by the loader, reconstruction and validation code.
 *
 *        Version:  1.0
 *        Created:  09/14/2026 10:41:17 AM
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

#ifndef _RECON_UTILS_INC_
#define _RECON_UTILS_INC_

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/assert.hpp>

#include <date/date.h>
#include <date/tz.h>

#include <fmt/format.h>

#include "StatementRecon.h"

namespace fs = std::filesystem;

using namespace std::string_literals;

// custom fmtlib formatter for filesytem paths

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string>
{
    // parse is inherited from formatter<string_view>.
    template <typename FormatContext>
    auto format(const std::filesystem::path& p, FormatContext& ctx) const
    {
        std::string f_name = p.string();
        return formatter<std::string>::format(f_name, ctx);
    }
};

// custom fmtlib formatter for date year_month_day

template <>
struct fmt::formatter<date::year_month_day> : formatter<std::string>
{
    // parse is inherited from formatter<string_view>.
    template <typename FormatContext>
    auto format(date::year_month_day d, FormatContext& ctx) const
    {
        std::string s_date = date::format("%Y-%m-%d", d);
        return formatter<std::string>::format(s_date, ctx);
    }
};

template <typename... Ts>
inline std::string catenate(Ts&&... ts)
{
    constexpr auto N = sizeof...(Ts);

    // first, construct our format string

    std::string f_string;
    for (int i = 0; i < N; ++i)
    {
        f_string.append("{}");
    }

    return fmt::vformat(f_string, fmt::make_format_args(ts...));
}

// let's add tuples...
// based on code techniques from C++17 STL Cookbook zipping tuples.
// (works for any class which supports the '+' operator)

template <typename... Ts>
std::tuple<Ts...> AddTs(std::tuple<Ts...> const& t1, std::tuple<Ts...> const& t2)
{
    auto z_([](auto... xs) { return [xs...](auto... ys) { return std::make_tuple((xs + ys)...); }; });

    return std::apply(std::apply(z_, t1), t2);
}

// let's sum the contents of a single tuple
// (from C++ Templates...second edition p.58
// and C++17 STL Cookbook.

template <typename... Ts>
auto SumT(const std::tuple<Ts...>& t)
{
    auto z_([](auto... ys) { return (... + ys); });
    return std::apply(z_, t);
}

// utility to convert a time point to a string
// using Howard Hinnant's date library

inline std::string LocalDateTimeAsString(std::chrono::system_clock::time_point a_date_time)
{
    auto t = date::make_zoned(date::current_zone(), a_date_time);
    std::string ts = date::format("%a, %b %d, %Y at %I:%M:%S %p %Z", t);
    return ts;
}

// the data sets carry dates as 'YYYYMMDD'. anything that does not parse
// comes back empty.

std::optional<date::year_month_day> StringToDateYMD(const std::string& input_format, SR::sv the_date);

std::string FormatDataSetDate(const date::year_month_day& the_date);

std::string LoadDataFileForUse(const SR::FileName& file_name);

// so we can recognize our errors if we want to do something special

class ReconException : public std::runtime_error
{
public:
    explicit ReconException(const char* what);

    explicit ReconException(const std::string& what);
};

class AssertionException : public std::invalid_argument
{
public:
    explicit AssertionException(const char* what);

    explicit AssertionException(const std::string& what);
};

class DataSetException : public ReconException
{
public:
    explicit DataSetException(const char* what);

    explicit DataSetException(const std::string& what);
};

//  let's do a little 'template normal' programming again

// function to split a string on a delimiter and return a vector of items.
// use concepts to restrict to strings and string_views.

template <typename T>
inline std::vector<T> split_string(SR::sv string_data, char delim)
    requires std::is_same_v<T, std::string> || std::is_same_v<T, SR::sv>
{
    std::vector<T> results;
    for (size_t it = 0; it != T::npos; ++it)
    {
        auto pos = string_data.find(delim, it);
        if (pos != T::npos)
        {
            results.emplace_back(string_data.substr(it, pos - it));
        }
        else
        {
            results.emplace_back(string_data.substr(it));
            break;
        }
        it = pos;
    }
    return results;
}

// comma separated lists show up in several program options.
// entries are trimmed and empty entries dropped.

std::vector<std::string> SplitCommaList(const std::string& list_data);

#endif /* ----- #ifndef _RECON_UTILS_INC_  ----- */
