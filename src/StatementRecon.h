// =====================================================================================
//
//       Filename:  StatementRecon.h
//
//    Description:  holds the common types shared by the reconstruction code.
//
//        Version:  1.0
//        Created:  09/14/2026 10:12:31 AM
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

#ifndef STATEMENTRECON_H_
#define STATEMENTRECON_H_


#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <date/date.h>

namespace StatementRecon
{
    // thanks to Jonathan Boccara of fluentcpp.com for his articles on
    // Strong Types and the NamedType library.
    //
    // this code is a simplified and somewhat stripped down version of his.

    // =====================================================================================
    //        Class:  UniqType
    //  Description: Provides a wrapper which makes embedded common data types distinguisable
    // =====================================================================================

    template <typename T, typename Uniqueifier>
    class UniqType
    {
    public:
        // ====================  LIFECYCLE     =======================================

        UniqType() requires std::is_default_constructible_v<T>
            : value_{} {}

        explicit UniqType(T const& value) requires std::is_copy_constructible_v<T>
            : value_{value} {}

        explicit UniqType(T&& value) requires std::is_move_constructible_v<T>
            : value_(std::move(value)) {}

        UniqType(const UniqType<T, Uniqueifier>& rhs) = default;
        UniqType(UniqType<T, Uniqueifier>&& rhs) noexcept = default;

        ~UniqType() = default;

        // ====================  ACCESSORS     =======================================

        T& get() { return value_; }
        const T& get() const { return value_; }

        // ====================  OPERATORS     =======================================

        UniqType& operator=(const UniqType<T, Uniqueifier>& rhs) = default;
        UniqType& operator=(UniqType<T, Uniqueifier>&& rhs) noexcept = default;

        UniqType& operator=(const T& rhs) requires std::is_copy_assignable_v<T>
        {
            value_ = rhs;
            return *this;
        }

        // filing IDs get used as map keys so we need ordering too.

        bool operator==(const UniqType<T, Uniqueifier>& rhs) const { return value_ == rhs.value_; }
        bool operator<(const UniqType<T, Uniqueifier>& rhs) const { return value_ < rhs.value_; }

    private:
        // ====================  DATA MEMBERS  =======================================

        T value_;

    }; // -----  end of class UniqType  -----

    using sv = std::string_view;
    using std::filesystem::path;

    // the SEC accession number ('adsh') identifies a filing.

    using FilingID = UniqType<std::string, struct FilingIDTag>;
    using FileName = UniqType<path, struct FileNameTag>;

    using FilingIDList = std::vector<FilingID>;

    // NOTE: duration is given in quarters. 0 means an instant (a balance at a point in time)
    // anything larger is an accumulation over the period ending at 'end_date'.
    // fields which could not be parsed from the source data are left empty.

    struct NumericFact
    {
        FilingID filing_ID;
        std::string tag;
        std::string version;
        std::optional<date::year_month_day> end_date;
        std::optional<int> duration;
        std::string units;
        std::string coreg;
        std::string segments;
        std::optional<double> value;

        [[nodiscard]] bool IsConsolidated() const { return coreg.empty(); }
        [[nodiscard]] bool HasSegments() const { return ! segments.empty(); }
        [[nodiscard]] bool IsPrimary() const { return coreg.empty() && segments.empty(); }
        [[nodiscard]] bool IsInstant() const { return duration && *duration == 0; }
        [[nodiscard]] bool IsDuration() const { return duration && *duration > 0; }

        bool operator==(const NumericFact& rhs) const = default;
    };

    using NumericFacts = std::vector<NumericFact>;

    struct PresentationRow
    {
        FilingID filing_ID;
        std::string statement_code;
        int report = 0;
        int line = 0;
        int depth = 0;
        std::string source_file;
        std::string tag;
        std::string version;
        std::string label;
        bool negating = false;

        bool operator==(const PresentationRow& rhs) const = default;
    };

    using PresentationRows = std::vector<PresentationRow>;

    struct ResolvedContext
    {
        std::optional<date::year_month_day> end_date;
        std::optional<int> duration;

        [[nodiscard]] bool empty() const { return ! end_date && ! duration; }

        bool operator==(const ResolvedContext& rhs) const = default;
    };

    // one output row for each presentation row.

    struct StatementRow
    {
        PresentationRow presentation;

        std::optional<double> value;
        std::optional<double> display_value;
        std::optional<std::string> formatted_value;
        std::string units;
        std::optional<date::year_month_day> end_date;
        std::optional<int> duration;
        std::string segments;
        std::string coreg;

        int candidate_count = 0;
        int candidate_unique_values = 0;
        bool candidate_conflict = false;
        bool has_value = false;

        bool operator==(const StatementRow& rhs) const = default;
    };

    using StatementTable = std::vector<StatementRow>;
    using FilingTables = std::map<std::string, StatementTable>;

    //  seems to be needed by boost program options

    template <typename T, typename Uniqueifier>
    std::ostream& operator<<(std::ostream& os, const UniqType<T, Uniqueifier>& a_type)
    {
        os << a_type.get();
        return os;
    }

    template <typename T, typename Uniqueifier>
    std::istream& operator>>(std::istream& is, UniqType<T, Uniqueifier>& a_type)
    {
        T temp = a_type.get();
        is >> temp;
        a_type = temp;
        return is;
    }

}		// namespace StatementRecon

namespace SR = StatementRecon;

#endif /* end of include guard: STATEMENTRECON_H_ */
