// =====================================================================================
//
//       Filename:  FactSelector.h
//
//    Description:  picks the one numeric fact to show on a presentation row
//
//        Version:  1.0
//        Created:  09/14/2026 02:15:03 PM
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

#ifndef FACTSELECTOR_H_
#define FACTSELECTOR_H_

#include <optional>

#include "ContextResolver.h"
#include "StatementRecon.h"

namespace StatementRecon
{
    // everything we know about the row we are trying to fill in.
    // an empty version matches any version.
    // 'date_pinned' is set when the caller supplied the end date rather than
    // having it resolved from the statement's facts.

    struct SelectionRequest
    {
        sv tag_;
        sv version_;
        sv statement_code_;
        sv label_;
        std::optional<date::year_month_day> target_date_;
        std::optional<int> target_duration_;
        bool date_pinned_ = false;
    };

    struct Selection
    {
        std::optional<NumericFact> chosen_;
        int candidate_count_ = 0;
        int unique_values_ = 0;
    };

    // narrows the filing's facts down to the candidates for the row and ranks them.
    // coming back empty is normal. it means there is nothing to show.

    Selection SelectFact(const NumericFacts& facts, const SelectionRequest& request);

    // consolidated first, then (when asked) no segments, then largest absolute value,
    // then latest date. the sort is stable so input order settles anything else.

    FactPtrs RankCandidates(FactPtrs candidates, bool prefer_no_segments);

    int CountUniqueValues(const FactPtrs& candidates);

}		// namespace StatementRecon

#endif /* end of include guard: FACTSELECTOR_H_ */
