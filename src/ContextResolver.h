// =====================================================================================
//
//       Filename:  ContextResolver.h
//
//    Description:  infers the single (end date, duration) a statement is reported for
//
//        Version:  1.0
//        Created:  09/14/2026 01:31:50 PM
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

#ifndef CONTEXTRESOLVER_H_
#define CONTEXTRESOLVER_H_

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "StatementRecon.h"

namespace StatementRecon
{
    using FactPtrs = std::vector<const NumericFact*>;
    using TagSet = std::set<std::string, std::less<>>;

    // which stage of the scope filter produced the candidates.

    enum class ScopeOutcome
    {
        e_PrimaryHit,
        e_FallbackHit,
        e_NoMatch
    };

    struct ScopedCandidates
    {
        ScopeOutcome outcome_ = ScopeOutcome::e_NoMatch;
        FactPtrs candidates_;
    };

    // restrict to the statement's tags and to facts with the right kind of
    // duration for the statement (instant for balance sheets, period for the rest).
    // primary (consolidated, no segments) facts are used when there are any,
    // otherwise everything is tried.

    ScopedCandidates SelectPrimaryScope(const NumericFacts& facts, const TagSet& statement_tags, sv statement_code);

    ResolvedContext ResolveStatementContext(const NumericFacts& facts, const TagSet& statement_tags,
                                            sv statement_code);

    // latest period (duration > 0) reported anywhere in the filing. used to label the filing.

    ResolvedContext ResolveFilingPeriod(const NumericFacts& facts);

    // 'FY-2024', 'Q3-2024', 'P6-2024'

    std::string DerivePeriodLabel(const ResolvedContext& context, int fallback_year);

    // shared with the fallback path in the table assembler.
    // ties go to whichever duration was seen first.

    std::optional<int> ModeDuration(const FactPtrs& facts);

}		// namespace StatementRecon

#endif /* end of include guard: CONTEXTRESOLVER_H_ */
