// =====================================================================================
//
//       Filename:  FilingDataSources.h
//
//    Description:  the read-only interfaces the reconstruction code pulls its
//                  data through.
//
//        Version:  1.0
//        Created:  09/14/2026 01:05:12 PM
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

#ifndef FILINGDATASOURCES_H_
#define FILINGDATASOURCES_H_

#include <optional>
#include <string>

#include "StatementRecon.h"

namespace StatementRecon
{
    // =====================================================================================
    //        Class:  FactSource
    //  Description:  numeric facts (num.txt) for one filing.
    // =====================================================================================

    class FactSource
    {
    public:
        virtual ~FactSource() = default;

        [[nodiscard]] virtual NumericFacts FactsFor(const FilingID& filing_ID) const = 0;
    };

    // =====================================================================================
    //        Class:  PresentationSource
    //  Description:  presentation rows (pre.txt) for one filing and statement.
    //                rows come back in no particular order.
    // =====================================================================================

    class PresentationSource
    {
    public:
        virtual ~PresentationSource() = default;

        [[nodiscard]] virtual PresentationRows StructureFor(const FilingID& filing_ID, sv statement_code) const = 0;
    };

    class LabelSource
    {
    public:
        virtual ~LabelSource() = default;

        [[nodiscard]] virtual std::optional<std::string> LabelFor(sv tag) const = 0;
    };

    // everything the reconstruction functions need to get at the data.
    // the sources must outlive any call made with the context.
    // label lookup is optional.

    struct ReconContext
    {
        const FactSource& facts_;
        const PresentationSource& presentation_;
        const LabelSource* labels_ = nullptr;
    };

}		// namespace StatementRecon

#endif /* end of include guard: FILINGDATASOURCES_H_ */
