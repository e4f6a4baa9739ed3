// =====================================================================================
//
//       Filename:  SEC_DataSet.h
//
//    Description:  loads an SEC Financial Statement Data Set directory
//                  (num.txt, pre.txt, tag.txt and sub.txt) into memory
//
//        Version:  1.0
//        Created:  09/15/2026 11:02:17 AM
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

#ifndef SEC_DATASET_H_
#define SEC_DATASET_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "FilingDataSources.h"
#include "StatementRecon.h"

namespace StatementRecon
{
    struct SubmissionInfo
    {
        FilingID filing_ID_;
        std::string CIK_;
        std::string company_name_;
        std::string form_;
        std::optional<date::year_month_day> period_;
        std::optional<date::year_month_day> filed_;
    };

    struct DataSetLoadStats
    {
        int num_rows_ = 0;
        int num_rows_skipped_ = 0;
        int pre_rows_ = 0;
        int pre_rows_skipped_ = 0;
        int tag_rows_ = 0;
        int sub_rows_ = 0;
    };

    // =====================================================================================
    //        Class:  SEC_DataSet
    //  Description:  in memory copy of one quarterly data set. once loaded it is only
    //                read from so it can be shared between threads.
    // =====================================================================================

    class SEC_DataSet : public FactSource, public PresentationSource, public LabelSource
    {
    public:
        // ====================  LIFECYCLE     =======================================

        SEC_DataSet() = default;
        explicit SEC_DataSet(const FileName& data_directory);

        SEC_DataSet(const SEC_DataSet& rhs) = delete;
        SEC_DataSet(SEC_DataSet&& rhs) = default;

        ~SEC_DataSet() override = default;

        // ====================  ACCESSORS     =======================================

        [[nodiscard]] NumericFacts FactsFor(const FilingID& filing_ID) const override;
        [[nodiscard]] PresentationRows StructureFor(const FilingID& filing_ID, sv statement_code) const override;
        [[nodiscard]] std::optional<std::string> LabelFor(sv tag) const override;

        [[nodiscard]] std::optional<SubmissionInfo> SubmissionFor(const FilingID& filing_ID) const;

        [[nodiscard]] const DataSetLoadStats& GetLoadStats() const { return load_stats_; }

        // newest filings first. an empty form list means any form.
        // with 'one_per_company' only the newest filing for each CIK is kept.
        // a negative 'max_filings' means no limit.

        [[nodiscard]] FilingIDList SelectFilings(const std::vector<std::string>& forms, int max_filings,
                                                 bool one_per_company = false) const;

        // ====================  MUTATORS      =======================================

        // for building small data sets by hand.

        void AddFact(NumericFact fact);
        void AddPresentationRow(PresentationRow row);
        void AddLabel(const std::string& tag, const std::string& label);
        void AddSubmission(SubmissionInfo submission);

        // ====================  OPERATORS     =======================================

        SEC_DataSet& operator=(const SEC_DataSet& rhs) = delete;
        SEC_DataSet& operator=(SEC_DataSet&& rhs) = default;

    private:
        void LoadNumericFacts(const FileName& file_name);
        void LoadPresentationRows(const FileName& file_name);
        void LoadTags(const FileName& file_name);
        void LoadSubmissions(const FileName& file_name);

        // ====================  DATA MEMBERS  =======================================

        std::map<FilingID, NumericFacts> facts_;
        std::map<FilingID, std::map<std::string, PresentationRows, std::less<>>> presentation_;
        std::map<std::string, std::string, std::less<>> labels_;
        std::vector<SubmissionInfo> submissions_;

        DataSetLoadStats load_stats_;

    }; // -----  end of class SEC_DataSet  -----

}		// namespace StatementRecon

#endif /* end of include guard: SEC_DATASET_H_ */
