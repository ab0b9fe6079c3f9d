/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for multi-curve calibration and market quote risk analysis

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file cred/report/inmemoryreport.hpp
    \brief In memory report class
    \ingroup report
*/

#pragma once

#include <cred/report/report.hpp>

#include <algorithm>
#include <vector>

namespace cre {
namespace data {
using std::vector;

/*! InMemoryReport just stores report information in local vectors and provides an interface to access
    the values, it is used by the tests and can be written to a csv file later on.
 \ingroup report
 */
class InMemoryReport : public Report {
public:
    InMemoryReport() : i_(0) {}

    Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) override;
    Report& next() override;
    Report& add(const ReportType& rt) override;
    void end() override;

    // InMemoryInterface
    Size columns() const { return headers_.size(); }
    Size rows() const { return columns() == 0 ? 0 : data_[0].size(); }
    const string& header(Size i) const { return headers_.at(i); }
    bool hasHeader(const string& h) const { return std::find(headers_.begin(), headers_.end(), h) != headers_.end(); }
    //! index of the column with header h, throws if there is none
    Size columnIndex(const string& h) const;
    ReportType columnType(Size i) const { return columnTypes_.at(i); }
    Size columnPrecision(Size i) const { return columnPrecision_.at(i); }
    //! Returns the data of column i
    const vector<ReportType>& data(Size i) const { return data_.at(i); }
    //! writes the report to a csv file
    void toFile(const string& filename, const char sep = ',', const bool commentCharacter = true,
                const string& nullString = "#N/A") const;

private:
    Size i_;
    vector<string> headers_;
    vector<ReportType> columnTypes_;
    vector<Size> columnPrecision_;
    vector<vector<ReportType>> data_;
};

} // namespace data
} // namespace cre
