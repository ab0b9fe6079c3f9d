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

/*! \file cred/report/inmemoryreport.cpp
    \brief In memory report class
    \ingroup report
*/

#include <cred/report/csvreport.hpp>
#include <cred/report/inmemoryreport.hpp>

#include <ql/errors.hpp>

namespace cre {
namespace data {

Report& InMemoryReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    QL_REQUIRE(!hasHeader(name), "InMemoryReport: duplicate column " << name);
    headers_.push_back(name);
    columnTypes_.push_back(rt);
    columnPrecision_.push_back(precision);
    data_.push_back(vector<ReportType>());
    i_++;
    return *this;
}

Report& InMemoryReport::next() {
    QL_REQUIRE(i_ == headers_.size(), "Cannot go to next line, only " << i_ << " entries filled");
    i_ = 0;
    return *this;
}

Report& InMemoryReport::add(const ReportType& rt) {
    QL_REQUIRE(i_ < headers_.size(), "No column to add [" << rt << "] to.");
    QL_REQUIRE(rt.which() == columnTypes_[i_].which(),
               "Cannot add value " << rt << " of type " << rt.which() << " to column " << headers_[i_]
                                   << " of type " << columnTypes_[i_].which());
    data_[i_].push_back(rt);
    i_++;
    return *this;
}

void InMemoryReport::end() {
    QL_REQUIRE(i_ == headers_.size() || i_ == 0, "report is finalized with incomplete row, got data for "
                                                     << i_ << " columns out of " << headers_.size());
}

Size InMemoryReport::columnIndex(const string& h) const {
    auto it = std::find(headers_.begin(), headers_.end(), h);
    QL_REQUIRE(it != headers_.end(), "InMemoryReport: no column " << h);
    return static_cast<Size>(it - headers_.begin());
}

void InMemoryReport::toFile(const string& filename, const char sep, const bool commentCharacter,
                            const string& nullString) const {
    CSVFileReport cReport(filename, sep, commentCharacter, nullString);

    for (Size i = 0; i < headers_.size(); i++)
        cReport.addColumn(headers_[i], columnTypes_[i], columnPrecision_[i]);

    for (Size row = 0; row < rows(); row++) {
        cReport.next();
        for (auto col : data_)
            cReport.add(col[row]);
    }
    cReport.end();
}

} // namespace data
} // namespace cre
