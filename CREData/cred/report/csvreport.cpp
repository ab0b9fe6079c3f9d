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

/*! \file cred/report/csvreport.cpp
    \brief CSV Report class
    \ingroup report
*/

#include <cred/report/csvreport.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>
#include <ql/math/rounding.hpp>
#include <ql/utilities/null.hpp>

#include <boost/variant/static_visitor.hpp>

#include <cmath>

using std::string;

namespace cre {
namespace data {

// Local class for printing each report type via fprintf
class ReportTypePrinter : public boost::static_visitor<> {
public:
    ReportTypePrinter(FILE* fp, int prec, const string& nullString = "#N/A")
        : fp_(fp), rounding_(prec, QuantLib::Rounding::Closest), null_(nullString) {}

    void operator()(const Size i) const {
        if (i == QuantLib::Null<Size>()) {
            fprintNull();
        } else {
            fprintf(fp_, "%zu", i);
        }
    }
    void operator()(const Real d) const {
        if (d == QuantLib::Null<Real>() || !std::isfinite(d)) {
            fprintNull();
        } else {
            Real r = rounding_(d);
            fprintf(fp_, "%.*f", rounding_.precision(), QuantLib::close_enough(r, 0.0) ? 0.0 : r);
        }
    }
    void operator()(const string& s) const { fprintf(fp_, "%s", s.c_str()); }
    void operator()(const Date& d) const {
        if (d == QuantLib::Null<Date>()) {
            fprintNull();
        } else {
            fprintf(fp_, "%s", to_string(d).c_str());
        }
    }

private:
    void fprintNull() const { fprintf(fp_, "%s", null_.c_str()); }

    FILE* fp_;
    QuantLib::Rounding rounding_;
    string null_;
};

CSVFileReport::CSVFileReport(const string& filename, const char sep, const bool commentCharacter,
                             const string& nullString)
    : filename_(filename), sep_(sep), commentCharacter_(commentCharacter), nullString_(nullString), i_(0),
      fp_(NULL) {
    LOG("Opening CSV file report '" << filename_ << "'");
    fp_ = fopen(filename_.c_str(), "w");
    QL_REQUIRE(fp_, "Error opening file '" << filename_ << "'");
}

CSVFileReport::~CSVFileReport() {
    if (!finalized_) {
        WLOG("CSV file report '" << filename_ << "' was not finalized, call end() on the report instance.");
        if (fp_)
            fclose(fp_);
    }
}

Report& CSVFileReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    checkIsOpen("addColumn(" + name + ")");
    columnTypes_.push_back(rt);
    printers_.push_back(ReportTypePrinter(fp_, static_cast<int>(precision), nullString_));
    if (i_ == 0 && commentCharacter_)
        fprintf(fp_, "#");
    if (i_ > 0)
        fprintf(fp_, "%c", sep_);
    fprintf(fp_, "%s", name.c_str());
    i_++;
    return *this;
}

Report& CSVFileReport::next() {
    checkIsOpen("next()");
    QL_REQUIRE(i_ == columnTypes_.size(), "Cannot go to next line, only " << i_ << " entries filled");
    fprintf(fp_, "\n");
    i_ = 0;
    return *this;
}

Report& CSVFileReport::add(const ReportType& rt) {
    checkIsOpen("add()");
    QL_REQUIRE(i_ < columnTypes_.size(), "No column to add [" << rt << "] to.");
    QL_REQUIRE(rt.which() == columnTypes_[i_].which(), "Cannot add value " << rt << " of type " << rt.which()
                                                                           << " to column " << i_ << " of type "
                                                                           << columnTypes_[i_].which());

    if (i_ != 0)
        fprintf(fp_, "%c", sep_);
    boost::apply_visitor(printers_[i_], rt);
    i_++;
    return *this;
}

void CSVFileReport::end() {
    checkIsOpen("end()");
    QL_REQUIRE(i_ == columnTypes_.size() || i_ == 0, "csv report is finalized with incomplete row, got data for "
                                                         << i_ << " columns out of " << columnTypes_.size());
    fprintf(fp_, "\n");
    if (int rc = fclose(fp_)) {
        ALOG("CSV file report '" << filename_ << "' can not be closed (return code " << rc << ")");
    } else {
        LOG("CSV file report '" << filename_ << "' closed.");
    }
    fp_ = NULL;
    finalized_ = true;
}

void CSVFileReport::checkIsOpen(const std::string& op) const {
    QL_REQUIRE(!finalized_,
               "CSV file report '" << filename_ << "' is already finalized, can not process operation " << op);
}

} // namespace data
} // namespace cre
