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

/*! \file cred/report/csvreport.hpp
    \brief CSV Report class
    \ingroup report
*/

#pragma once

#include <cred/report/report.hpp>

#include <stdio.h>
#include <vector>

namespace cre {
namespace data {

class ReportTypePrinter;

/*! CSV Report class

\ingroup report
*/
class CSVFileReport : public Report {
public:
    /*! Create a report with the given filename, will throw if it cannot open the file.
        \param filename         name of the csv file that is created
        \param sep              separator character for the csv file
        \param commentCharacter if \c true, the header row starts with the \c # character
        \param nullString       string used to represent \c QuantLib::Null values or non-finite values
    */
    CSVFileReport(const string& filename, const char sep = ',', const bool commentCharacter = true,
                  const std::string& nullString = "#N/A");
    ~CSVFileReport();

    Report& addColumn(const string& name, const ReportType& rt, Size precision = 0) override;
    Report& next() override;
    Report& add(const ReportType& rt) override;
    void end() override;

private:
    void checkIsOpen(const std::string& op) const;

    std::vector<ReportType> columnTypes_;
    std::vector<ReportTypePrinter> printers_;
    std::string filename_;
    char sep_;
    bool commentCharacter_;
    std::string nullString_;
    Size i_;
    FILE* fp_;
    bool finalized_ = false;
};

} // namespace data
} // namespace cre
