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

/*! \file cred/report/report.hpp
    \brief Report interface class
    \ingroup report
*/

#pragma once

#include <boost/variant.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <string>

namespace cre {
namespace data {
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

/*! Abstract Report interface class

    A Report is a table with typed columns, e.g. a CSV file. The columns are set before any data is added,
    then each row is added with calls to add(). ReportType covers the allowed types of a column.

    <pre>
     report.addColumn("Curve", string())
           .addColumn("Date", Date())
           .addColumn("DiscountFactor", double(), 12);
     report.next().add("EUR-ESTR").add(d).add(0.998);
     report.end();
    </pre>
  \ingroup report
 */
class Report {
public:
    typedef boost::variant<Size, Real, string, Date> ReportType;

    virtual ~Report() {}
    virtual Report& addColumn(const string& name, const ReportType&, Size precision = 0) = 0;
    virtual Report& next() = 0;
    virtual Report& add(const ReportType& rt) = 0;
    virtual void end() = 0;
};

} // namespace data
} // namespace cre
