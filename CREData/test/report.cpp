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

#include <boost/test/unit_test.hpp>
#include <cret/datapaths.hpp>
#include <cret/toplevelfixture.hpp>

#include <cred/report/csvreport.hpp>
#include <cred/report/inmemoryreport.hpp>

#include <ql/utilities/null.hpp>

#include <fstream>

using namespace std;
using namespace boost::unit_test_framework;
using namespace QuantLib;
using namespace cre::data;

namespace {

vector<string> readLines(const string& filename) {
    vector<string> lines;
    ifstream file(filename.c_str());
    string line;
    while (getline(file, line))
        lines.push_back(line);
    return lines;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(CREDataTestSuite, cre::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ReportTests)

BOOST_AUTO_TEST_CASE(testInMemoryReport) {

    BOOST_TEST_MESSAGE("Testing in memory report...");

    InMemoryReport report;
    report.addColumn("Curve", string())
        .addColumn("Date", Date())
        .addColumn("Index", Size())
        .addColumn("DiscountFactor", Real(), 8);
    report.next().add("EUR-ESTR").add(Date(1, July, 2027)).add(Size(0)).add(0.98);
    report.next().add("EUR-ESTR").add(Date(3, July, 2028)).add(Size(1)).add(0.96);
    report.end();

    BOOST_CHECK_EQUAL(report.columns(), 4);
    BOOST_CHECK_EQUAL(report.rows(), 2);
    BOOST_CHECK_EQUAL(report.header(3), "DiscountFactor");
    BOOST_CHECK(report.hasHeader("Date"));
    BOOST_CHECK(!report.hasHeader("ZeroRate"));
    BOOST_CHECK_EQUAL(report.columnIndex("Index"), 2);
    BOOST_CHECK_THROW(report.columnIndex("ZeroRate"), QuantLib::Error);
    BOOST_CHECK_EQUAL(report.columnPrecision(3), 8);

    BOOST_CHECK_EQUAL(boost::get<string>(report.data(0)[1]), "EUR-ESTR");
    BOOST_CHECK_EQUAL(boost::get<Date>(report.data(1)[1]), Date(3, July, 2028));
    BOOST_CHECK_EQUAL(boost::get<Size>(report.data(2)[1]), 1);
    BOOST_CHECK_CLOSE(boost::get<Real>(report.data(3)[0]), 0.98, 1.0e-12);
}

BOOST_AUTO_TEST_CASE(testReportErrors) {

    BOOST_TEST_MESSAGE("Testing report errors...");

    InMemoryReport report;
    report.addColumn("Curve", string()).addColumn("Value", Real(), 2);
    BOOST_CHECK_THROW(report.addColumn("Curve", string()), QuantLib::Error);

    report.next();
    // wrong type
    BOOST_CHECK_THROW(report.add(Date(1, July, 2027)), QuantLib::Error);
    report.add("EUR-ESTR");
    // incomplete row
    BOOST_CHECK_THROW(report.next(), QuantLib::Error);
    BOOST_CHECK_THROW(report.end(), QuantLib::Error);
    report.add(1.0);
    // too many values
    BOOST_CHECK_THROW(report.add(2.0), QuantLib::Error);
    BOOST_CHECK_NO_THROW(report.end());
}

BOOST_AUTO_TEST_CASE(testCsvReport) {

    BOOST_TEST_MESSAGE("Testing csv report...");

    InMemoryReport report;
    report.addColumn("Curve", string()).addColumn("Date", Date()).addColumn("Value", Real(), 4);
    report.next().add("EUR-ESTR").add(Date(1, July, 2027)).add(0.98766);
    report.next().add("EUR-6M").add(Date()).add(Null<Real>());
    report.end();

    string file = TEST_OUTPUT_FILE("report.csv");
    report.toFile(file);
    vector<string> lines = readLines(file);
    BOOST_REQUIRE_EQUAL(lines.size(), 3);
    BOOST_CHECK_EQUAL(lines[0], "#Curve,Date,Value");
    BOOST_CHECK_EQUAL(lines[1], "EUR-ESTR,2027-07-01,0.9877");
    BOOST_CHECK_EQUAL(lines[2], "EUR-6M,#N/A,#N/A");

    report.toFile(file, ';', false, "");
    lines = readLines(file);
    BOOST_REQUIRE_EQUAL(lines.size(), 3);
    BOOST_CHECK_EQUAL(lines[0], "Curve;Date;Value");
    BOOST_CHECK_EQUAL(lines[2], "EUR-6M;;");

    CSVFileReport csv(file);
    csv.addColumn("Curve", string());
    csv.next().add("EUR-ESTR");
    csv.end();
    // a finalized report accepts no more rows
    BOOST_CHECK_THROW(csv.next(), QuantLib::Error);
    BOOST_CHECK_EQUAL(readLines(file).size(), 2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
