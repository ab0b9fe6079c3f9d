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

/*! \file cret/log.hpp
    \brief boost test logger
*/

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>
#include <cred/utilities/log.hpp>

#include <string>
#include <vector>

using cre::data::Logger;

namespace cre {
namespace test {

//! BoostTest Logger
/*!
  This logger writes each log message out to the BOOST_TEST_MESSAGE.
  To view log messages run cre unit tests with the flag "--log_level=test_suite"
  \ingroup utilities
  \see Log
 */
class BoostTestLogger : public Logger {
public:
    //! Constructor
    BoostTestLogger() : Logger("BoostTestLogger") {}
    //! The log callback
    virtual void log(unsigned, const std::string& msg) override { BOOST_TEST_MESSAGE(msg); }
};

//! Gets passed the command line arguments from a unit test suite
//! and sets up CRE logging if it is requested
/*!
    Specifying --cre_log_mask on its own turns on logging with a default
    log mask of 255
    Optionally, you can specify the log mask using --cre_log_mask=<mask>
    \ingroup utilities
*/
inline void setupTestLogging(int argc, char** argv) {

    for (int i = 1; i < argc; ++i) {

        // --cre_log_mask indicates we want CRE logging
        if (boost::starts_with(argv[i], "--cre_log_mask")) {

            // Check if mask is provided also (default is 255)
            unsigned int mask = 255;
            std::vector<std::string> strs;
            boost::split(strs, argv[i], boost::is_any_of("="));
            if (strs.size() > 1) {
                mask = boost::lexical_cast<unsigned int>(strs[1]);
            }

            // Set up logging
            QuantLib::ext::shared_ptr<cre::test::BoostTestLogger> logger =
                QuantLib::ext::make_shared<cre::test::BoostTestLogger>();
            cre::data::Log::instance().removeAllLoggers();
            cre::data::Log::instance().registerLogger(logger);
            cre::data::Log::instance().switchOn();
            cre::data::Log::instance().setMask(mask);
        }
    }
}

} // namespace test
} // namespace cre
