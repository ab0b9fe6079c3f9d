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

/*! \file cret/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <ql/settings.hpp>

#include <cred/utilities/log.hpp>

using QuantLib::SavedSettings;

namespace cre {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    SavedSettings savedSettings;

    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture() { logMask_ = cre::data::Log::instance().mask(); }

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Restore the log mask, tests may lower it to silence expected errors
        cre::data::Log::instance().setMask(logMask_);
    }

private:
    unsigned logMask_;
};
} // namespace test
} // namespace cre
