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

/*! \file cret/fileutilities.hpp
    \brief File utilities for use in unit tests
*/

#pragma once

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

namespace cre {
namespace test {

// Use to remove the output directory of a test
// Returns true if the operation completed without errors, otherwise false
inline bool clearOutput(const boost::filesystem::path& outputPath) {

    // If output path does not exist, nothing to do
    if (!boost::filesystem::exists(outputPath))
        return true;

    // If the output path exists, attempt to remove it
    try {
        boost::filesystem::remove_all(outputPath);
        return true;
    } catch (boost::filesystem::filesystem_error& err) {
        BOOST_TEST_MESSAGE("The attempt to remove the output path, " << outputPath << ", failed with error "
                                                                     << err.what());
        return false;
    }
}

} // namespace test
} // namespace cre
