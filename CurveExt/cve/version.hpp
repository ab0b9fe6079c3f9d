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

/*! \file cve/version.hpp
    \brief Version
*/

#ifndef curveext_version_hpp
#define curveext_version_hpp

// Boost Version
// Boost.Graph, Boost.Test and the header only parts of Boost used here need 1.65 or higher
#include <boost/version.hpp>
#if BOOST_VERSION < 106500
#error using an old version of Boost, please update.
#endif

// We require QuantLib 1.22 or higher (ext::shared_ptr, Singleton with global flag)
#include <ql/version.hpp>
#if QL_HEX_VERSION < 0x012200f0
#error using an old version of QuantLib, please update.
#endif

//! Version string
#define CRE_VERSION "1.0.0.0"

//! Version number
#define CRE_VERSION_NUM 1000000

#endif
