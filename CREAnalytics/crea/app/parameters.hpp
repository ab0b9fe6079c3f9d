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

/*! \file crea/app/parameters.hpp
    \brief Application setup and analytics choice
    \ingroup app
*/

#pragma once

#include <map>
#include <string>

#include <cred/utilities/xmlutils.hpp>

namespace cre {
namespace analytics {
using namespace cre::data;
using std::map;
using std::string;

//! Provides the input data and references to input files used in CREApp
/*! The parameters are grouped into "setup", "logging", "markets" and one group per analytic,
    each group is a map from parameter name to value.

    \ingroup app
 */
class Parameters : public XMLSerializable {
public:
    Parameters() {}

    void clear();
    void fromFile(const string&);
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;

    bool hasGroup(const string& groupName) const;
    bool has(const string& groupName, const string& paramName) const;
    string get(const string& groupName, const string& paramName, bool fail = true) const;
    const map<string, string>& data(const string& groupName) const;
    const map<string, string>& markets() const;

    //! true if the analytic group exists and its parameter "active" is Y
    bool isActive(const string& analytic) const;

    void log() const;

private:
    map<string, map<string, string>> data_;
};

} // namespace analytics
} // namespace cre
