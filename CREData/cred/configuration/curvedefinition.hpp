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

/*! \file cred/configuration/curvedefinition.hpp
    \brief Definition of a curve to be calibrated and of a group of curves calibrated together
    \ingroup configuration
*/

#pragma once

#include <cred/configuration/curvenode.hpp>

#include <cve/termstructures/interpolatedparametercurve.hpp>

#include <ql/time/daycounter.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace cre {
namespace data {
using QuantLib::DayCounter;
using std::vector;

//! Definition of a single curve
/*! The curve has one parameter per node, the parameters are ordered as the nodes. The value
    type, the interpolator and the extrapolators define the parametrisation, the day counter
    the curve time.

    \ingroup configuration
*/
class CurveDefinition : public XMLSerializable {
public:
    //! Default constructor
    CurveDefinition()
        : valueType_(CurveExt::CurveValueType::ZeroRate), interpolator_(CurveExt::Interpolator::Linear),
          leftExtrapolator_(CurveExt::Extrapolator::Flat), rightExtrapolator_(CurveExt::Extrapolator::Flat) {}
    //! Detailed constructor
    CurveDefinition(const string& name, const string& currency, const vector<CurveNode>& nodes,
                    CurveExt::CurveValueType valueType, CurveExt::Interpolator interpolator,
                    CurveExt::Extrapolator leftExtrapolator = CurveExt::Extrapolator::Flat,
                    CurveExt::Extrapolator rightExtrapolator = CurveExt::Extrapolator::Flat,
                    const DayCounter& dayCounter = QuantLib::Actual365Fixed());

    //! \name Inspectors
    //@{
    const string& name() const { return name_; }
    const string& currency() const { return currency_; }
    const vector<CurveNode>& nodes() const { return nodes_; }
    QuantLib::Size parameterCount() const { return nodes_.size(); }
    CurveExt::CurveValueType valueType() const { return valueType_; }
    CurveExt::Interpolator interpolator() const { return interpolator_; }
    CurveExt::Extrapolator leftExtrapolator() const { return leftExtrapolator_; }
    CurveExt::Extrapolator rightExtrapolator() const { return rightExtrapolator_; }
    const DayCounter& dayCounter() const { return dayCounter_; }
    //@}

    //! \name Serialisation
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

private:
    void check() const;

    string name_;
    string currency_;
    vector<CurveNode> nodes_;
    CurveExt::CurveValueType valueType_;
    CurveExt::Interpolator interpolator_;
    CurveExt::Extrapolator leftExtrapolator_, rightExtrapolator_;
    DayCounter dayCounter_;
};

//! Usage of a curve within a group
struct CurveGroupEntry {
    CurveGroupEntry() {}
    CurveGroupEntry(const string& curveName, const vector<string>& discountCurrencies, const vector<string>& indices)
        : curveName(curveName), discountCurrencies(discountCurrencies), indices(indices) {}
    string curveName;
    //! currencies discounted on the curve
    vector<string> discountCurrencies;
    //! indices projected from the curve
    vector<string> indices;
};

//! Definition of a group of curves
/*! The group lists its curve definitions in calibration order and the currencies and indices
    each curve is used for. A currency or an index can be assigned to at most one curve of the
    group. Curves the instruments need that are not in the group have to be supplied as seed
    curves when the group is calibrated.

    \ingroup configuration
*/
class CurveGroupDefinition : public XMLSerializable {
public:
    CurveGroupDefinition() {}
    CurveGroupDefinition(const string& name, const vector<CurveDefinition>& curves,
                         const vector<CurveGroupEntry>& entries);

    //! \name Inspectors
    //@{
    const string& name() const { return name_; }
    const vector<CurveDefinition>& curveDefinitions() const { return curves_; }
    const vector<CurveGroupEntry>& entries() const { return entries_; }
    bool hasCurve(const string& curveName) const;
    const CurveDefinition& curveDefinition(const string& curveName) const;
    //! the entry of the curve, an entry without currencies and indices if the group has none
    CurveGroupEntry entry(const string& curveName) const;
    //! total number of parameters of the group
    QuantLib::Size parameterCount() const;
    //@}

    //! \name Serialisation
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

private:
    void check() const;

    string name_;
    vector<CurveDefinition> curves_;
    vector<CurveGroupEntry> entries_;
};

//! Container of curve group definitions, keyed by group name
/*! \ingroup configuration */
class CurveGroupDefinitions : public XMLSerializable {
public:
    CurveGroupDefinitions() {}

    bool has(const string& name) const { return groups_.count(name) > 0; }
    const CurveGroupDefinition& get(const string& name) const;
    void add(const CurveGroupDefinition& group);
    //! group names in alphabetical order
    vector<string> names() const;
    QuantLib::Size size() const { return groups_.size(); }

    //! \name Serialisation
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

private:
    std::map<string, CurveGroupDefinition> groups_;
};

} // namespace data
} // namespace cre
