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

/*! \file cred/configuration/curvenode.hpp
    \brief Curve node, a market quote together with the instrument it calibrates
    \ingroup configuration
*/

#pragma once

#include <cred/utilities/xmlutils.hpp>

#include <ql/time/date.hpp>
#include <ql/time/period.hpp>

#include <boost/variant.hpp>

#include <ostream>
#include <string>

namespace cre {
namespace data {
using QuantLib::Date;
using QuantLib::Month;
using QuantLib::Period;
using QuantLib::Real;
using QuantLib::Year;
using std::string;

//! Term deposit starting at spot, the convention is a Deposit convention
struct TermDepositNode {
    TermDepositNode() {}
    TermDepositNode(const string& convention, const Period& tenor) : convention(convention), tenor(tenor) {}
    string convention;
    Period tenor;
};

//! Deposit over the period of an ibor fixing, the convention is an IborIndex convention
struct IborFixingDepositNode {
    IborFixingDepositNode() {}
    explicit IborFixingDepositNode(const string& convention) : convention(convention) {}
    string convention;
};

//! FRA starting periodToStart after spot, the convention is a FRA convention
struct FraNode {
    FraNode() {}
    FraNode(const string& convention, const Period& periodToStart)
        : convention(convention), periodToStart(periodToStart) {}
    string convention;
    Period periodToStart;
};

//! Fixed vs ibor or overnight swap, the convention is a Swap convention
struct FixedFloatSwapNode {
    FixedFloatSwapNode() {}
    FixedFloatSwapNode(const string& convention, const Period& tenor, const Period& forwardStart = Period())
        : convention(convention), tenor(tenor), forwardStart(forwardStart) {}
    string convention;
    Period tenor;
    Period forwardStart;
};

//! Index vs index swap with the quoted spread on the pay index, the convention is a TenorBasisSwap convention
struct BasisSwapNode {
    BasisSwapNode() {}
    BasisSwapNode(const string& convention, const Period& tenor) : convention(convention), tenor(tenor) {}
    string convention;
    Period tenor;
};

//! Money market future for an absolute contract month, the convention is a Future convention
struct IborFutureNode {
    IborFutureNode() : year(0), month(QuantLib::January) {}
    IborFutureNode(const string& convention, Year year, Month month)
        : convention(convention), year(year), month(month) {}
    string convention;
    Year year;
    Month month;
};

//! The instrument of a curve node
typedef boost::variant<TermDepositNode, IborFixingDepositNode, FraNode, FixedFloatSwapNode, BasisSwapNode,
                       IborFutureNode>
    CurveNodeInstrument;

//! reads an instrument from its xml node, e.g. Swap
CurveNodeInstrument curveNodeInstrumentFromXML(XMLNode* node);
XMLNode* curveNodeInstrumentToXML(XMLDocument& doc, const CurveNodeInstrument& instrument);
//! the name of the instrument's xml node, e.g. Swap
string curveNodeInstrumentType(const CurveNodeInstrument& instrument);

//! Rule for the date of a curve node
/*! The node date is the abscissa of the node's parameter on the curve and the date of the
    parameter metadata. End is the maturity of the instrument, LastFixing the end of the period
    of the last index fixing, Fixed a given date.

    \ingroup configuration
*/
class NodeDate {
public:
    enum class Type { End, LastFixing, Fixed };

    NodeDate() : type_(Type::End) {}
    explicit NodeDate(Type type, const Date& date = Date());

    static NodeDate end() { return NodeDate(Type::End); }
    static NodeDate lastFixing() { return NodeDate(Type::LastFixing); }
    static NodeDate fixed(const Date& d) { return NodeDate(Type::Fixed, d); }

    Type type() const { return type_; }
    //! only set for type Fixed
    const Date& date() const { return date_; }

private:
    Type type_;
    Date date_;
};

bool operator==(const NodeDate& a, const NodeDate& b);
std::ostream& operator<<(std::ostream& out, const NodeDate& d);
//! End, LastFixing or a date
NodeDate parseNodeDate(const string& s);

//! Curve node
/*! A curve node combines a market quote id with the instrument the quote is calibrated to, an
    additional spread which is added to the quoted rate, a label and the node date rule. If the
    label is empty a default label is derived from the instrument when the parameter metadata
    is generated.

    \ingroup configuration
*/
class CurveNode : public XMLSerializable {
public:
    //! Default constructor
    CurveNode() : spread_(0.0) {}
    //! Detailed constructor
    CurveNode(const string& quoteId, const CurveNodeInstrument& instrument, Real spread = 0.0,
              const string& label = "", const NodeDate& nodeDate = NodeDate());

    //! \name Inspectors
    //@{
    const string& quoteId() const { return quoteId_; }
    const CurveNodeInstrument& instrument() const { return instrument_; }
    Real spread() const { return spread_; }
    const string& label() const { return label_; }
    const NodeDate& nodeDate() const { return nodeDate_; }
    //! the id of the convention the instrument refers to
    const string& conventionId() const;
    //! the name of the instrument's xml node, e.g. Swap
    string instrumentType() const;
    //@}

    //! \name Serialisation
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

private:
    string quoteId_;
    CurveNodeInstrument instrument_;
    Real spread_;
    string label_;
    NodeDate nodeDate_;
};

} // namespace data
} // namespace cre
