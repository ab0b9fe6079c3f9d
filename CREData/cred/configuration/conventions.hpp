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

/*! \file cred/configuration/conventions.hpp
    \brief Currency and instrument specific conventions
    \ingroup configuration
*/

#pragma once

#include <cred/utilities/xmlutils.hpp>

#include <ql/errors.hpp>
#include <ql/shared_ptr.hpp>
#include <ql/time/businessdayconvention.hpp>
#include <ql/time/calendar.hpp>
#include <ql/time/daycounter.hpp>
#include <ql/time/frequency.hpp>
#include <ql/time/period.hpp>

#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>

#include <map>
#include <string>
#include <utility>

namespace cre {
namespace data {
using QuantLib::BusinessDayConvention;
using QuantLib::Calendar;
using QuantLib::DayCounter;
using QuantLib::Frequency;
using QuantLib::Natural;
using QuantLib::Period;
using std::string;

//! Abstract base class for convention objects
/*! The conventions hold the string inputs read from XML or passed to the constructor, build() converts them
    into QuantLib objects. A convention is not changed after it is added to a Conventions container.

    \ingroup configuration
 */
class Convention : public XMLSerializable {
public:
    //! Supported convention types
    enum class Type { IborIndex, OvernightIndex, Deposit, FRA, Swap, TenorBasisSwap, Future };

    //! Default destructor
    virtual ~Convention() {}

    //! \name Inspectors
    //@{
    const string& id() const { return id_; }
    Type type() const { return type_; }
    //@}

    //! \name convention interface definition
    //@{
    virtual void build() = 0;
    //@}

protected:
    Convention() {}
    Convention(const string& id, Type type);
    Type type_;
    string id_;
};

std::ostream& operator<<(std::ostream& out, Convention::Type type);

//! Container for storing Ibor Index conventions
/*! The id has the form CCY-NAME-TENOR, e.g. EUR-EURIBOR-6M, the currency and the tenor are read from it.
    \ingroup configuration
 */
class IborIndexConvention : public Convention {
public:
    IborIndexConvention() {}
    IborIndexConvention(const string& id, const string& fixingCalendar, const string& dayCounter,
                        const Natural settlementDays, const string& businessDayConvention, const bool endOfMonth);

    //! \name Inspectors
    //@{
    const string& currency() const { return currency_; }
    const Period& tenor() const { return tenor_; }
    const Calendar& fixingCalendar() const { return fixingCalendar_; }
    const DayCounter& dayCounter() const { return dayCounter_; }
    Natural settlementDays() const { return settlementDays_; }
    BusinessDayConvention businessDayConvention() const { return businessDayConvention_; }
    bool endOfMonth() const { return endOfMonth_; }
    //@}

    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    virtual void build() override;

private:
    string currency_;
    Period tenor_;
    Calendar fixingCalendar_;
    DayCounter dayCounter_;
    BusinessDayConvention businessDayConvention_;

    string strFixingCalendar_;
    string strDayCounter_;
    Natural settlementDays_;
    string strBusinessDayConvention_;
    bool endOfMonth_;
};

//! Container for storing Overnight Index conventions
/*! The id has the form CCY-NAME, e.g. EUR-ESTR.
    \ingroup configuration
 */
class OvernightIndexConvention : public Convention {
public:
    OvernightIndexConvention() {}
    OvernightIndexConvention(const string& id, const string& fixingCalendar, const string& dayCounter,
                             const Natural settlementDays);

    const string& currency() const { return currency_; }
    const Calendar& fixingCalendar() const { return fixingCalendar_; }
    const DayCounter& dayCounter() const { return dayCounter_; }
    Natural settlementDays() const { return settlementDays_; }

    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    virtual void build() override;

private:
    string currency_;
    Calendar fixingCalendar_;
    DayCounter dayCounter_;

    string strFixingCalendar_;
    string strDayCounter_;
    Natural settlementDays_;
};

//! Container for storing Deposit conventions
/*!
  \ingroup configuration
 */
class DepositConvention : public Convention {
public:
    //! \name Constructors
    //@{
    //! Default constructor
    DepositConvention() {}
    //! Detailed constructor
    DepositConvention(const string& id, const string& currency, const string& calendar, const string& convention,
                      const string& eom, const string& dayCounter, const string& settlementDays);
    //@}

    //! \name Inspectors
    //@{
    const string& currency() const { return currency_; }
    const Calendar& calendar() const { return calendar_; }
    BusinessDayConvention convention() const { return convention_; }
    bool eom() const { return eom_; }
    const DayCounter& dayCounter() const { return dayCounter_; }
    Natural settlementDays() const { return settlementDays_; }
    // @}

    //! \name Serialisation
    //@{
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    virtual void build() override;
    //@}

private:
    string currency_;
    Calendar calendar_;
    BusinessDayConvention convention_;
    bool eom_;
    DayCounter dayCounter_;
    Natural settlementDays_;

    // Strings to store the inputs
    string strCalendar_;
    string strConvention_;
    string strEom_;
    string strDayCounter_;
    string strSettlementDays_;
};

//! Container for storing Forward rate Agreement conventions
/*!
  \ingroup configuration
 */
class FraConvention : public Convention {
public:
    //! \name Constructors
    //@{
    //! Default constructor
    FraConvention() {}
    //! Index based constructor
    FraConvention(const string& id, const string& index);
    //@}

    //! \name Inspectors
    //@{
    const string& indexName() const { return strIndex_; }
    //@}

    //! \name Serialisation
    //@{
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    virtual void build() override {}
    //@}

private:
    string strIndex_;
};

//! Container for storing Interest Rate Swap conventions
/*! The floating leg is either on an ibor index, with periods given by the index tenor, or on an overnight index
    compounded over the float frequency, which defaults to the fixed frequency.
  \ingroup configuration
 */
class IRSwapConvention : public Convention {
public:
    //! \name Constructors
    //@{
    //! Default constructor
    IRSwapConvention() {}
    //! Detailed constructor
    IRSwapConvention(const string& id, const string& fixedCalendar, const string& fixedFrequency,
                     const string& fixedConvention, const string& fixedDayCounter, const string& index,
                     const string& floatFrequency = "");
    //@}

    //! \name Inspectors
    //@{
    const Calendar& fixedCalendar() const { return fixedCalendar_; }
    Frequency fixedFrequency() const { return fixedFrequency_; }
    BusinessDayConvention fixedConvention() const { return fixedConvention_; }
    const DayCounter& fixedDayCounter() const { return fixedDayCounter_; }
    const string& indexName() const { return strIndex_; }
    //! NoFrequency if not given
    Frequency floatFrequency() const { return floatFrequency_; }
    //@}

    //! \name Serialisation
    //@{
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    virtual void build() override;
    //@}

private:
    Calendar fixedCalendar_;
    Frequency fixedFrequency_;
    BusinessDayConvention fixedConvention_;
    DayCounter fixedDayCounter_;
    Frequency floatFrequency_;

    // Strings to store the inputs
    string strFixedCalendar_;
    string strFixedFrequency_;
    string strFixedConvention_;
    string strFixedDayCounter_;
    string strIndex_;
    string strFloatFrequency_;
};

//! Container for storing Tenor Basis Swap conventions
/*! The quoted spread is paid on top of the pay index. The frequencies default to the index tenors and are
    mandatory for overnight indices.
  \ingroup configuration
 */
class TenorBasisSwapConvention : public Convention {
public:
    //! \name Constructors
    //@{
    //! Default constructor
    TenorBasisSwapConvention() {}
    //! Detailed constructor
    TenorBasisSwapConvention(const string& id, const string& payIndex, const string& receiveIndex,
                             const string& payFrequency = "", const string& receiveFrequency = "",
                             const string& calendar = "", const string& convention = "");
    //@}

    //! \name Inspectors
    //@{
    const string& payIndexName() const { return strPayIndex_; }
    const string& receiveIndexName() const { return strReceiveIndex_; }
    //! empty period if not given
    const Period& payFrequency() const { return payFrequency_; }
    const Period& receiveFrequency() const { return receiveFrequency_; }
    //! empty calendar if not given, the pay index calendar is used then
    const Calendar& calendar() const { return calendar_; }
    BusinessDayConvention convention() const { return convention_; }
    //@}

    //! \name Serialisation
    //@{
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    virtual void build() override;
    //@}

private:
    Period payFrequency_;
    Period receiveFrequency_;
    Calendar calendar_;
    BusinessDayConvention convention_;

    // Strings to store the inputs
    string strPayIndex_;
    string strReceiveIndex_;
    string strPayFrequency_;
    string strReceiveFrequency_;
    string strCalendar_;
    string strConvention_;
};

//! Container for storing Money Market Futures conventions
/*! The reference period of a contract starts on the IMM date (third Wednesday) of the contract month and has the
    tenor of the ibor index.
  \ingroup configuration
 */
class FutureConvention : public Convention {
public:
    //! \name Constructors
    //@{
    //! Default constructor
    FutureConvention() {}
    //! Index based constructor
    FutureConvention(const string& id, const string& index);
    //@}

    //! \name Inspectors
    //@{
    const string& indexName() const { return strIndex_; }
    //@}

    //! Serialisation
    //@{
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    virtual void build() override {}
    //@}

private:
    string strIndex_;
};

//! Repository for currency dependent market conventions
/*! The conventions are passed explicitly to the builders, there is no global instance.
    \ingroup configuration
 */
class Conventions : public XMLSerializable {
public:
    //! Default constructor
    Conventions() {}

    /*! Returns the convention if found and throws if not */
    QuantLib::ext::shared_ptr<Convention> get(const string& id) const;

    /*! Get a convention with the given \p id and \p type. If no convention of the given \p type with the given \p id
        is found, the first element of the returned pair is \c false and the second element is a \c nullptr. If a
        convention is found, the first element of the returned pair is \c true and the second element holds the
        convention.
    */
    std::pair<bool, QuantLib::ext::shared_ptr<Convention>> get(const std::string& id,
                                                               const Convention::Type& type) const;

    //! Checks if we have a convention with the given \p id
    bool has(const std::string& id) const;

    //! Checks if we have a convention with the given \p id and \p type
    bool has(const std::string& id, const Convention::Type& type) const;

    //! Number of conventions
    QuantLib::Size size() const;

    /*! Clear all conventions */
    void clear();

    /*! Add a convention. This will overwrite an existing convention
        with the same id */
    void add(const QuantLib::ext::shared_ptr<Convention>& convention);

    //! \name Serialisation
    //@{
    virtual void fromXML(XMLNode* node) override;
    virtual XMLNode* toXML(XMLDocument& doc) const override;
    //@}

private:
    std::map<string, QuantLib::ext::shared_ptr<Convention>> data_;
    mutable boost::shared_mutex mutex_;
};

//! Convention of the given type, throws if it is missing or of a different type
template <class T> QuantLib::ext::shared_ptr<T> getConvention(const Conventions& conventions, const string& id) {
    QuantLib::ext::shared_ptr<T> c = QuantLib::ext::dynamic_pointer_cast<T>(conventions.get(id));
    QL_REQUIRE(c, "Convention " << id << " is not of the expected type");
    return c;
}

} // namespace data
} // namespace cre
