/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file frqd/time/calendarperiod.hpp
    \brief Calendar period made of years, months and days
    \ingroup time
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/time/timeunit.hpp>
#include <ql/types.hpp>

#include <boost/serialization/access.hpp>

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace frq {
namespace data {

//! Calendar period
/*! A signed triple of years, months and days. Unlike QuantLib::Period, which carries a single
    length and unit, the three components are held separately and are not normalized into one
    another: 12 months and 1 year are different periods until normalized() is called.

    Weeks are not a component, a number of weeks is held as seven times as many days.

    Adding the period to a date follows the usual calendar rules: months are added first,
    with the day of month clamped to the end of the month, then days.

    \ingroup time
*/
class CalendarPeriod {
public:
    //! Zero period
    CalendarPeriod() : years_(0), months_(0), days_(0) {}
    CalendarPeriod(QuantLib::Integer years, QuantLib::Integer months, QuantLib::Integer days)
        : years_(years), months_(months), days_(days) {}

    //! \name Factories
    //@{
    static CalendarPeriod ofYears(QuantLib::Integer years) { return CalendarPeriod(years, 0, 0); }
    static CalendarPeriod ofMonths(QuantLib::Integer months) { return CalendarPeriod(0, months, 0); }
    //! Throws if the number of days overflows
    static CalendarPeriod ofWeeks(QuantLib::Integer weeks);
    static CalendarPeriod ofDays(QuantLib::Integer days) { return CalendarPeriod(0, 0, days); }

    /*! Parses an ISO-8601 period of the form <tt>[+-]P[nY][nM][nW][nD]</tt>, e.g. P1Y6M, P2W or P-3D.
        Designators are case insensitive, at least one section must be present and weeks are folded
        into days. Throws QuantLib::Error if the text does not match or a component overflows.
    */
    static CalendarPeriod parse(const std::string& text);
    //@}

    //! \name Inspectors
    //@{
    QuantLib::Integer years() const { return years_; }
    QuantLib::Integer months() const { return months_; }
    QuantLib::Integer days() const { return days_; }
    //! years * 12 + months
    long long totalMonths() const { return static_cast<long long>(years_) * 12 + months_; }

    bool isZero() const { return years_ == 0 && months_ == 0 && days_ == 0; }
    //! true if any of the components is negative
    bool isNegative() const { return years_ < 0 || months_ < 0 || days_ < 0; }

    //! Value of the given unit, supported units are Years, Months and Days
    QuantLib::Integer get(QuantLib::TimeUnit unit) const;
    //! The supported units, Years, Months and Days, in this order
    std::vector<QuantLib::TimeUnit> units() const;
    //@}

    /*! Returns a period of the same length with the months folded into years so that the
        month component lies in (-12, 12). Days are left untouched.
    */
    CalendarPeriod normalized() const;

    //! \name Date arithmetic
    //@{
    /*! Adds the period to \p date. Throws QuantLib::Error if the result is outside the
        QuantLib date range.
    */
    QuantLib::Date addTo(const QuantLib::Date& date) const;
    /*! Subtracts the period from \p date. Throws QuantLib::Error if the result is outside the
        QuantLib date range.
    */
    QuantLib::Date subtractFrom(const QuantLib::Date& date) const;
    //@}

    //! ISO-8601 representation, P0D for the zero period
    std::string toString() const;

private:
    QuantLib::Integer years_, months_, days_;

    //! Serialization
    friend class boost::serialization::access;
    template <class Archive> void serialize(Archive& ar, const unsigned int version);
};

bool operator==(const CalendarPeriod& lhs, const CalendarPeriod& rhs);
bool operator!=(const CalendarPeriod& lhs, const CalendarPeriod& rhs);

//! Hash for use with boost::hash
std::size_t hash_value(const CalendarPeriod& p);

std::ostream& operator<<(std::ostream& out, const CalendarPeriod& p);

//! \name Date arithmetic in the QuantLib style, date + period
//@{
QuantLib::Date operator+(const QuantLib::Date& date, const CalendarPeriod& p);
QuantLib::Date operator-(const QuantLib::Date& date, const CalendarPeriod& p);
//@}

} // namespace data
} // namespace frq

namespace std {
template <> struct hash<frq::data::CalendarPeriod> {
    std::size_t operator()(const frq::data::CalendarPeriod& p) const { return frq::data::hash_value(p); }
};
} // namespace std
