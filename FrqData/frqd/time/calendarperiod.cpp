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

#include <frqd/time/calendarperiod.hpp>

#include <ql/errors.hpp>
#include <ql/time/period.hpp>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/functional/hash.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

#include <limits>
#include <sstream>

using namespace QuantLib;
using std::string;

namespace frq {
namespace data {

namespace {

const long long maxInteger = std::numeric_limits<Integer>::max();
const long long minInteger = std::numeric_limits<Integer>::min();

// Checked conversion of a 64 bit intermediate result back to a period component
Integer toInteger(long long value, const string& what) {
    QL_REQUIRE(value >= minInteger && value <= maxInteger, what << " " << value << " overflows an integer");
    return static_cast<Integer>(value);
}

// Parses one signed section of an ISO period, an unmatched section is zero.
// The result is within the Integer range, so applying the overall sign cannot overflow.
long long parseSection(const boost::ssub_match& section, const string& text) {
    if (!section.matched)
        return 0;
    string s = section.str();
    if (s[0] == '+')
        s = s.substr(1);
    long long value;
    try {
        value = boost::lexical_cast<long long>(s);
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Period '" << text << "' has a component that cannot be converted to an integer: " << s);
    }
    QL_REQUIRE(value >= minInteger && value <= maxInteger,
               "Period '" << text << "' has a component that overflows an integer: " << s);
    return value;
}

} // namespace

CalendarPeriod CalendarPeriod::ofWeeks(Integer weeks) {
    return CalendarPeriod(0, 0, toInteger(static_cast<long long>(weeks) * 7, "Number of days"));
}

CalendarPeriod CalendarPeriod::parse(const string& text) {
    static const boost::regex pattern("([-+]?)P(?:([-+]?[0-9]+)Y)?(?:([-+]?[0-9]+)M)?(?:([-+]?[0-9]+)W)?"
                                      "(?:([-+]?[0-9]+)D)?",
                                      boost::regex::icase);
    boost::smatch m;
    QL_REQUIRE(boost::regex_match(text, m, pattern), "Period '" << text << "' could not be parsed");
    QL_REQUIRE(m[2].matched || m[3].matched || m[4].matched || m[5].matched,
               "Period '" << text << "' must contain at least one of years, months, weeks or days");

    long long sign = m[1].str() == "-" ? -1 : 1;
    Integer years = toInteger(sign * parseSection(m[2], text), "Number of years");
    Integer months = toInteger(sign * parseSection(m[3], text), "Number of months");
    Integer weeks = toInteger(sign * parseSection(m[4], text), "Number of weeks");
    Integer days = toInteger(sign * parseSection(m[5], text), "Number of days");
    days = toInteger(static_cast<long long>(weeks) * 7 + days, "Number of days");
    return CalendarPeriod(years, months, days);
}

Integer CalendarPeriod::get(TimeUnit unit) const {
    switch (unit) {
    case Years:
        return years_;
    case Months:
        return months_;
    case Days:
        return days_;
    default:
        QL_FAIL("Unsupported unit " << unit << ", only Years, Months and Days are supported");
    }
}

std::vector<TimeUnit> CalendarPeriod::units() const { return {Years, Months, Days}; }

CalendarPeriod CalendarPeriod::normalized() const {
    long long total = totalMonths();
    Integer splitYears = toInteger(total / 12, "Number of years");
    Integer splitMonths = static_cast<Integer>(total % 12);
    if (splitYears == years_ && splitMonths == months_)
        return *this;
    return CalendarPeriod(splitYears, splitMonths, days_);
}

Date CalendarPeriod::addTo(const Date& date) const {
    Date result = date;
    if (years_ != 0 && months_ != 0) {
        result += Period(toInteger(totalMonths(), "Number of months"), Months);
    } else {
        if (years_ != 0)
            result += Period(years_, Years);
        if (months_ != 0)
            result += Period(months_, Months);
    }
    if (days_ != 0)
        result += Period(days_, Days);
    return result;
}

Date CalendarPeriod::subtractFrom(const Date& date) const {
    Date result = date;
    if (years_ != 0 && months_ != 0) {
        result -= Period(toInteger(totalMonths(), "Number of months"), Months);
    } else {
        if (years_ != 0)
            result -= Period(years_, Years);
        if (months_ != 0)
            result -= Period(months_, Months);
    }
    if (days_ != 0)
        result -= Period(days_, Days);
    return result;
}

string CalendarPeriod::toString() const {
    if (isZero())
        return "P0D";
    std::ostringstream oss;
    oss << 'P';
    if (years_ != 0)
        oss << years_ << 'Y';
    if (months_ != 0)
        oss << months_ << 'M';
    if (days_ != 0)
        oss << days_ << 'D';
    return oss.str();
}

template <class Archive> void CalendarPeriod::serialize(Archive& ar, const unsigned int) {
    ar& years_;
    ar& months_;
    ar& days_;
}

bool operator==(const CalendarPeriod& lhs, const CalendarPeriod& rhs) {
    return lhs.years() == rhs.years() && lhs.months() == rhs.months() && lhs.days() == rhs.days();
}

bool operator!=(const CalendarPeriod& lhs, const CalendarPeriod& rhs) { return !(lhs == rhs); }

std::size_t hash_value(const CalendarPeriod& p) {
    std::size_t seed = 0;
    boost::hash_combine(seed, p.years());
    boost::hash_combine(seed, p.months());
    boost::hash_combine(seed, p.days());
    return seed;
}

std::ostream& operator<<(std::ostream& out, const CalendarPeriod& p) { return out << p.toString(); }

Date operator+(const Date& date, const CalendarPeriod& p) { return p.addTo(date); }

Date operator-(const Date& date, const CalendarPeriod& p) { return p.subtractFrom(date); }

template void CalendarPeriod::serialize(boost::archive::binary_oarchive& ar, const unsigned int version);
template void CalendarPeriod::serialize(boost::archive::binary_iarchive& ar, const unsigned int version);

} // namespace data
} // namespace frq
