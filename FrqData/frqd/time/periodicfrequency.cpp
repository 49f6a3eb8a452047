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

#include <frqd/time/periodicfrequency.hpp>
#include <frqd/utilities/invalidfrequencyerror.hpp>
#include <frqd/utilities/log.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <limits>

using namespace QuantLib;
using std::string;

namespace frq {
namespace data {

namespace {
// artificial maximum length of a normal frequency in years
const Integer maxYears = 1000;
const Integer maxMonths = maxYears * 12;
// artificial length in years of the 'Term' frequency
const Integer termYears = 10000;
} // namespace

// TERM first, the default constructor mirrors it
const PeriodicFrequency PeriodicFrequency::TERM = PeriodicFrequency::term();
const PeriodicFrequency PeriodicFrequency::P1D = PeriodicFrequency::ofDays(1);
const PeriodicFrequency PeriodicFrequency::P1W = PeriodicFrequency::ofWeeks(1);
const PeriodicFrequency PeriodicFrequency::P2W = PeriodicFrequency::ofWeeks(2);
const PeriodicFrequency PeriodicFrequency::P4W = PeriodicFrequency::ofWeeks(4);
const PeriodicFrequency PeriodicFrequency::P13W = PeriodicFrequency::ofWeeks(13);
const PeriodicFrequency PeriodicFrequency::P26W = PeriodicFrequency::ofWeeks(26);
const PeriodicFrequency PeriodicFrequency::P52W = PeriodicFrequency::ofWeeks(52);
const PeriodicFrequency PeriodicFrequency::P1M = PeriodicFrequency::ofMonths(1);
const PeriodicFrequency PeriodicFrequency::P2M = PeriodicFrequency::ofMonths(2);
const PeriodicFrequency PeriodicFrequency::P3M = PeriodicFrequency::ofMonths(3);
const PeriodicFrequency PeriodicFrequency::P4M = PeriodicFrequency::ofMonths(4);
const PeriodicFrequency PeriodicFrequency::P6M = PeriodicFrequency::ofMonths(6);
const PeriodicFrequency PeriodicFrequency::P12M = PeriodicFrequency::ofMonths(12);

PeriodicFrequency::PeriodicFrequency() : period_(CalendarPeriod::ofYears(termYears)), name_("Term") {}

PeriodicFrequency::PeriodicFrequency(const CalendarPeriod& period) : PeriodicFrequency(period, period.toString()) {}

PeriodicFrequency::PeriodicFrequency(const CalendarPeriod& period, const string& name)
    : period_(period), name_(name) {
    FRQ_REQUIRE_FREQUENCY(!period.isZero(), "Period must not be zero");
    FRQ_REQUIRE_FREQUENCY(!period.isNegative(), "Period must not be negative: " << period);
}

PeriodicFrequency PeriodicFrequency::of(const CalendarPeriod& period) {
    long long months = period.totalMonths();
    if (months == 0 && period.days() != 0)
        return ofDays(period.days());
    FRQ_REQUIRE_FREQUENCY(months <= maxMonths, "Period must not exceed 1000 years: " << period);
    return PeriodicFrequency(period);
}

PeriodicFrequency PeriodicFrequency::ofDays(Integer days) {
    if (days % 7 == 0)
        return ofWeeks(days / 7);
    return PeriodicFrequency(CalendarPeriod::ofDays(days));
}

PeriodicFrequency PeriodicFrequency::ofWeeks(Integer weeks) {
    FRQ_REQUIRE_FREQUENCY(weeks <= std::numeric_limits<Integer>::max() / 7,
                          "Number of weeks " << weeks << " is too large");
    FRQ_REQUIRE_FREQUENCY(weeks >= std::numeric_limits<Integer>::min() / 7,
                          "Number of weeks " << weeks << " is too small");
    return PeriodicFrequency(CalendarPeriod::ofWeeks(weeks), "P" + std::to_string(weeks) + "W");
}

PeriodicFrequency PeriodicFrequency::ofMonths(Integer months) {
    FRQ_REQUIRE_FREQUENCY(months <= maxMonths, "Months must not exceed 12,000: " << months);
    return PeriodicFrequency(CalendarPeriod::ofMonths(months));
}

PeriodicFrequency PeriodicFrequency::ofYears(Integer years) {
    FRQ_REQUIRE_FREQUENCY(years <= maxYears, "Years must not exceed 1,000: " << years);
    return PeriodicFrequency(CalendarPeriod::ofYears(years));
}

const PeriodicFrequency& PeriodicFrequency::term() {
    static const PeriodicFrequency instance(CalendarPeriod::ofYears(termYears), "Term");
    return instance;
}

PeriodicFrequency PeriodicFrequency::parse(const string& text) {
    if (boost::iequals(text, "Term"))
        return term();
    string prefixed = boost::istarts_with(text, "P") ? text : "P" + text;
    CalendarPeriod period;
    try {
        period = CalendarPeriod::parse(prefixed);
    } catch (const Error& e) {
        FRQ_FAIL_FREQUENCY("Unable to parse frequency '" << text << "': " << e.what());
    }
    return of(period);
}

boost::optional<PeriodicFrequency> PeriodicFrequency::tryOf(const CalendarPeriod& period, string* error) {
    try {
        return of(period);
    } catch (const InvalidFrequencyError& e) {
        if (error)
            *error = e.message();
        return boost::none;
    }
}

boost::optional<PeriodicFrequency> PeriodicFrequency::tryParse(const string& text, string* error) {
    try {
        return parse(text);
    } catch (const InvalidFrequencyError& e) {
        if (error)
            *error = e.message();
        return boost::none;
    }
}

PeriodicFrequency PeriodicFrequency::fromPeriod(const Period& period) {
    switch (period.units()) {
    case Days:
        return ofDays(period.length());
    case Weeks:
        return ofWeeks(period.length());
    case Months:
        return ofMonths(period.length());
    case Years:
        return ofYears(period.length());
    default:
        FRQ_FAIL_FREQUENCY("Period " << period << " has no calendar unit");
    }
}

PeriodicFrequency PeriodicFrequency::fromFrequency(Frequency frequency) {
    switch (frequency) {
    case Once:
        return TERM;
    case Annual:
        return P12M;
    case Semiannual:
        return P6M;
    case EveryFourthMonth:
        return P4M;
    case Quarterly:
        return P3M;
    case Bimonthly:
        return P2M;
    case Monthly:
        return P1M;
    case EveryFourthWeek:
        return P4W;
    case Biweekly:
        return P2W;
    case Weekly:
        return P1W;
    case Daily:
        return P1D;
    default:
        FRQ_FAIL_FREQUENCY("Frequency " << frequency << " has no periodic frequency equivalent");
    }
}

Period PeriodicFrequency::toPeriod() const {
    FRQ_REQUIRE_FREQUENCY(!isTerm(), "Term can not be converted to a period");
    if (period_.totalMonths() == 0) {
        if (isWeekBased())
            return Period(period_.days() / 7, Weeks);
        return Period(period_.days(), Days);
    }
    FRQ_REQUIRE_FREQUENCY(period_.days() == 0, "Frequency " << name_ << " mixes months and days");
    if (period_.months() == 0)
        return Period(period_.years(), Years);
    // bounded by 12,000 months
    return Period(static_cast<Integer>(period_.totalMonths()), Months);
}

Frequency PeriodicFrequency::toFrequency() const {
    if (isTerm())
        return Once;
    if (isMonthBased()) {
        switch (period_.totalMonths()) {
        case 1:
            return Monthly;
        case 2:
            return Bimonthly;
        case 3:
            return Quarterly;
        case 4:
            return EveryFourthMonth;
        case 6:
            return Semiannual;
        case 12:
            return Annual;
        default:
            return OtherFrequency;
        }
    }
    if (period_.totalMonths() == 0) {
        switch (period_.days()) {
        case 1:
            return Daily;
        case 7:
            return Weekly;
        case 14:
            return Biweekly;
        case 28:
            return EveryFourthWeek;
        default:
            return OtherFrequency;
        }
    }
    return OtherFrequency;
}

bool PeriodicFrequency::isTerm() const { return period_ == CalendarPeriod::ofYears(termYears); }

bool PeriodicFrequency::isWeekBased() const { return period_.totalMonths() == 0 && period_.days() % 7 == 0; }

bool PeriodicFrequency::isMonthBased() const {
    return period_.totalMonths() > 0 && period_.days() == 0 && !isTerm();
}

PeriodicFrequency PeriodicFrequency::normalized() const {
    CalendarPeriod norm = period_.normalized();
    return norm != period_ ? of(norm) : *this;
}

Integer PeriodicFrequency::eventsPerYear() const {
    if (isTerm())
        return 0;
    long long months = period_.totalMonths();
    Integer days = period_.days();
    if (isMonthBased()) {
        if (12 % months == 0)
            return static_cast<Integer>(12 / months);
    } else if (months == 0 && 364 % days == 0) {
        return 364 / days;
    }
    FRQ_FAIL_FREQUENCY("Unable to calculate events per year: " << name_);
}

PeriodicFrequency PeriodicFrequency::resolve(const CalendarPeriod& period) {
    if (period == CalendarPeriod::ofYears(termYears)) {
        TLOG("Resolved deserialized period " << period << " to Term");
        return TERM;
    }
    return of(period);
}

template <class Archive> void PeriodicFrequency::save(Archive& ar, const unsigned int) const { ar& period_; }

template <class Archive> void PeriodicFrequency::load(Archive& ar, const unsigned int) {
    CalendarPeriod period;
    ar& period;
    *this = resolve(period);
}

bool operator==(const PeriodicFrequency& lhs, const PeriodicFrequency& rhs) { return lhs.period() == rhs.period(); }

bool operator!=(const PeriodicFrequency& lhs, const PeriodicFrequency& rhs) { return !(lhs == rhs); }

std::size_t hash_value(const PeriodicFrequency& f) { return hash_value(f.period()); }

std::ostream& operator<<(std::ostream& out, const PeriodicFrequency& f) { return out << f.name(); }

Date operator+(const Date& date, const PeriodicFrequency& f) { return f.addTo(date); }

Date operator-(const Date& date, const PeriodicFrequency& f) { return f.subtractFrom(date); }

template void PeriodicFrequency::save(boost::archive::binary_oarchive& ar, const unsigned int version) const;
template void PeriodicFrequency::load(boost::archive::binary_iarchive& ar, const unsigned int version);

} // namespace data
} // namespace frq
