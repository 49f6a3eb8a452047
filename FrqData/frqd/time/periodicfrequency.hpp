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

/*! \file frqd/time/periodicfrequency.hpp
    \brief Periodic frequency of events within a financial product
    \ingroup time
*/

#pragma once

#include <frqd/time/calendarperiod.hpp>

#include <ql/time/frequency.hpp>
#include <ql/time/period.hpp>

#include <boost/optional.hpp>
#include <boost/serialization/split_member.hpp>

namespace frq {
namespace data {

//! Periodic frequency
/*! A frequency at which a financial product has an event, e.g. every 3 months or every 2 weeks.
    It is primarily intended to subdivide events within a year.

    A frequency is any positive, non-zero CalendarPeriod of days, weeks, months or years of at most
    1,000 years. Months and years are not normalized, so P12M and P1Y are distinct frequencies.
    They add to dates in the same way. Call normalized() to fold months into years.

    A number of days that is a multiple of 7 is always held as weeks and named accordingly,
    e.g. ofDays(14) is P2W.

    The special value 'Term' stands for no subdivision of the entire term, also known as
    zero-coupon or once. It is represented by a period of 10,000 years so that date arithmetic
    still works and produces a date beyond the end of any term.

    Equality and hashing only look at the period, the name is for display.

    \warning The constants below are initialised dynamically, in unspecified order relative to
             namespace scope objects of other translation units. Static initialisers elsewhere
             must use term() or the factories instead of copying the constants.

    \ingroup time
*/
class PeriodicFrequency {
public:
    //! \name Constants
    //@{
    //! Daily, 364 events per year
    static const PeriodicFrequency P1D;
    //! Weekly, 52 events per year
    static const PeriodicFrequency P1W;
    //! Bi-weekly, 26 events per year
    static const PeriodicFrequency P2W;
    //! Lunar, 13 events per year
    static const PeriodicFrequency P4W;
    //! 4 events per year
    static const PeriodicFrequency P13W;
    //! 2 events per year
    static const PeriodicFrequency P26W;
    //! 1 event per year
    static const PeriodicFrequency P52W;
    //! Monthly
    static const PeriodicFrequency P1M;
    //! Bi-monthly
    static const PeriodicFrequency P2M;
    //! Quarterly
    static const PeriodicFrequency P3M;
    //! 3 events per year
    static const PeriodicFrequency P4M;
    //! Semi-annual
    static const PeriodicFrequency P6M;
    //! Annual
    static const PeriodicFrequency P12M;
    //! Zero-coupon, 10,000 years, no events per year
    static const PeriodicFrequency TERM;
    //@}

    //! \name Factories
    //@{
    /*! Builds a frequency from a calendar period. If the period consists of days only it is
        passed to ofDays(), so that multiples of 7 become weeks. Otherwise the total number of
        months must not exceed 12,000. Throws InvalidFrequencyError if the period is negative,
        zero or too large.
    */
    static PeriodicFrequency of(const CalendarPeriod& period);
    //! A number of days, converted to weeks if divisible by 7
    static PeriodicFrequency ofDays(QuantLib::Integer days);
    static PeriodicFrequency ofWeeks(QuantLib::Integer weeks);
    //! At most 12,000 months, months are not normalized into years
    static PeriodicFrequency ofMonths(QuantLib::Integer months);
    //! At most 1,000 years
    static PeriodicFrequency ofYears(QuantLib::Integer years);
    //! The 'Term' frequency, same as TERM, safe to use during static initialisation
    static const PeriodicFrequency& term();

    /*! Parses a frequency. The text is either 'Term' in any case, or an ISO-8601 period
        such as P3M, where the leading 'P' may be omitted, e.g. 2W. Throws InvalidFrequencyError
        if the text cannot be parsed or the period is not a valid frequency.

        The 'P' and the unit designators are case insensitive, so p3m and P3m are accepted as P3M.
    */
    static PeriodicFrequency parse(const std::string& text);

    //! As of(), but returns none instead of throwing, the reason is written to \p error if given
    static boost::optional<PeriodicFrequency> tryOf(const CalendarPeriod& period, std::string* error = nullptr);
    //! As parse(), but returns none instead of throwing, the reason is written to \p error if given
    static boost::optional<PeriodicFrequency> tryParse(const std::string& text, std::string* error = nullptr);
    //@}

    //! \name QuantLib conversions
    //@{
    //! Days, Weeks, Months and Years map to the factory of the same unit
    static PeriodicFrequency fromPeriod(const QuantLib::Period& period);
    /*! Once maps to Term, all other named QuantLib frequencies to the matching constant,
        e.g. Quarterly to P3M. NoFrequency and OtherFrequency throw.
    */
    static PeriodicFrequency fromFrequency(QuantLib::Frequency frequency);
    /*! Single unit QuantLib period of the same length. Mixed years and months are expressed in
        months. Throws for Term and for periods that mix months and days.
    */
    QuantLib::Period toPeriod() const;
    //! The named QuantLib frequency, OtherFrequency if there is none
    QuantLib::Frequency toFrequency() const;
    //@}

    //! \name Inspectors
    //@{
    const CalendarPeriod& period() const { return period_; }
    const std::string& name() const { return name_; }

    //! True if this is the 'Term' frequency
    bool isTerm() const;
    //! True if the frequency is a whole number of weeks without months or years
    bool isWeekBased() const;
    //! True if the frequency is a whole number of months or years without days, never true for Term
    bool isMonthBased() const;
    //@}

    //! Folds 12 or more months into years, returns *this if nothing changes
    PeriodicFrequency normalized() const;

    /*! Number of events per year.

        Month based frequencies divide 12 by the total number of months, this works for
        P1M, P2M, P3M, P4M, P6M, P12M and P1Y.

        Day and week based frequencies divide 364 by the number of days, this works for
        P1D, P2D, P4D, P1W, P2W, P4W, P13W, P26W and P52W.

        Term returns 0. Throws InvalidFrequencyError for any other frequency.
    */
    QuantLib::Integer eventsPerYear() const;

    //! \name Temporal amount
    //@{
    //! Years, Months or Days component, weeks are held as days and are not a unit
    QuantLib::Integer get(QuantLib::TimeUnit unit) const { return period_.get(unit); }
    std::vector<QuantLib::TimeUnit> units() const { return period_.units(); }
    //! Throws QuantLib::Error if the result is outside the QuantLib date range
    QuantLib::Date addTo(const QuantLib::Date& date) const { return period_.addTo(date); }
    //! Throws QuantLib::Error if the result is outside the QuantLib date range
    QuantLib::Date subtractFrom(const QuantLib::Date& date) const { return period_.subtractFrom(date); }
    //@}

    //! The canonical name, e.g. P3M, P2W or Term
    const std::string& toString() const { return name_; }

private:
    PeriodicFrequency();
    PeriodicFrequency(const CalendarPeriod& period);
    PeriodicFrequency(const CalendarPeriod& period, const std::string& name);

    //! The Term constant for a period equal to Term, of() otherwise
    static PeriodicFrequency resolve(const CalendarPeriod& period);

    CalendarPeriod period_;
    std::string name_;

    //! Serialization
    friend class boost::serialization::access;
    template <class Archive> void save(Archive& ar, const unsigned int version) const;
    template <class Archive> void load(Archive& ar, const unsigned int version);
    BOOST_SERIALIZATION_SPLIT_MEMBER()
};

//! Compares the periods, names are ignored
bool operator==(const PeriodicFrequency& lhs, const PeriodicFrequency& rhs);
bool operator!=(const PeriodicFrequency& lhs, const PeriodicFrequency& rhs);

std::size_t hash_value(const PeriodicFrequency& f);

std::ostream& operator<<(std::ostream& out, const PeriodicFrequency& f);

QuantLib::Date operator+(const QuantLib::Date& date, const PeriodicFrequency& f);
QuantLib::Date operator-(const QuantLib::Date& date, const PeriodicFrequency& f);

} // namespace data
} // namespace frq

namespace std {
template <> struct hash<frq::data::PeriodicFrequency> {
    std::size_t operator()(const frq::data::PeriodicFrequency& f) const { return frq::data::hash_value(f); }
};
} // namespace std
