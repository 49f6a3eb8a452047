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

#include <boost/test/unit_test.hpp>
#include <frqd/time/calendarperiod.hpp>
#include <frqt/toplevelfixture.hpp>

#include <ql/errors.hpp>

#include <limits>
#include <unordered_set>

using namespace QuantLib;
using namespace frq::data;
using namespace std;

namespace {

struct test_period_data {
    const char* str;
    Integer years;
    Integer months;
    Integer days;
};

static struct test_period_data period_data[] = {{"P1Y", 1, 0, 0},      {"P18M", 0, 18, 0},  {"P1Y6M", 1, 6, 0},
                                                {"P2W", 0, 0, 14},     {"P1W3D", 0, 0, 10}, {"P3D", 0, 0, 3},
                                                {"p3m", 0, 3, 0},      {"P1y2m3d", 1, 2, 3}, {"P+3M", 0, 3, 0},
                                                {"P-3D", 0, 0, -3},    {"-P1Y2M", -1, -2, 0}, {"P0D", 0, 0, 0},
                                                {"P1Y0M0W0D", 1, 0, 0}};

} // namespace

BOOST_FIXTURE_TEST_SUITE(FrqDataTestSuite, frq::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(CalendarPeriodTests)

BOOST_AUTO_TEST_CASE(testInspectors) {

    BOOST_TEST_MESSAGE("Testing calendar period inspectors...");

    CalendarPeriod p(1, 2, 3);
    BOOST_CHECK_EQUAL(p.years(), 1);
    BOOST_CHECK_EQUAL(p.months(), 2);
    BOOST_CHECK_EQUAL(p.days(), 3);
    BOOST_CHECK_EQUAL(p.totalMonths(), 14);
    BOOST_CHECK(!p.isZero());
    BOOST_CHECK(!p.isNegative());

    BOOST_CHECK(CalendarPeriod().isZero());
    BOOST_CHECK(CalendarPeriod(0, -1, 0).isNegative());
    BOOST_CHECK(CalendarPeriod(1, -1, 0).isNegative());
    BOOST_CHECK_EQUAL(CalendarPeriod(1, -12, 0).totalMonths(), 0);

    // the total number of months does not overflow
    CalendarPeriod large(numeric_limits<Integer>::max(), 11, 0);
    BOOST_CHECK_EQUAL(large.totalMonths(), static_cast<long long>(numeric_limits<Integer>::max()) * 12 + 11);
}

BOOST_AUTO_TEST_CASE(testFactories) {

    BOOST_TEST_MESSAGE("Testing calendar period factories...");

    BOOST_CHECK_EQUAL(CalendarPeriod::ofYears(2), CalendarPeriod(2, 0, 0));
    BOOST_CHECK_EQUAL(CalendarPeriod::ofMonths(3), CalendarPeriod(0, 3, 0));
    BOOST_CHECK_EQUAL(CalendarPeriod::ofDays(4), CalendarPeriod(0, 0, 4));
    BOOST_CHECK_EQUAL(CalendarPeriod::ofWeeks(2), CalendarPeriod(0, 0, 14));
    BOOST_CHECK_THROW(CalendarPeriod::ofWeeks(numeric_limits<Integer>::max()), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testParsing) {

    BOOST_TEST_MESSAGE("Testing calendar period parsing...");

    Size len = sizeof(period_data) / sizeof(period_data[0]);
    for (Size i = 0; i < len; ++i) {
        string str(period_data[i].str);
        CalendarPeriod expected(period_data[i].years, period_data[i].months, period_data[i].days);
        try {
            CalendarPeriod p = CalendarPeriod::parse(str);
            BOOST_CHECK_MESSAGE(p == expected, "Period parser(" << str << ") returned " << p << ", expected "
                                                                << expected);
        } catch (const std::exception& e) {
            BOOST_ERROR("Period parser failed to parse " << str << ": " << e.what());
        }
    }

    BOOST_CHECK_THROW(CalendarPeriod::parse(""), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("3M"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P3X"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("PM"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P1M2Y"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P3M "), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P1.5Y"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P99999999999Y"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P999999999999999999999D"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("P400000000W"), QuantLib::Error);

    // negating the smallest component must be range checked, not overflow
    BOOST_CHECK_THROW(CalendarPeriod::parse("-P-9223372036854775808D"), QuantLib::Error);
    BOOST_CHECK_THROW(CalendarPeriod::parse("-P-2147483648M"), QuantLib::Error);
    BOOST_CHECK_EQUAL(CalendarPeriod::parse("-P-2147483647D"), CalendarPeriod::ofDays(2147483647));
}

BOOST_AUTO_TEST_CASE(testToString) {

    BOOST_TEST_MESSAGE("Testing calendar period string representation...");

    BOOST_CHECK_EQUAL(CalendarPeriod().toString(), "P0D");
    BOOST_CHECK_EQUAL(CalendarPeriod(1, 6, 0).toString(), "P1Y6M");
    BOOST_CHECK_EQUAL(CalendarPeriod(0, 0, 14).toString(), "P14D");
    BOOST_CHECK_EQUAL(CalendarPeriod(1, 0, 5).toString(), "P1Y5D");
    BOOST_CHECK_EQUAL(CalendarPeriod(0, 0, -3).toString(), "P-3D");
    BOOST_CHECK_EQUAL(CalendarPeriod(10000, 0, 0).toString(), "P10000Y");

    // the string representation reads back to the same period
    CalendarPeriod p(2, 3, 4);
    BOOST_CHECK_EQUAL(CalendarPeriod::parse(p.toString()), p);
}

BOOST_AUTO_TEST_CASE(testNormalized) {

    BOOST_TEST_MESSAGE("Testing calendar period normalization...");

    BOOST_CHECK_EQUAL(CalendarPeriod(0, 18, 0).normalized(), CalendarPeriod(1, 6, 0));
    BOOST_CHECK_EQUAL(CalendarPeriod(0, 12, 5).normalized(), CalendarPeriod(1, 0, 5));
    BOOST_CHECK_EQUAL(CalendarPeriod(1, 6, 0).normalized(), CalendarPeriod(1, 6, 0));
    BOOST_CHECK_EQUAL(CalendarPeriod(0, 0, 400).normalized(), CalendarPeriod(0, 0, 400));
    BOOST_CHECK_EQUAL(CalendarPeriod(0, -18, 0).normalized(), CalendarPeriod(-1, -6, 0));
    BOOST_CHECK_EQUAL(CalendarPeriod(1, -1, 0).normalized(), CalendarPeriod(0, 11, 0));
}

BOOST_AUTO_TEST_CASE(testUnits) {

    BOOST_TEST_MESSAGE("Testing calendar period units...");

    CalendarPeriod p(1, 2, 14);
    BOOST_CHECK_EQUAL(p.get(Years), 1);
    BOOST_CHECK_EQUAL(p.get(Months), 2);
    BOOST_CHECK_EQUAL(p.get(Days), 14);
    BOOST_CHECK_THROW(p.get(Weeks), QuantLib::Error);

    vector<TimeUnit> units = p.units();
    vector<TimeUnit> expected = {Years, Months, Days};
    BOOST_CHECK_EQUAL_COLLECTIONS(units.begin(), units.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(testDateArithmetic) {

    BOOST_TEST_MESSAGE("Testing calendar period date arithmetic...");

    // end of month is clamped
    BOOST_CHECK_EQUAL(CalendarPeriod(0, 1, 0).addTo(Date(31, Jan, 2020)), Date(29, Feb, 2020));
    BOOST_CHECK_EQUAL(Date(31, Jan, 2021) + CalendarPeriod(0, 1, 0), Date(28, Feb, 2021));

    // years and months are added in one step
    BOOST_CHECK_EQUAL(Date(31, Jan, 2019) + CalendarPeriod(1, 1, 0), Date(29, Feb, 2020));
    BOOST_CHECK_EQUAL(Date(29, Feb, 2020) + CalendarPeriod(1, 0, 0), Date(28, Feb, 2021));

    // months before days
    BOOST_CHECK_EQUAL(Date(31, Jan, 2020) + CalendarPeriod(0, 1, 1), Date(1, Mar, 2020));
    BOOST_CHECK_EQUAL(Date(15, Jan, 2020) + CalendarPeriod(0, 0, 20), Date(4, Feb, 2020));

    BOOST_CHECK_EQUAL(CalendarPeriod(0, 1, 0).subtractFrom(Date(31, Mar, 2020)), Date(29, Feb, 2020));
    BOOST_CHECK_EQUAL(Date(1, Mar, 2021) - CalendarPeriod(1, 0, 1), Date(29, Feb, 2020));
    BOOST_CHECK_EQUAL(Date(15, Mar, 2021) - CalendarPeriod(1, 2, 0), Date(15, Jan, 2020));

    // the date range of QuantLib is exceeded
    BOOST_CHECK_THROW(Date(1, Jan, 2020) + CalendarPeriod(10000, 0, 0), QuantLib::Error);
    BOOST_CHECK_THROW(Date(1, Jan, 2020) - CalendarPeriod(0, 12000, 0), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testEqualityAndHash) {

    BOOST_TEST_MESSAGE("Testing calendar period equality and hashing...");

    BOOST_CHECK(CalendarPeriod(0, 12, 0) != CalendarPeriod(1, 0, 0));
    BOOST_CHECK(CalendarPeriod::ofWeeks(2) == CalendarPeriod::ofDays(14));
    BOOST_CHECK_EQUAL(hash_value(CalendarPeriod(1, 2, 3)), hash_value(CalendarPeriod(1, 2, 3)));

    unordered_set<CalendarPeriod> periods = {CalendarPeriod::ofWeeks(2), CalendarPeriod::ofDays(14),
                                             CalendarPeriod::ofMonths(12), CalendarPeriod::ofYears(1)};
    BOOST_CHECK_EQUAL(periods.size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
