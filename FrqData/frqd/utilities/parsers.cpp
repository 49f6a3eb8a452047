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

/*! \file frqd/utilities/parsers.cpp
    \brief Map text representations to periods and frequencies
    \ingroup utilities
*/

#include <frqd/utilities/frequencyparser.hpp>
#include <frqd/utilities/invalidfrequencyerror.hpp>
#include <frqd/utilities/log.hpp>
#include <frqd/utilities/parsers.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

using std::string;

namespace frq {
namespace data {

CalendarPeriod parseCalendarPeriod(const string& s) {
    string str = boost::trim_copy(s);
    return CalendarPeriod::parse(boost::istarts_with(str, "P") ? str : "P" + str);
}

PeriodicFrequency parsePeriodicFrequency(const string& s) {
    string str = boost::trim_copy(s);
    if (boost::optional<PeriodicFrequency> f = FrequencyParser::instance().lookup(str)) {
        DLOG("Frequency alias " << str << " resolved to " << *f);
        return *f;
    }
    return PeriodicFrequency::parse(str);
}

boost::optional<PeriodicFrequency> tryParsePeriodicFrequency(const string& s, string* error) {
    try {
        return parsePeriodicFrequency(s);
    } catch (const InvalidFrequencyError& e) {
        TLOG("String " << s << " is not a periodic frequency: " << e.message());
        if (error)
            *error = e.message();
        return boost::none;
    }
}

} // namespace data
} // namespace frq
