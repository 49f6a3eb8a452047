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

/*! \file frqd/utilities/parsers.hpp
    \brief Map text representations to periods and frequencies
    \ingroup utilities
*/

#pragma once

#include <frqd/time/periodicfrequency.hpp>

#include <boost/optional.hpp>

#include <string>

namespace frq {
namespace data {

//! Convert text to CalendarPeriod
/*!
  The text is an ISO-8601 period, the leading P may be omitted, e.g. "P1Y6M" or "2W".
  \ingroup utilities
 */
CalendarPeriod parseCalendarPeriod(const std::string& s);

//! Convert text to PeriodicFrequency
/*!
  Accepts the aliases registered with the FrequencyParser, e.g. "Quarterly" or "Q", as well as
  anything PeriodicFrequency::parse() understands, e.g. "3M", "P2W" or "Term".
  Throws InvalidFrequencyError if the text is neither.
  \ingroup utilities
 */
PeriodicFrequency parsePeriodicFrequency(const std::string& s);

//! Attempt to convert text to PeriodicFrequency
/*!
  \param s The string we wish to convert to a PeriodicFrequency
  \param error If given, receives the reason for the failure
  \return The frequency or none if the conversion failed
  \ingroup utilities
 */
boost::optional<PeriodicFrequency> tryParsePeriodicFrequency(const std::string& s, std::string* error = nullptr);

} // namespace data
} // namespace frq
