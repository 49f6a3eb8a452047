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

/*! \file frqd/utilities/to_string.hpp
    \brief string conversion utilities
    \ingroup utilities
*/

#pragma once

#include <frqd/time/periodicfrequency.hpp>

#include <sstream>
#include <string>

namespace frq {
namespace data {

//! Convert CalendarPeriod to string
/*!
 Returns the ISO-8601 form, e.g. "P1Y6M", "P14D" or "P0D" for the zero period.
 \ingroup utilities
 */
std::string to_string(const CalendarPeriod& period);

//! Convert PeriodicFrequency to string
/*!
 Returns the canonical name, e.g. "P3M", "P2W" or "Term", which parsePeriodicFrequency() reads back.
 \ingroup utilities
 */
std::string to_string(const PeriodicFrequency& frequency);

//! Convert type to string
/*!
 \ingroup utilities
 */
template <class T> std::string to_string(const T& t) {
    std::ostringstream oss;
    oss << t;
    return oss.str();
}

} // namespace data
} // namespace frq
