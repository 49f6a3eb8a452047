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

/*! \file frqd/frqdata.hpp
    \brief Convenience header including the whole library
*/

#pragma once

#include <frqd/version.hpp>

#include <frqd/time/calendarperiod.hpp>
#include <frqd/time/periodicfrequency.hpp>

#include <frqd/utilities/frequencyparser.hpp>
#include <frqd/utilities/invalidfrequencyerror.hpp>
#include <frqd/utilities/log.hpp>
#include <frqd/utilities/parsers.hpp>
#include <frqd/utilities/to_string.hpp>
