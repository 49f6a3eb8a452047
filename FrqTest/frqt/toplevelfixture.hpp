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

/*! \file frqt/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <frqd/utilities/frequencyparser.hpp>
#include <frqd/utilities/log.hpp>

namespace frq {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture() : logEnabled_(frq::data::Log::instance().enabled()), logMask_(frq::data::Log::instance().mask()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Clear custom frequency aliases
        frq::data::FrequencyParser::instance().reset();
        // Restore the log settings
        if (logEnabled_)
            frq::data::Log::instance().switchOn();
        else
            frq::data::Log::instance().switchOff();
        frq::data::Log::instance().setMask(logMask_);
    }

private:
    bool logEnabled_;
    unsigned logMask_;
};

} // namespace test
} // namespace frq
