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

/*! \file frqt/log.hpp
    \brief routes frq::data::Log messages into the Boost.Test log
*/

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>
#include <frqd/utilities/log.hpp>

#include <string>
#include <vector>

namespace frq {
namespace test {

//! Forwards library log messages, e.g. alias registration and resolution, as test messages
/*! Visible when the suite runs with --log_level=message or lower. */
class BoostTestLogger : public frq::data::Logger {
public:
    BoostTestLogger() : frq::data::Logger("BoostTestLogger") {}
    void log(unsigned, const std::string& msg) override { BOOST_TEST_MESSAGE(msg); }
};

//! Switches library logging on for the test run if --frq_log_mask[=<mask>] is on the command line
/*! Without an explicit mask every level is logged. Any previously registered loggers are replaced by a
    BoostTestLogger. */
inline void setupTestLogging(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (!boost::starts_with(argv[i], "--frq_log_mask"))
            continue;
        unsigned int mask = FRQ_ALERT | FRQ_CRITICAL | FRQ_ERROR | FRQ_WARNING | FRQ_NOTICE | FRQ_DEBUG | FRQ_DATA;
        std::vector<std::string> tokens;
        boost::split(tokens, argv[i], boost::is_any_of("="));
        if (tokens.size() > 1)
            mask = boost::lexical_cast<unsigned int>(tokens[1]);

        frq::data::Log& log = frq::data::Log::instance();
        log.removeAllLoggers();
        log.registerLogger(QuantLib::ext::make_shared<BoostTestLogger>());
        log.setMask(mask);
        log.switchOn();
    }
}

} // namespace test
} // namespace frq
