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

/*! \file frqd/utilities/invalidfrequencyerror.hpp
    \brief Error raised when a periodic frequency cannot be built, parsed or evaluated
    \ingroup utilities
*/

#pragma once

#include <ql/errors.hpp>

#include <boost/current_function.hpp>

#include <sstream>
#include <string>

namespace frq {
namespace data {

//! Invalid frequency error
/*! Raised for zero, negative or oversized periods, unparsable frequency strings and frequencies
    for which no integral number of events per year exists. Calendar arithmetic failures are
    not reported through this class, they surface as plain QuantLib::Error.

    \ingroup utilities
*/
class InvalidFrequencyError : public QuantLib::Error {
public:
    InvalidFrequencyError(const std::string& file, long line, const std::string& functionName,
                          const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message), message_(message) {}

    //! The message without file and line decorations
    const std::string& message() const { return message_; }

private:
    std::string message_;
};

} // namespace data
} // namespace frq

/*! \def FRQ_FAIL_FREQUENCY
    \brief throw an InvalidFrequencyError with the given message
*/
#define FRQ_FAIL_FREQUENCY(message)                                                                                    \
    do {                                                                                                               \
        std::ostringstream _frq_msg_stream;                                                                            \
        _frq_msg_stream << message;                                                                                    \
        throw frq::data::InvalidFrequencyError(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, _frq_msg_stream.str());     \
    } while (false)

/*! \def FRQ_REQUIRE_FREQUENCY
    \brief throw an InvalidFrequencyError if the given condition is not met
*/
#define FRQ_REQUIRE_FREQUENCY(condition, message)                                                                      \
    if (!(condition)) {                                                                                                \
        FRQ_FAIL_FREQUENCY(message);                                                                                   \
    } else
