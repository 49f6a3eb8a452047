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

/*! \file frqd/utilities/frequencyparser.hpp
    \brief frequency alias parser singleton class
    \ingroup utilities
*/

#pragma once

#include <frqd/time/periodicfrequency.hpp>

#include <ql/patterns/singleton.hpp>

#include <boost/optional.hpp>
#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>

#include <map>
#include <string>
#include <type_traits>
#include <vector>

namespace frq {
namespace data {

//! Frequency alias parser
/*! Holds named aliases for periodic frequencies, e.g. "Quarterly" or "Q" for P3M, on top of
    the ISO-8601 form understood by PeriodicFrequency::parse(). It starts with the QuantLib
    frequency names and their one letter codes, further aliases can be added at run time.

    Alias lookups are case sensitive.

    \ingroup utilities
*/
class FrequencyParser : public QuantLib::Singleton<FrequencyParser, std::integral_constant<bool, true>> {
public:
    FrequencyParser();

    //! The frequency registered under \p alias, none if there is no such alias
    boost::optional<PeriodicFrequency> lookup(const std::string& alias) const;
    //! True if \p alias is registered
    bool hasAlias(const std::string& alias) const;
    //! All registered aliases in lexicographic order
    std::vector<std::string> aliases() const;

    /*! Registers \p alias for \p frequency, replacing an existing alias of the same name.
        Throws if \p alias is empty.
    */
    void addAlias(const std::string& alias, const PeriodicFrequency& frequency);
    //! Throws if \p alias is not registered
    void removeAlias(const std::string& alias);

    //! Restores the default aliases
    void reset();

private:
    mutable boost::shared_mutex mutex_;
    std::map<std::string, PeriodicFrequency> aliases_;
};

} // namespace data
} // namespace frq
