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

/*! \file frqd/utilities/frequencyparser.cpp
    \brief frequency alias parser singleton class
    \ingroup utilities
*/

#include <frqd/utilities/frequencyparser.hpp>
#include <frqd/utilities/log.hpp>

#include <ql/errors.hpp>

namespace frq {
namespace data {

FrequencyParser::FrequencyParser() { reset(); }

boost::optional<PeriodicFrequency> FrequencyParser::lookup(const std::string& alias) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = aliases_.find(alias);
    if (it == aliases_.end())
        return boost::none;
    return it->second;
}

bool FrequencyParser::hasAlias(const std::string& alias) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return aliases_.find(alias) != aliases_.end();
}

std::vector<std::string> FrequencyParser::aliases() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    for (auto const& a : aliases_)
        result.push_back(a.first);
    return result;
}

void FrequencyParser::addAlias(const std::string& alias, const PeriodicFrequency& frequency) {
    QL_REQUIRE(!alias.empty(), "FrequencyParser: alias must not be empty");
    boost::optional<PeriodicFrequency> previous;
    {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        auto it = aliases_.find(alias);
        if (it != aliases_.end()) {
            previous = it->second;
            aliases_.erase(it);
        }
        aliases_.insert(std::make_pair(alias, frequency));
    }
    // log without holding the lock, loggers may look up aliases themselves
    if (previous) {
        WLOG("FrequencyParser: alias " << alias << " was mapped to " << *previous << ", now mapped to "
                                       << frequency);
    } else {
        DLOG("FrequencyParser: added alias " << alias << " for " << frequency);
    }
}

void FrequencyParser::removeAlias(const std::string& alias) {
    {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        auto it = aliases_.find(alias);
        QL_REQUIRE(it != aliases_.end(), "FrequencyParser: no alias " << alias << " to remove");
        aliases_.erase(it);
    }
    DLOG("FrequencyParser: removed alias " << alias);
}

void FrequencyParser::reset() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    aliases_.clear();
    static const std::map<std::string, PeriodicFrequency> defaults = {
        {"Z", PeriodicFrequency::TERM},  {"Once", PeriodicFrequency::TERM},
        {"A", PeriodicFrequency::P12M},  {"Annual", PeriodicFrequency::P12M},
        {"S", PeriodicFrequency::P6M},   {"Semiannual", PeriodicFrequency::P6M},
        {"Q", PeriodicFrequency::P3M},   {"Quarterly", PeriodicFrequency::P3M},
        {"B", PeriodicFrequency::P2M},   {"Bimonthly", PeriodicFrequency::P2M},
        {"M", PeriodicFrequency::P1M},   {"Monthly", PeriodicFrequency::P1M},
        {"L", PeriodicFrequency::P4W},   {"Lunarmonth", PeriodicFrequency::P4W},
        {"W", PeriodicFrequency::P1W},   {"Weekly", PeriodicFrequency::P1W},
        {"D", PeriodicFrequency::P1D},   {"Daily", PeriodicFrequency::P1D}};
    aliases_ = defaults;
}

} // namespace data
} // namespace frq
