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

#include <boost/algorithm/string/predicate.hpp>
#include <boost/test/unit_test.hpp>
#include <frqd/utilities/frequencyparser.hpp>
#include <frqd/utilities/log.hpp>
#include <frqd/utilities/parsers.hpp>
#include <frqt/log.hpp>
#include <frqt/toplevelfixture.hpp>

using namespace QuantLib;
using namespace frq::data;
using namespace std;

namespace {

// Registers a buffer logger for the duration of a test case
class BufferLoggerFixture : public frq::test::TopLevelFixture {
public:
    BufferLoggerFixture() : logger(QuantLib::ext::make_shared<BufferLogger>()) {
        Log::instance().registerLogger(logger);
        Log::instance().setMask(255);
        Log::instance().switchOn();
    }
    ~BufferLoggerFixture() { Log::instance().removeLogger(BufferLogger::name); }

    vector<string> messages() {
        vector<string> result;
        while (logger->hasNext())
            result.push_back(logger->next());
        return result;
    }

    QuantLib::ext::shared_ptr<BufferLogger> logger;
};

// Resolves an alias from inside the log callback
class AliasLookupLogger : public Logger {
public:
    AliasLookupLogger(const string& alias) : Logger("AliasLookupLogger"), alias_(alias), lookups_(0) {}
    void log(unsigned, const string&) override {
        if (FrequencyParser::instance().lookup(alias_))
            ++lookups_;
    }
    Size lookups() const { return lookups_; }

private:
    string alias_;
    Size lookups_;
};

} // namespace

BOOST_AUTO_TEST_SUITE(FrqDataTestSuite)

BOOST_FIXTURE_TEST_SUITE(LogTests, BufferLoggerFixture)

BOOST_AUTO_TEST_CASE(testLogLevels) {

    BOOST_TEST_MESSAGE("Testing log levels and mask...");

    DLOG("debug message " << 42);
    WLOG("warning message");
    vector<string> msgs = messages();
    BOOST_REQUIRE_EQUAL(msgs.size(), 2u);
    BOOST_CHECK(boost::contains(msgs[0], "DEBUG"));
    BOOST_CHECK(boost::contains(msgs[0], "debug message 42"));
    BOOST_CHECK(boost::contains(msgs[1], "WARNING"));

    Log::instance().setMask(FRQ_ALERT | FRQ_WARNING);
    DLOG("filtered");
    ALOG("alert");
    msgs = messages();
    BOOST_REQUIRE_EQUAL(msgs.size(), 1u);
    BOOST_CHECK(boost::contains(msgs[0], "alert"));

    Log::instance().switchOff();
    ALOG("off");
    BOOST_CHECK(!logger->hasNext());
}

BOOST_AUTO_TEST_CASE(testLoggerRegistry) {

    BOOST_TEST_MESSAGE("Testing logger registration...");

    BOOST_CHECK(Log::instance().hasLogger(BufferLogger::name));
    BOOST_CHECK(Log::instance().logger(BufferLogger::name) == logger);
    BOOST_CHECK_THROW(Log::instance().logger("NoSuchLogger"), QuantLib::Error);
    BOOST_CHECK_THROW(Log::instance().removeLogger("NoSuchLogger"), QuantLib::Error);
    BOOST_CHECK_THROW(logger->next(), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testAliasLogging) {

    BOOST_TEST_MESSAGE("Testing log messages of the frequency alias parser...");

    FrequencyParser::instance().addAlias("Fortnightly", PeriodicFrequency::P2W);
    FrequencyParser::instance().addAlias("Fortnightly", PeriodicFrequency::P1W);
    parsePeriodicFrequency("Fortnightly");

    vector<string> msgs = messages();
    BOOST_REQUIRE_EQUAL(msgs.size(), 3u);
    BOOST_CHECK(boost::contains(msgs[0], "added alias Fortnightly for P2W"));
    BOOST_CHECK(boost::contains(msgs[1], "WARNING"));
    BOOST_CHECK(boost::contains(msgs[1], "now mapped to P1W"));
    BOOST_CHECK(boost::contains(msgs[2], "Fortnightly resolved to P1W"));
}

BOOST_AUTO_TEST_CASE(testAliasLookupFromLogger) {

    BOOST_TEST_MESSAGE("Testing a logger that resolves aliases while the alias table is modified...");

    QuantLib::ext::shared_ptr<AliasLookupLogger> lookupLogger = QuantLib::ext::make_shared<AliasLookupLogger>("Q");
    Log::instance().registerLogger(lookupLogger);

    FrequencyParser::instance().addAlias("Fortnightly", PeriodicFrequency::P2W);
    FrequencyParser::instance().addAlias("Fortnightly", PeriodicFrequency::P1W);
    FrequencyParser::instance().removeAlias("Fortnightly");

    Log::instance().removeLogger("AliasLookupLogger");
    BOOST_CHECK_EQUAL(lookupLogger->lookups(), 3u);
    BOOST_CHECK(!FrequencyParser::instance().hasAlias("Fortnightly"));
    BOOST_CHECK_EQUAL(messages().size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(TestLoggingSetupTests, frq::test::TopLevelFixture)

BOOST_AUTO_TEST_CASE(testLogMaskOption) {

    BOOST_TEST_MESSAGE("Testing the --frq_log_mask command line option...");

    bool registered = Log::instance().hasLogger("BoostTestLogger");
    Log::instance().switchOff();

    char program[] = "frqd-test-suite";
    char other[] = "--log_level=message";
    char* noLogging[] = {program, other};
    frq::test::setupTestLogging(2, noLogging);
    BOOST_CHECK(!Log::instance().enabled());

    char maskOption[] = "--frq_log_mask=8";
    char* withMask[] = {program, other, maskOption};
    frq::test::setupTestLogging(3, withMask);
    BOOST_CHECK(Log::instance().enabled());
    BOOST_CHECK_EQUAL(Log::instance().mask(), 8u);
    BOOST_CHECK(Log::instance().hasLogger("BoostTestLogger"));

    char plainOption[] = "--frq_log_mask";
    char* withoutMask[] = {program, plainOption};
    frq::test::setupTestLogging(2, withoutMask);
    BOOST_CHECK_EQUAL(Log::instance().mask(), 127u);

    if (!registered)
        Log::instance().removeLogger("BoostTestLogger");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
