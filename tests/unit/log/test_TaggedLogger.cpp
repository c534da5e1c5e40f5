#include "log/TaggedLogger.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <source_location>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Sets or unsets one variable and restores the previous state on destruction.
class ScopedEnv {
public:
    ScopedEnv(std::string key, char const* value)
        : key_(std::move(key)) {
        if (char const* existing = std::getenv(key_.c_str()))
            previous_ = std::string{existing};
        if (value)
            setenv(key_.c_str(), value, 1);
        else
            unsetenv(key_.c_str());
    }

    ScopedEnv(ScopedEnv const&)            = delete;
    ScopedEnv& operator=(ScopedEnv const&) = delete;

    ~ScopedEnv() {
        if (previous_)
            setenv(key_.c_str(), previous_->c_str(), 1);
        else
            unsetenv(key_.c_str());
    }

private:
    std::string                key_;
    std::optional<std::string> previous_;
};

// Every logger variable unset, then the overrides applied on top.
class LoggerEnv {
public:
    LoggerEnv(std::initializer_list<std::pair<char const*, char const*>> overrides = {}) {
        for (auto const* name : {"REACTIVEDOM_LOG_ENABLED", "REACTIVEDOM_LOG", "REACTIVEDOM_LOG_CLEAR_DEFAULT_SKIPS",
                                 "REACTIVEDOM_LOG_ENABLE_TAGS", "REACTIVEDOM_LOG_SKIP_TAGS"})
            vars_.push_back(std::make_unique<ScopedEnv>(name, nullptr));
        for (auto const& [name, value] : overrides)
            vars_.push_back(std::make_unique<ScopedEnv>(name, value));
    }

private:
    std::vector<std::unique_ptr<ScopedEnv>> vars_;
};

// Runs fn against a fresh logger and returns what reached stderr; the
// logger is destroyed inside, which drains its queue.
auto captureLog(std::function<void(RD::TaggedLogger&)> const& fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    {
        RD::TaggedLogger logger;
        fn(logger);
    }
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("messages are dropped while logging is disabled") {
    LoggerEnv env;
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.log_impl("should not appear", std::source_location::current(), "Probe");
    });
    CHECK(output.empty());
}

TEST_CASE("REACTIVEDOM_LOG_ENABLED turns logging on") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.log_impl("cell 3 flushed", std::source_location::current(), "Probe");
    });
    CHECK(output.find("[Probe]") != std::string::npos);
    CHECK(output.find("cell 3 flushed") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("REACTIVEDOM_LOG accepts yes") {
    LoggerEnv env{{"REACTIVEDOM_LOG", "yes"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.log_impl("short switch", std::source_location::current(), "Probe");
    });
    CHECK(output.find("short switch") != std::string::npos);
}

TEST_CASE("default skips hide reactive chatter but not faults") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.log_impl("scheduled", std::source_location::current(), "Scheduler");
        logger.log_impl("subscribed", std::source_location::current(), "Cell");
        logger.log_impl("subscriber threw", std::source_location::current(), "ERROR", "SubscriberFault");
    });
    CHECK(output.find("scheduled") == std::string::npos);
    CHECK(output.find("subscribed") == std::string::npos);
    CHECK(output.find("[ERROR][SubscriberFault]") != std::string::npos);
}

TEST_CASE("clearing default skips lets INFO through") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}, {"REACTIVEDOM_LOG_CLEAR_DEFAULT_SKIPS", "true"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.log_impl("runtime configured", std::source_location::current(), "INFO");
    });
    CHECK(output.find("runtime configured") != std::string::npos);
}

TEST_CASE("enable tags restrict output to the listed tags") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}, {"REACTIVEDOM_LOG_ENABLE_TAGS", "ListFault"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.log_impl("kept", std::source_location::current(), "ListFault");
        logger.log_impl("mixed", std::source_location::current(), "ListFault", "Other");
    });
    CHECK(output.find("kept") != std::string::npos);
    CHECK(output.find("mixed") == std::string::npos);
}

TEST_CASE("skip tags are trimmed and extend the defaults") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}, {"REACTIVEDOM_LOG_SKIP_TAGS", " Noisy , Chatty "}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.log_impl("first", std::source_location::current(), "Chatty");
        logger.log_impl("second", std::source_location::current(), "Noisy");
        logger.log_impl("third", std::source_location::current(), "Quiet");
        logger.log_impl("fourth", std::source_location::current(), "Dom");
    });
    CHECK(output.find("first") == std::string::npos);
    CHECK(output.find("second") == std::string::npos);
    CHECK(output.find("third") != std::string::npos);
    CHECK(output.find("fourth") == std::string::npos);
}

TEST_CASE("thread names appear in the output") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.setThreadName("UiThread");
        logger.log_impl("named", std::source_location::current(), "Probe");
    });
    CHECK(output.find("[UiThread]") != std::string::npos);
}

TEST_CASE("setLoggingEnabled overrides the environment") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
        logger.setLoggingEnabled(false);
        logger.log_impl("silenced", std::source_location::current(), "Probe");
        logger.setLoggingEnabled(true);
        logger.log_impl("spoken", std::source_location::current(), "Probe");
    });
    CHECK(output.find("silenced") == std::string::npos);
    CHECK(output.find("spoken") != std::string::npos);
}

TEST_CASE("source location is shortened to parent directory and file") {
    LoggerEnv env{{"REACTIVEDOM_LOG_ENABLED", "1"}};
    auto output = captureLog([](RD::TaggedLogger& logger) {
#line 42 "deep/reactive/Flush.cpp"
        logger.log_impl("located", std::source_location::current(), "Probe");
#line 200 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("reactive/Flush.cpp:42") != std::string::npos);
}

TEST_CASE("rd_log_fault always tags ERROR") {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    RD::set_logging_enabled(true);
    rd_log_fault("evaluation failed", "EvaluationFault");
    std::this_thread::sleep_for(50ms);
    RD::set_logging_enabled(false);
    std::cerr.rdbuf(original);

    auto output = buffer.str();
    CHECK(output.find("EvaluationFault") != std::string::npos);
    CHECK(output.find("ERROR") != std::string::npos);
}

TEST_CASE("LogConfig reads the environment") {
    LoggerEnv env{{"REACTIVEDOM_LOG", "ON"}, {"REACTIVEDOM_LOG_ENABLE_TAGS", "Batch,ERROR"}};
    auto config = RD::LogConfig::fromEnvironment();
    CHECK(config.enabled);
    CHECK(config.skipTags.contains("Scheduler"));
    CHECK(config.enabledTags == std::set<std::string>{"Batch", "ERROR"});
    CHECK(config.accepts({"ERROR", "Batch"}));
    CHECK_FALSE(config.accepts({"ERROR", "ListFault"}));
}

TEST_CASE("LogConfig filters skipped tags") {
    RD::LogConfig config;
    CHECK_FALSE(config.enabled);
    CHECK(config.accepts({"ERROR", "MountFault"}));
    CHECK_FALSE(config.accepts({"Derive"}));
    config.skipTags.clear();
    CHECK(config.accepts({"Derive"}));
}

TEST_CASE("an explicit config bypasses the environment") {
    LoggerEnv     env;
    RD::LogConfig config;
    config.enabled  = true;
    config.skipTags = {"Hidden"};
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    {
        RD::TaggedLogger logger{config};
        CHECK(logger.config().skipTags == std::set<std::string>{"Hidden"});
        logger.log_impl("visible line", std::source_location::current(), "INFO");
        logger.log_impl("hidden line", std::source_location::current(), "Hidden");
    }
    std::cerr.rdbuf(original);
    CHECK(buffer.str().find("visible line") != std::string::npos);
    CHECK(buffer.str().find("hidden line") == std::string::npos);
}

TEST_CASE("formatLine joins tags and names the thread") {
    RD::TaggedLogger::LogMessage msg{.timestamp  = std::chrono::system_clock::now(),
                                     .tags       = {"ERROR", "ListFault"},
                                     .message    = "duplicate key",
                                     .threadName = "Main",
                                     .location   = std::source_location::current()};
    auto const line = RD::TaggedLogger::formatLine(msg);
    CHECK(line.find(" [ERROR][ListFault] [Main] [log/test_TaggedLogger.cpp:") != std::string::npos);
    CHECK(line.ends_with("] duplicate key\n"));
}

} // TEST_SUITE
