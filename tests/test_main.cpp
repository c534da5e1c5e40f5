#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <reactivedom/reactive/Scheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {

auto envFlag(char const* name) -> bool {
    char const* value = std::getenv(name);
    return value != nullptr && std::strcmp(value, "0") != 0;
}

// Prints each test case when REACTIVEDOM_TEST_VERBOSE is set and flags tests
// that leave undelivered notifications on the thread's scheduler.
struct SchedulerLeakListener : public doctest::IReporter {
    explicit SchedulerLeakListener(doctest::ContextOptions const&) : verbose_(envFlag("REACTIVEDOM_TEST_VERBOSE")) {}

    void test_case_start(doctest::TestCaseData const& in) override {
        current_ = in.m_name;
        if (!verbose_)
            return;
        std::lock_guard<std::mutex> lock(RD::TaggedLogger::coutMutex);
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void test_case_end(doctest::CurrentTestCaseStats const&) override {
        auto const& scheduler = RD::Scheduler::current();
        if (!scheduler.hasPending())
            return;
        std::lock_guard<std::mutex> lock(RD::TaggedLogger::coutMutex);
        std::cout << "Warning: '" << current_ << "' left " << scheduler.pendingCount()
                  << " pending cell notifications" << std::endl;
    }
    void subcase_start(doctest::SubcaseSignature const& in) override {
        if (!verbose_)
            return;
        std::lock_guard<std::mutex> lock(RD::TaggedLogger::coutMutex);
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }

    void report_query(doctest::QueryData const&) override {}
    void test_run_start() override {}
    void test_run_end(doctest::TestRunStats const&) override {}
    void test_case_reenter(doctest::TestCaseData const&) override {}
    void test_case_exception(doctest::TestCaseException const&) override {}
    void subcase_end() override {}
    void log_assert(doctest::AssertData const&) override {}
    void log_message(doctest::MessageData const&) override {}
    void test_case_skipped(doctest::TestCaseData const&) override {}

private:
    bool        verbose_ = false;
    char const* current_ = "";
};

} // namespace

REGISTER_LISTENER("scheduler_leaks", 1, SchedulerLeakListener);

int main(int argc, char** argv) {
    // Contained faults are exercised on purpose; keep stderr quiet unless asked.
    RD::set_logging_enabled(false);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

    bool const enableLog = envFlag("REACTIVEDOM_LOG");
    if (enableLog) {
        RD::set_thread_name("TestMain");
        RD::set_logging_enabled(true);
        rd_log("Starting test execution", "TEST");
    }

    int const res = context.run();

    if (enableLog)
        rd_log(res == 0 ? "All tests passed" : "Some tests failed", "TEST");
    return res;
}
