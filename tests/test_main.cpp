#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef LM_LOG_DEBUG
        std::lock_guard<std::mutex> lock(LM::TaggedLogger::coutMutex);
#endif
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
#ifdef LM_LOG_DEBUG
        std::lock_guard<std::mutex> lock(LM::TaggedLogger::coutMutex);
#endif
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
#ifdef LM_LOG_DEBUG
    LM::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);

#ifdef LM_LOG_DEBUG
    LM::set_thread_name("TestMain");
    // LOOM_LOG set to anything but "0" turns tracing on.
    bool enableLog = false;
    if (const char* env_log = std::getenv("LOOM_LOG")) {
        if (std::strcmp(env_log, "0") != 0) enableLog = true;
    }
#endif

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef LM_LOG_DEBUG
    if (enableLog) {
        LM::set_logging_enabled(true);
        lm_log("Starting test execution", "TEST", "INFO");
    }
#endif

    int res = context.run();

#ifdef LM_LOG_DEBUG
    if (enableLog) {
        if (res == 0) {
            lm_log("All tests passed successfully", "TEST", "SUCCESS");
        } else {
            lm_log("Some tests failed", "TEST", "FAILURE");
        }
        LM::flush_log();
    }
#endif

    return res;
}
