#include "log/TaggedLogger.hpp"

#include <doctest/doctest.h>

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

#ifdef LM_LOG_DEBUG

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto output = captureStderr([] {
        LM::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([] {
        LM::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag");
        logger.flush();
    });
    CHECK(output.find("[TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("function_called_tag_is_skipped") {
    auto output = captureStderr([] {
        LM::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("noisy", std::source_location::current(), "Function Called", "Runtime");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("thread_name_is_used_in_output") {
    auto output = captureStderr([] {
        LM::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Compiler-1");
        logger.log_impl("with name", std::source_location::current(), "Test");
        logger.flush();
    });
    CHECK(output.find("[Compiler-1]") != std::string::npos);
}

TEST_CASE("global_wrappers_and_macro_emit_joined_tags") {
    auto output = captureStderr([] {
        LM::set_thread_name("WrapperThread");
        LM::set_logging_enabled(true);
        lm_log("via macro", "Alpha", "Beta");
        LM::flush_log();
        LM::set_logging_enabled(false);
    });
    CHECK(output.find("Alpha][Beta") != std::string::npos);
    CHECK(output.find("[WrapperThread]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        LM::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 90 "tests/unit/log/test_TaggedLogger.cpp"
        logger.flush();
    });
    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE

#else

TEST_SUITE("log.tagged_logger") {

TEST_CASE("lm_log_is_a_no_op_without_debug_logging") {
    auto output = [] {
        std::ostringstream buffer;
        auto*              original = std::cerr.rdbuf(buffer.rdbuf());
        lm_log("compiled out", "Test");
        std::cerr.rdbuf(original);
        return buffer.str();
    }();
    CHECK(output.empty());
}

} // TEST_SUITE

#endif // LM_LOG_DEBUG
