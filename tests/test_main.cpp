#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef TP_LOG_DEBUG
        std::lock_guard<std::mutex> lock(TP::TaggedLogger::coutMutex);
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
#ifdef TP_LOG_DEBUG
        std::lock_guard<std::mutex> lock(TP::TaggedLogger::coutMutex);
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
#ifdef TP_LOG_DEBUG
    TP::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);

#ifdef TP_LOG_DEBUG
    TP::set_thread_name("TestMain");
    bool enableLog = false;
    if (const char* _env_log = std::getenv("TREEPATCH_LOG")) {
        if (std::strcmp(_env_log, "0") != 0) enableLog = true;
    }
#endif

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef TP_LOG_DEBUG
    // TREEPATCH_LOG set (and not "0") turns logging on for the run.
    if (enableLog) {
        TP::set_logging_enabled(true);
        tp_log("Starting test execution", "TEST", "INFO");
    }
#endif

    int res = context.run();

#ifdef TP_LOG_DEBUG
    if (enableLog) {
        if (res == 0) {
            tp_log("All tests passed successfully", "TEST", "SUCCESS");
        } else {
            tp_log("Some tests failed", "TEST", "FAILURE");
        }
    }
#endif

    return res;
}
