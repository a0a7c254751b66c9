#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "logging/logger/async_logger.hpp"

using ChartAnalyzer::Logging::LoggingContext;

namespace {
    // Components log through the thread-bound context; without a logger lines go to stderr
    LoggingContext test_logging_context;
}

struct LoggingContextListener : Catch::TestEventListenerBase {
    using TestEventListenerBase::TestEventListenerBase;

    void testCaseStarting(Catch::TestCaseInfo const& test_info) override {
        ChartAnalyzer::Logging::set_logging_context(test_logging_context);
        TestEventListenerBase::testCaseStarting(test_info);
    }
};

CATCH_REGISTER_LISTENER(LoggingContextListener)
