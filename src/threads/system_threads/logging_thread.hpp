#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <atomic>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace ChartAnalyzer {
namespace Threads {

/**
 * Consumer side of the log pipeline.
 * Runs until the logger stops, writing each drained batch to the run log file and,
 * when enabled, to stderr. Lines still queued at stop are written before exit.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<ChartAnalyzer::Logging::AsyncLogger> logger,
                  ChartAnalyzer::Logging::LoggingContext& shared_context,
                  std::atomic<unsigned long>& flush_count,
                  const ChartAnalyzer::Config::LoggingConfig& logging_config)
        : logger_ptr(std::move(logger)), logging_context(&shared_context), flushes(&flush_count),
          flush_interval_milliseconds(logging_config.flush_interval_milliseconds) {}

    void operator()();

private:
    std::shared_ptr<ChartAnalyzer::Logging::AsyncLogger> logger_ptr;
    ChartAnalyzer::Logging::LoggingContext* logging_context;
    std::atomic<unsigned long>* flushes;
    int flush_interval_milliseconds;

    void run_until_stopped(std::ofstream& log_file);
    void write_batch(std::vector<std::string>& batch, std::ofstream& log_file);
};

} // namespace Threads
} // namespace ChartAnalyzer

#endif // LOGGING_THREAD_HPP
