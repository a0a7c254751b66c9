#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <iostream>
#include <mutex>

using namespace ChartAnalyzer::Threads;
using namespace ChartAnalyzer::Logging;

void LoggingThread::operator()() {
    try {
        set_logging_context(*logging_context);
        set_log_thread_tag("LOGGER");

        std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            LoggingThreadLogs::log_log_file_open_failure(logger_ptr->get_file_path());
        }
        run_until_stopped(log_file);
    } catch (const std::exception& exception) {
        LoggingThreadLogs::log_thread_exception(exception.what());
    }
}

void LoggingThread::run_until_stopped(std::ofstream& log_file) {
    std::vector<std::string> batch;

    while (logger_ptr->is_running()) {
        try {
            logger_ptr->wait_and_drain(flush_interval_milliseconds, batch);
            if (!batch.empty()) {
                write_batch(batch, log_file);
                flushes->fetch_add(1);
            }
        } catch (const std::exception& exception) {
            LoggingThreadLogs::log_loop_iteration_exception(exception.what());
            batch.clear();
        }
    }

    LoggingThreadLogs::log_thread_exited();
    logger_ptr->drain(batch);
    write_batch(batch, log_file);
}

void LoggingThread::write_batch(std::vector<std::string>& batch, std::ofstream& log_file) {
    if (logger_ptr->is_console_output_enabled()) {
        std::lock_guard<std::mutex> console_lock(logging_context->console_mutex);
        for (const std::string& log_line : batch) {
            std::cerr << log_line;
        }
        std::cerr << std::flush;
    }
    if (log_file.is_open()) {
        for (const std::string& log_line : batch) {
            log_file << log_line;
        }
        log_file.flush();
    }
    batch.clear();
}
