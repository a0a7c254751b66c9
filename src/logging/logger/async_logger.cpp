#include "async_logger.hpp"
#include "analyzer/config_loader/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ChartAnalyzer {
namespace Logging {

namespace {
    thread_local LoggingContext* bound_logging_context = nullptr;

    void write_to_stderr(const std::string& text) {
        std::cerr << text << std::flush;
    }
}

// ========================================================================
// CONTEXT
// ========================================================================

LoggingContext* get_logging_context() {
    if (!bound_logging_context) {
        throw std::runtime_error("Logging context not initialized for current thread - system must fail without context");
    }
    return bound_logging_context;
}

void set_logging_context(LoggingContext& context) {
    bound_logging_context = &context;
}

bool has_logging_context() {
    return bound_logging_context != nullptr;
}

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> tag_lock(thread_tag_mutex);
    auto tag_iterator = thread_tags.find(std::this_thread::get_id());
    return tag_iterator != thread_tags.end() ? tag_iterator->second : format_thread_tag("MAIN");
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = format_thread_tag(tag_value);
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

// ========================================================================
// LINE FORMATTING AND SUBMISSION
// ========================================================================

std::string format_thread_tag(const std::string& tag_value) {
    std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
    tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
    return tag_string;
}

std::string format_log_line(const std::string& timestamp, const std::string& thread_tag, const std::string& message) {
    return timestamp + " [" + thread_tag + "]   " + message + "\n";
}

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* logging_context = get_logging_context();
        std::string log_line = format_log_line(TimeUtils::get_current_human_readable_time(),
                                               logging_context->get_thread_tag(), message);

        if (logging_context->async_logger) {
            logging_context->async_logger->enqueue(log_line);
            return;
        }

        // Before the logger exists: stderr only, stdout is reserved for command output
        {
            std::lock_guard<std::mutex> console_lock(logging_context->console_mutex);
            write_to_stderr(log_line);
        }
        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (!log_file_stream.is_open()) {
                write_to_stderr("ERROR: Failed to open log file: " + log_file_path + "\n");
                return;
            }
            log_file_stream << log_line;
        }
    } catch (const std::exception& logging_error) {
        write_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(logging_error.what()) + "\n");
        write_to_stderr(message + "\n");
    }
}

// ========================================================================
// QUEUE
// ========================================================================

void AsyncLogger::start() {
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_condition.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        pending_lines.push_back(formatted_line);
    }
    queue_condition.notify_one();
}

void AsyncLogger::drain(std::vector<std::string>& drained_lines) {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    move_pending_lines(drained_lines);
}

void AsyncLogger::wait_and_drain(int timeout_milliseconds, std::vector<std::string>& drained_lines) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    queue_condition.wait_for(queue_lock, std::chrono::milliseconds(timeout_milliseconds),
                             [this] { return !pending_lines.empty() || !running.load(); });
    move_pending_lines(drained_lines);
}

void AsyncLogger::move_pending_lines(std::vector<std::string>& drained_lines) {
    while (!pending_lines.empty()) {
        drained_lines.push_back(std::move(pending_lines.front()));
        pending_lines.pop_front();
    }
}

// ========================================================================
// RUN FOLDER
// ========================================================================

std::string get_git_commit_hash() {
    FILE* pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!pipe) {
        return "unknown";
    }

    std::string commit_hash;
    char buffer[128];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        commit_hash += buffer;
    }
    pclose(pipe);

    while (!commit_hash.empty() && (commit_hash.back() == '\n' || commit_hash.back() == '\r')) {
        commit_hash.pop_back();
    }
    return commit_hash.empty() ? "unknown" : commit_hash;
}

std::string generate_timestamped_log_filename(const std::string& base_filename, const std::string& run_suffix) {
    std::filesystem::path base_path(base_filename);
    std::filesystem::path stamped_name = base_path.stem().string() + "_" + run_suffix + base_path.extension().string();
    return (base_path.parent_path() / stamped_name).string();
}

RunLogPaths make_run_log_paths(const ChartAnalyzer::Config::LoggingConfig& logging_config,
                               const std::string& run_stamp, const std::string& commit_hash) {
    std::string run_suffix = run_stamp + "_" + commit_hash;

    RunLogPaths run_paths;
    run_paths.run_folder = (std::filesystem::path(logging_config.runtime_logs_directory) / ("run_" + run_suffix)).string();

    // Only the file name of log_file is kept; the run folder decides the directory
    std::string base_filename = (std::filesystem::path(run_paths.run_folder) /
                                 std::filesystem::path(logging_config.log_file).filename()).string();
    run_paths.log_file_path = generate_timestamped_log_filename(base_filename, run_suffix);
    return run_paths;
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const ChartAnalyzer::Config::SystemConfig& config) {
    LoggingContext* logging_context = get_logging_context();

    std::string configuration_error_message;
    if (!ChartAnalyzer::Config::validate_config(config, configuration_error_message)) {
        write_to_stderr("ERROR: Config error: " + configuration_error_message + "\n");
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    RunLogPaths run_paths = make_run_log_paths(config.logging, TimeUtils::get_current_log_filename_stamp(), get_git_commit_hash());
    try {
        std::filesystem::create_directories(run_paths.run_folder);
    } catch (const std::filesystem::filesystem_error& filesystem_error) {
        log_message(std::string("CRITICAL ERROR: Failed to create run folder: ") + filesystem_error.what(), "");
        throw std::runtime_error("Failed to create run folder: " + run_paths.run_folder);
    }

    auto logger_instance = std::make_shared<AsyncLogger>(run_paths.log_file_path, config.logging.console_output_enabled);
    logging_context->run_folder = run_paths.run_folder;
    logging_context->async_logger = logger_instance;
    set_log_thread_tag("MAIN");
    return logger_instance;
}

} // namespace Logging
} // namespace ChartAnalyzer
