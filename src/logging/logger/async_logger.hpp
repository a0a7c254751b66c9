#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "configs/system_config.hpp"

namespace ChartAnalyzer {
namespace Logging {

constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

/**
 * Producer side of the log pipeline.
 * Any thread enqueues formatted lines; the logging thread drains them in arrival order
 * and owns every write to the log file and the console.
 */
class AsyncLogger {
public:
    AsyncLogger(const std::string& log_file_path, bool mirror_to_console)
        : file_path(log_file_path), console_output_enabled(mirror_to_console) {}

    const std::string& get_file_path() const { return file_path; }
    bool is_console_output_enabled() const { return console_output_enabled; }
    bool is_running() const { return running.load(); }

    void start();
    void stop();
    void enqueue(const std::string& formatted_line);

    // Moves every pending line into drained_lines
    void drain(std::vector<std::string>& drained_lines);

    // Waits for a line, a stop or the timeout, then drains
    void wait_and_drain(int timeout_milliseconds, std::vector<std::string>& drained_lines);

private:
    const std::string file_path;
    const bool console_output_enabled;

    std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{false};

    void move_pending_lines(std::vector<std::string>& drained_lines);
};

// Shared by every thread of one run; each thread binds it before logging
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string run_folder;

    // "MAIN  " until the calling thread sets its own tag
    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);

private:
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
};

struct RunLogPaths {
    std::string run_folder;       // <runtime_logs>/run_<stamp>_<hash>
    std::string log_file_path;    // <run_folder>/<base>_<stamp>_<hash><ext>
};

// Pads or truncates to LOG_TAG_WIDTH characters
std::string format_thread_tag(const std::string& tag_value);

// "<time> [<tag>]   <message>\n"
std::string format_log_line(const std::string& timestamp, const std::string& thread_tag, const std::string& message);

std::string get_git_commit_hash();
std::string generate_timestamped_log_filename(const std::string& base_filename, const std::string& run_suffix);
RunLogPaths make_run_log_paths(const ChartAnalyzer::Config::LoggingConfig& logging_config,
                               const std::string& run_stamp, const std::string& commit_hash);

void set_log_thread_tag(const std::string& thread_tag_value);

// Enqueues onto the bound logger; before one is installed the line goes to stderr
void log_message(const std::string& message, const std::string& log_file_path);

// Validates the config, creates the run folder and installs the logger on the bound context
std::shared_ptr<AsyncLogger> initialize_application_foundation(const ChartAnalyzer::Config::SystemConfig& config);

// Throws when the calling thread has no bound context
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);
bool has_logging_context();

} // namespace Logging
} // namespace ChartAnalyzer

#endif // ASYNC_LOGGER_HPP
