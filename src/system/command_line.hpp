#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ChartAnalyzer {
namespace System {

enum class CommandType { ANALYZE, INDICATORS, SCAN };

struct CommandLineOptions {
    CommandType command;
    std::vector<std::string> bar_files;
    std::string config_directory;

    // analyze
    std::optional<std::string> benchmark_file;        // Also accepted by scan
    std::optional<std::string> fundamentals_file;
    std::optional<std::string> symbol;
    bool print_summary;

    // scan
    std::optional<std::string> preset;
    std::optional<double> min_score;
    std::optional<double> max_score;
    std::optional<std::string> signal;
    std::optional<std::string> min_conviction;
    std::optional<std::string> trend;
    std::optional<int> stage;
    std::optional<double> min_volume_ratio;
    std::optional<int> max_results;

    CommandLineOptions() : command(CommandType::ANALYZE), config_directory("config"), print_summary(false) {}
};

class CommandLineError : public std::runtime_error {
public:
    explicit CommandLineError(const std::string& message) : std::runtime_error(message) {}
};

// Arguments exclude the program name. Throws CommandLineError on any usage problem.
CommandLineOptions parse_command_line(const std::vector<std::string>& arguments);

std::string command_name(CommandType command);
std::string usage_text();

} // namespace System
} // namespace ChartAnalyzer

#endif // COMMAND_LINE_HPP
