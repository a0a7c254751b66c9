#include "command_line.hpp"

namespace ChartAnalyzer {
namespace System {

namespace {
    double parse_double_option(const std::string& option_name, const std::string& value) {
        try {
            size_t consumed_characters = 0;
            double parsed_value = std::stod(value, &consumed_characters);
            if (consumed_characters == value.size()) {
                return parsed_value;
            }
        } catch (const std::exception&) {
            // Reported below with the option name
        }
        throw CommandLineError("Invalid number for " + option_name + ": '" + value + "'");
    }

    int parse_int_option(const std::string& option_name, const std::string& value) {
        try {
            size_t consumed_characters = 0;
            int parsed_value = std::stoi(value, &consumed_characters);
            if (consumed_characters == value.size()) {
                return parsed_value;
            }
        } catch (const std::exception&) {
            // Reported below with the option name
        }
        throw CommandLineError("Invalid integer for " + option_name + ": '" + value + "'");
    }

    CommandType parse_command(const std::string& command_string) {
        if (command_string == "analyze") return CommandType::ANALYZE;
        if (command_string == "indicators") return CommandType::INDICATORS;
        if (command_string == "scan") return CommandType::SCAN;
        throw CommandLineError("Unknown command: '" + command_string + "'");
    }

    void require_command(const CommandLineOptions& options, CommandType expected, const std::string& option_name) {
        if (options.command != expected) {
            throw CommandLineError("Option " + option_name + " is not valid for '" + command_name(options.command) + "'");
        }
    }
}

std::string command_name(CommandType command) {
    switch (command) {
        case CommandType::ANALYZE: return "analyze";
        case CommandType::INDICATORS: return "indicators";
        case CommandType::SCAN: return "scan";
    }
    return "analyze";
}

CommandLineOptions parse_command_line(const std::vector<std::string>& arguments) {
    if (arguments.empty()) {
        throw CommandLineError("Missing command");
    }

    CommandLineOptions options;
    options.command = parse_command(arguments[0]);

    for (size_t argument_index = 1; argument_index < arguments.size(); ++argument_index) {
        const std::string& argument = arguments[argument_index];

        if (argument == "--summary") {
            require_command(options, CommandType::ANALYZE, argument);
            options.print_summary = true;
            continue;
        }

        if (argument.size() > 2 && argument.compare(0, 2, "--") == 0) {
            if (argument_index + 1 >= arguments.size()) {
                throw CommandLineError("Missing value for " + argument);
            }
            const std::string& value = arguments[++argument_index];

            if (argument == "--config-dir") options.config_directory = value;
            else if (argument == "--benchmark") {
                if (options.command == CommandType::INDICATORS) {
                    throw CommandLineError("Option --benchmark is not valid for 'indicators'");
                }
                options.benchmark_file = value;
            }
            else if (argument == "--fundamentals") { require_command(options, CommandType::ANALYZE, argument); options.fundamentals_file = value; }
            else if (argument == "--symbol") { require_command(options, CommandType::ANALYZE, argument); options.symbol = value; }
            else if (argument == "--preset") { require_command(options, CommandType::SCAN, argument); options.preset = value; }
            else if (argument == "--min-score") { require_command(options, CommandType::SCAN, argument); options.min_score = parse_double_option(argument, value); }
            else if (argument == "--max-score") { require_command(options, CommandType::SCAN, argument); options.max_score = parse_double_option(argument, value); }
            else if (argument == "--signal") { require_command(options, CommandType::SCAN, argument); options.signal = value; }
            else if (argument == "--min-conviction") { require_command(options, CommandType::SCAN, argument); options.min_conviction = value; }
            else if (argument == "--trend") { require_command(options, CommandType::SCAN, argument); options.trend = value; }
            else if (argument == "--stage") { require_command(options, CommandType::SCAN, argument); options.stage = parse_int_option(argument, value); }
            else if (argument == "--min-volume-ratio") { require_command(options, CommandType::SCAN, argument); options.min_volume_ratio = parse_double_option(argument, value); }
            else if (argument == "--max-results") { require_command(options, CommandType::SCAN, argument); options.max_results = parse_int_option(argument, value); }
            else throw CommandLineError("Unknown option: " + argument);
            continue;
        }

        options.bar_files.push_back(argument);
    }

    if (options.bar_files.empty()) {
        throw CommandLineError("No bars file given for '" + command_name(options.command) + "'");
    }
    if (options.command != CommandType::SCAN && options.bar_files.size() > 1) {
        throw CommandLineError("'" + command_name(options.command) + "' takes exactly one bars file");
    }
    if (options.max_results && *options.max_results <= 0) {
        throw CommandLineError("--max-results must be > 0");
    }
    return options;
}

std::string usage_text() {
    return
        "Usage: chart_analyzer <command> [options]\n"
        "\n"
        "Commands:\n"
        "  analyze <bars-file> [--benchmark FILE] [--fundamentals FILE] [--symbol SYM] [--summary]\n"
        "  indicators <bars-file>\n"
        "  scan <bars-file>... [--benchmark FILE] [--preset breakouts|stage2|minervini]\n"
        "       [--min-score X] [--max-score X] [--signal S] [--min-conviction C] [--trend T]\n"
        "       [--stage N] [--min-volume-ratio X] [--max-results N]\n"
        "\n"
        "Common options:\n"
        "  --config-dir DIR    Configuration directory (default: config)\n"
        "\n"
        "Exit codes: 0 success, 1 fatal or usage error, 2 insufficient data\n";
}

} // namespace System
} // namespace ChartAnalyzer
