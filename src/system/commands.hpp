#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <atomic>
#include <ostream>
#include "configs/system_config.hpp"
#include "analyzer/scanner/market_scanner.hpp"
#include "system/command_line.hpp"

namespace ChartAnalyzer {
namespace System {

constexpr int EXIT_CODE_SUCCESS = 0;
constexpr int EXIT_CODE_FAILURE = 1;
constexpr int EXIT_CODE_INSUFFICIENT_DATA = 2;

// Preset first, then every explicit option overrides it
ChartAnalyzer::Core::ScanFilter build_scan_filter(const CommandLineOptions& options);

// JSON goes to output; human-readable text goes to diagnostics. Returns the process exit code.
int run_command(const CommandLineOptions& options, const ChartAnalyzer::Config::SystemConfig& config,
                const std::atomic<bool>& shutdown_flag, std::ostream& output, std::ostream& diagnostics);

} // namespace System
} // namespace ChartAnalyzer

#endif // COMMANDS_HPP
