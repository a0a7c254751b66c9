#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include <string>
#include "logging/logger/async_logger.hpp"
#include "utils/format_utils.hpp"

// Section layout
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SUBCONTENT(msg) log_message("|     " + std::string(msg), "")

#define LOG_ANALYSIS_HEADER(symbol) LOG_THREAD_SECTION_HEADER("ANALYSIS - " + std::string(symbol))
#define LOG_SCAN_HEADER(universe_size) LOG_THREAD_SECTION_HEADER("MARKET SCAN - " + std::to_string(universe_size) + " symbols")

// Label/value tables, 17 + 48 columns
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_THREAD_CONTENT(FormatUtils::table_rule("┌", "┬", "┐")); \
    LOG_THREAD_CONTENT(FormatUtils::table_row(title, subtitle)); \
    LOG_THREAD_CONTENT(FormatUtils::table_rule("├", "┼", "┤")); \
} while (0)

#define TABLE_ROW_48(label, value) LOG_THREAD_CONTENT(FormatUtils::table_row(label, value))
#define TABLE_SEPARATOR_48() LOG_THREAD_CONTENT(FormatUtils::table_rule("├", "┼", "┤"))
#define TABLE_FOOTER_48() LOG_THREAD_CONTENT(FormatUtils::table_rule("└", "┴", "┘"))

#endif // LOGGING_MACROS_HPP
