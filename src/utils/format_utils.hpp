#ifndef FORMAT_UTILS_HPP
#define FORMAT_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace FormatUtils {

// Fixed-point rendering, e.g. format_fixed(12.345, 1) -> "12.3"
std::string format_fixed(double value, int precision);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

std::string to_upper(const std::string& value);
std::string to_lower(const std::string& value);
std::string trim(const std::string& value);

// Two-column box tables for the log helpers
constexpr size_t TABLE_LABEL_WIDTH = 17;
constexpr size_t TABLE_VALUE_WIDTH = 48;

std::string pad_or_truncate(const std::string& text, size_t width);
std::string table_row(const std::string& label, const std::string& value);
std::string table_rule(const std::string& left, const std::string& middle, const std::string& right);

} // namespace FormatUtils

#endif // FORMAT_UTILS_HPP
