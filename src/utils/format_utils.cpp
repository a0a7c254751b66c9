#include "format_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace FormatUtils {

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t part_index = 0; part_index < parts.size(); ++part_index) {
        if (part_index > 0) {
            joined += separator;
        }
        joined += parts[part_index];
    }
    return joined;
}

std::string to_upper(const std::string& value) {
    std::string upper_value = value;
    std::transform(upper_value.begin(), upper_value.end(), upper_value.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return upper_value;
}

std::string to_lower(const std::string& value) {
    std::string lower_value = value;
    std::transform(lower_value.begin(), lower_value.end(), lower_value.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return lower_value;
}

std::string trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string pad_or_truncate(const std::string& text, size_t width) {
    std::string cell = text.substr(0, width);
    cell.append(width - cell.size(), ' ');
    return cell;
}

std::string table_row(const std::string& label, const std::string& value) {
    return "│ " + pad_or_truncate(label, TABLE_LABEL_WIDTH) + " │ " + pad_or_truncate(value, TABLE_VALUE_WIDTH) + " │";
}

std::string table_rule(const std::string& left, const std::string& middle, const std::string& right) {
    std::string rule = left;
    for (size_t column = 0; column < TABLE_LABEL_WIDTH + 2; ++column) {
        rule += "─";
    }
    rule += middle;
    for (size_t column = 0; column < TABLE_VALUE_WIDTH + 2; ++column) {
        rule += "─";
    }
    return rule + right;
}

} // namespace FormatUtils
