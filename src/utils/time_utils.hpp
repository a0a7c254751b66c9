#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <optional>

namespace TimeUtils {

constexpr long long SECONDS_PER_DAY = 86400;

// Bar timestamp shapes, tried in this order
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* SPACE_SEPARATED = "%Y-%m-%d %H:%M:%S";
constexpr const char* DATE_ONLY = "%Y-%m-%d";

// Log line prefix and run folder stamp, both in local time
constexpr const char* LOG_LINE_FORMAT = "%Y-%m-%d %H:%M:%S";
constexpr const char* RUN_STAMP_FORMAT = "%d-%H-%M";

std::string get_current_human_readable_time();
std::string get_current_log_filename_stamp();

// Every accepted shape is read as UTC; nullopt when none matches the whole string
std::optional<long long> parse_timestamp_to_epoch(const std::string& timestamp);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
