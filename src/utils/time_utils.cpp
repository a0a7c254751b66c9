#include "time_utils.hpp"
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

namespace {
    std::string format_local_now(const char* format) {
        std::time_t now_seconds = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm local_time;
        localtime_r(&now_seconds, &local_time);
        std::ostringstream stream;
        stream << std::put_time(&local_time, format);
        return stream.str();
    }

    // Trailing characters after the matched shape count as a mismatch
    bool parse_whole_string(const std::string& timestamp, const char* format, std::tm& parsed) {
        parsed = std::tm{};
        std::istringstream stream(timestamp);
        stream >> std::get_time(&parsed, format);
        if (stream.fail()) {
            return false;
        }
        stream >> std::ws;
        return stream.eof();
    }
}

std::string get_current_human_readable_time() {
    return format_local_now(LOG_LINE_FORMAT);
}

std::string get_current_log_filename_stamp() {
    return format_local_now(RUN_STAMP_FORMAT);
}

std::optional<long long> parse_timestamp_to_epoch(const std::string& timestamp) {
    if (timestamp.empty()) {
        return std::nullopt;
    }

    std::tm parsed{};
    for (const char* format : {ISO_8601_WITH_Z, ISO_8601_WITHOUT_Z, SPACE_SEPARATED, DATE_ONLY}) {
        if (parse_whole_string(timestamp, format, parsed)) {
            return static_cast<long long>(timegm(&parsed));
        }
    }
    return std::nullopt;
}

} // namespace TimeUtils
