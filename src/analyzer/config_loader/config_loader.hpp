#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

namespace ChartAnalyzer {
namespace Config {

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);
int load_system_config(SystemConfig& config, const std::string& config_directory);
bool validate_config(const SystemConfig& config, std::string& error_message);

} // namespace Config
} // namespace ChartAnalyzer

#endif // CONFIG_LOADER_HPP
