#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "analysis_config.hpp"
#include "strategy_config.hpp"
#include "scanner_config.hpp"
#include "logging_config.hpp"

namespace ChartAnalyzer {
namespace Config {

/**
 * Complete analyzer configuration.
 * Analysis configs parameterise the pipeline components, strategy configs the
 * composite and trade plan, scanner and logging configs the surrounding process.
 */
struct SystemConfig {
    // Default constructor - ensures nested structs are properly constructed
    SystemConfig() {}

    IndicatorConfig indicators;                      // Indicator engine periods
    PatternConfig patterns;                          // Chart pattern detector settings
    SupportResistanceConfig support_resistance;      // Level detection and clustering
    TrendConfig trend;                               // Trend and stage classification
    VolumeConfig volume;                             // Volume regime analysis
    CompositeConfig composite;                       // Strategy weights and consensus
    TradePlanConfig trade_plan;                      // Entry, stop, target and sizing rules
    ScannerConfig scanner;                           // Universe scan settings
    LoggingConfig logging;                           // Logging configuration
};

} // namespace Config
} // namespace ChartAnalyzer

#endif // SYSTEM_CONFIG_HPP
