#include <filesystem>
#include <fstream>
#include <catch2/catch.hpp>
#include "analyzer/config_loader/config_loader.hpp"

using namespace ChartAnalyzer::Config;

namespace {
    std::filesystem::path config_test_directory(const std::string& name) {
        std::filesystem::path directory = std::filesystem::temp_directory_path() / "chart_analyzer_config_tests" / name;
        std::filesystem::create_directories(directory);
        return directory;
    }

    std::string write_csv(const std::filesystem::path& directory, const std::string& file_name, const std::string& contents) {
        std::filesystem::path file_path = directory / file_name;
        std::ofstream file(file_path);
        file << contents;
        return file_path.string();
    }

    bool validation_fails_with(const SystemConfig& config, const std::string& expected_fragment) {
        std::string error_message;
        bool valid = validate_config(config, error_message);
        return !valid && error_message.find(expected_fragment) != std::string::npos;
    }
}

TEST_CASE("Default configuration is valid", "[config]") {
    SystemConfig config;
    std::string error_message;
    CHECK(validate_config(config, error_message));
    CHECK(error_message.empty());
}

TEST_CASE("Configuration validation rejects inconsistent values", "[config]") {
    SystemConfig config;

    SECTION("weights must sum to one") {
        config.composite.lynch_weight = 0.25;
        CHECK(validation_fails_with(config, "sum to 1.0"));
    }
    SECTION("weights must be non-negative") {
        config.composite.minervini_weight = -0.1;
        config.composite.weinstein_weight = 0.8;
        CHECK(validation_fails_with(config, "non-negative"));
    }
    SECTION("periods must be positive") {
        config.indicators.rsi_period = 0;
        CHECK(validation_fails_with(config, "indicators"));
    }
    SECTION("an empty period list is rejected") {
        config.support_resistance.ma_periods.clear();
        CHECK(validation_fails_with(config, "support_resistance"));
    }
    SECTION("tolerance must be positive") {
        config.support_resistance.tolerance_pct = 0.0;
        CHECK(validation_fails_with(config, "tolerance_pct"));
    }
    SECTION("volume needs a short and a long period") {
        config.volume.sma_periods = {20};
        CHECK(validation_fails_with(config, "volume.sma_periods"));
    }
    SECTION("exactly three target multiples") {
        config.trade_plan.target_risk_multiples = {1.5, 2.5};
        CHECK(validation_fails_with(config, "target_risk_multiples"));
    }
    SECTION("at least one scan worker") {
        config.scanner.max_concurrent_analyses = 0;
        CHECK(validation_fails_with(config, "max_concurrent_analyses"));
    }
    SECTION("log file name required") {
        config.logging.log_file = "";
        CHECK(validation_fails_with(config, "logging.log_file"));
    }
}

TEST_CASE("CSV configuration overrides defaults key by key", "[config]") {
    std::filesystem::path directory = config_test_directory("overrides");
    std::string csv_path = write_csv(directory, "analysis_config.csv",
        "# comment line\n"
        "\n"
        "indicators.sma_periods, 5; 10 ;20\n"
        "indicators.rsi_period,21\n"
        "support_resistance.tolerance_pct,1.5\n"
        "trade_plan.target_risk_multiples,1;2;3\n"
        "logging.console_output_enabled,false\n"
        "unknown.key,42\n");

    SystemConfig config;
    REQUIRE(load_config_from_csv(config, csv_path));

    CHECK(config.indicators.sma_periods == std::vector<int>{5, 10, 20});
    CHECK(config.indicators.rsi_period == 21);
    CHECK(config.support_resistance.tolerance_pct == Approx(1.5));
    CHECK(config.trade_plan.target_risk_multiples == std::vector<double>{1.0, 2.0, 3.0});
    CHECK_FALSE(config.logging.console_output_enabled);
    // Untouched keys keep their defaults
    CHECK(config.indicators.macd_slow == 26);
}

TEST_CASE("CSV configuration failures", "[config]") {
    std::filesystem::path directory = config_test_directory("failures");
    SystemConfig config;

    SECTION("missing file") {
        CHECK_FALSE(load_config_from_csv(config, (directory / "does_not_exist.csv").string()));
    }
    SECTION("trailing characters in a number") {
        std::string csv_path = write_csv(directory, "bad_number.csv", "indicators.rsi_period,14abc\n");
        CHECK_FALSE(load_config_from_csv(config, csv_path));
    }
    SECTION("empty list") {
        std::string csv_path = write_csv(directory, "empty_list.csv", "indicators.sma_periods, ; ;\n");
        CHECK_FALSE(load_config_from_csv(config, csv_path));
    }
}

TEST_CASE("Loading a configuration directory validates the result", "[config]") {
    std::filesystem::path directory = config_test_directory("directory");
    write_csv(directory, "analysis_config.csv", "composite.lynch_weight,0.15\n");
    write_csv(directory, "scanner_config.csv", "scanner.max_concurrent_analyses,2\n");

    SECTION("all three files present") {
        write_csv(directory, "logging_config.csv", "logging.flush_interval_milliseconds,50\n");
        SystemConfig config;
        CHECK(load_system_config(config, directory.string()) == 0);
        CHECK(config.scanner.max_concurrent_analyses == 2);
        CHECK(config.logging.flush_interval_milliseconds == 50);
    }

    SECTION("a loaded value that fails validation") {
        write_csv(directory, "logging_config.csv", "logging.flush_interval_milliseconds,0\n");
        SystemConfig config;
        CHECK(load_system_config(config, directory.string()) == 1);
    }

    SECTION("a missing file") {
        SystemConfig config;
        CHECK(load_system_config(config, (directory / "missing").string()) == 1);
    }
}

TEST_CASE("Shipped configuration loads and validates", "[config]") {
    SystemConfig config;
    REQUIRE(load_system_config(config, CHART_ANALYZER_CONFIG_DIR) == 0);

    SystemConfig defaults;
    CHECK(config.indicators.sma_periods == defaults.indicators.sma_periods);
    CHECK(config.composite.minervini_weight == Approx(defaults.composite.minervini_weight));
    CHECK(config.trade_plan.target_risk_multiples == defaults.trade_plan.target_risk_multiples);
    CHECK(config.scanner.service_minimum_bars == defaults.scanner.service_minimum_bars);
}
