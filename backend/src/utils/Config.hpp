#pragma once
#include <string>
#include <stdexcept>
#include <spdlog/spdlog.h>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Runtime settings. Defaults < environment < command line.
struct AppConfig {
    std::string db_path = "secure_budgets.db";
    std::string key_path = "budget_key.key";
    std::string log_path = "budget.log";
    spdlog::level::level_enum log_level = spdlog::level::info;
    bool show_help = false;

    // Reads BUDGET_DB, BUDGET_KEY, BUDGET_LOG and BUDGET_LOG_LEVEL.
    void applyEnvironment();

    // Accepts --db, --key, --log, --log-level (each followed by a value) and --help.
    void applyArgs(int argc, const char* const* argv);

    static AppConfig load(int argc, const char* const* argv);
    static std::string usage(const std::string& program);
};

spdlog::level::level_enum parseLogLevel(const std::string& name);
