#include "Config.hpp"
#include <cstdlib>
#include <sstream>

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto lvl = spdlog::level::from_str(name);
    // from_str maps anything unknown to "off"
    if (lvl == spdlog::level::off && name != "off")
        throw ConfigError("unknown log level '" + name + "'");
    return lvl;
}

static void overrideFromEnv(const char* var, std::string& target) {
    const char* v = std::getenv(var);
    if (v && *v) target = v;
}

void AppConfig::applyEnvironment() {
    overrideFromEnv("BUDGET_DB", db_path);
    overrideFromEnv("BUDGET_KEY", key_path);
    overrideFromEnv("BUDGET_LOG", log_path);

    std::string level;
    overrideFromEnv("BUDGET_LOG_LEVEL", level);
    if (!level.empty()) log_level = parseLogLevel(level);
}

void AppConfig::applyArgs(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
            continue;
        }

        if (arg != "--db" && arg != "--key" && arg != "--log" && arg != "--log-level")
            throw ConfigError("unknown option '" + arg + "'");

        if (i + 1 >= argc)
            throw ConfigError("option '" + arg + "' requires a value");
        std::string value = argv[++i];

        if (arg == "--db") db_path = value;
        else if (arg == "--key") key_path = value;
        else if (arg == "--log") log_path = value;
        else log_level = parseLogLevel(value);
    }
}

AppConfig AppConfig::load(int argc, const char* const* argv) {
    AppConfig cfg;
    cfg.applyEnvironment();
    cfg.applyArgs(argc, argv);
    return cfg;
}

std::string AppConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  --db <path>         budget database (default secure_budgets.db)\n"
        << "  --key <path>        encryption key file (default budget_key.key)\n"
        << "  --log <path>        log file (default budget.log)\n"
        << "  --log-level <lvl>   trace|debug|info|warn|error|critical|off\n"
        << "  --help              show this message\n";
    return oss.str();
}
