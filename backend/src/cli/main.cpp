#include <iostream>
#include <string>
#include <sodium.h>
#include <spdlog/spdlog.h>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../crypto/KeyStore.hpp"
#include "../crypto/FieldCipher.hpp"
#include "../storage/Storage.hpp"
#include "../core/BudgetService.hpp"
#include "Menu.hpp"

int main(int argc, char** argv) {
    AppConfig cfg;
    try {
        cfg = AppConfig::load(argc, argv);
    }
    catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n" << AppConfig::usage(argv[0]);
        return 2;
    }

    if (cfg.show_help) {
        std::cout << AppConfig::usage(argv[0]);
        return 0;
    }

    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    try {
        Log::init(cfg.log_path, cfg.log_level);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot open log file '" << cfg.log_path << "': " << e.what() << "\n";
        return 1;
    }

    spdlog::info("Starting budget manager (db='{}', key='{}')", cfg.db_path, cfg.key_path);

    try {
        KeyStore keyStore(cfg.key_path);
        const SecretKey& key = keyStore.loadOrCreate();
        if (keyStore.createdNewKey())
            std::cout << "[!] New encryption key generated and saved to '" << keyStore.path() << "'.\n";

        FieldCipher cipher(key);
        Storage storage(cfg.db_path);
        BudgetService service(storage, cipher);

        Menu menu(service);
        menu.run();
    }
    catch (const KeyIOError& e) {
        spdlog::critical("Key file unusable, refusing to start: {}", e.what());
        std::cerr << "Fatal: " << e.what() << "\n"
            "Refusing to continue: a new key would make existing data unreadable.\n";
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }

    spdlog::info("Shutdown");
    return 0;
}
