#include "settings/EngineSettings.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace memtrade::settings {

EngineSettings EngineSettings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json root;
    try {
        file >> root;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    std::cout << "[EngineSettings] Loaded " << path << std::endl;
    return EngineSettings(root);
}

std::string EngineSettings::resolveConfigPath(int argc, char* argv[]) {
    if (const char* env = std::getenv("MEMTRADE_CONFIG")) {
        return env;
    }
    if (argc > 1 && argv[1] != nullptr) {
        return argv[1];
    }
    return "config/config.json";
}

} // namespace memtrade::settings
