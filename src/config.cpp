#include <system_error>
#include <type_traits>
#include <cstdlib>

#include "constants.hpp"
#include "config.hpp"

namespace fastput {

namespace keys {
    static const std::string TPUT_PATH {"tput_path"};
    static const std::string LOG_FILE {"log_file"};
    static const std::string LOG_VERBOSITY {"log_verbosity"};
}

static const char *getEnv(const std::string &name) {
    const char *value {std::getenv(name.c_str())};
    return value != nullptr && *value != '\0' ? value : nullptr;
}

Config::Config(const std::filesystem::path &filePath) {
    readFile(filePath);
}

void Config::readFile(const std::filesystem::path &filePath) {
    const YAML::Node yaml {YAML::LoadFile(filePath)};
    if (!yaml.IsMap()) {
        if (!yaml.IsNull()) {
            problems.push_back("Ignoring " + filePath.string() + ": not a mapping.");
        }
        return;
    }
    
    auto readKey {[&] (const std::string &key, auto &target) {
        const YAML::Node node {yaml[key]};
        if (!node) {
            return;
        }
        try {
            target = node.as<std::remove_reference_t<decltype(target)>>();
        } catch (const YAML::Exception &e) {
            problems.push_back("Ignoring `" + key + "` in " + filePath.string() + ": " + e.what());
        }
    }};
    readKey(keys::TPUT_PATH, tputPath);
    readKey(keys::LOG_FILE, logFile);
    readKey(keys::LOG_VERBOSITY, logVerbosity);
}

void Config::applyEnvironment() {
    if (const char *tput {getEnv(constants::ENV_TPUT)}) {
        tputPath = tput;
    }
    if (const char *log {getEnv(constants::ENV_LOG)}) {
        logFile = log;
    }
}

std::filesystem::path Config::locate() {
    if (const char *explicitPath {getEnv(constants::ENV_CONFIG)}) {
        return explicitPath;
    }
    if (const char *xdg {getEnv(constants::ENV_XDG_CONFIG_HOME)}) {
        return std::filesystem::path {xdg} / constants::CONFIG_FILE;
    }
    if (const char *home {getEnv(constants::ENV_HOME)}) {
        return std::filesystem::path {home} / constants::USER_CONFIG_DIR / constants::CONFIG_FILE;
    }
    return {};
}

Config Config::load() {
    Config config {};
    std::filesystem::path filePath {locate()};
    
    std::error_code err;
    if (!filePath.empty() && std::filesystem::exists(filePath, err)) {
        try {
            config.readFile(filePath);
        } catch (const YAML::Exception &e) {
            config = Config {};
            config.problems.push_back("Ignoring " + filePath.string() + ": " + e.what());
        }
    }
    
    config.applyEnvironment();
    return config;
}

}
