#ifndef FASTPUT_CONFIG_HPP
#define FASTPUT_CONFIG_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "yaml-cpp/yaml.h"

#include "constants.hpp"

#define CONFIG_ATTR(TYPE, NAME, DEFAULT) \
private: \
TYPE NAME {DEFAULT}; \
public: \
inline const TYPE &get_##NAME() const { \
    return NAME; \
}

namespace fastput {
    class Config {
        std::vector<std::string> problems;
        
        void readFile(const std::filesystem::path &);
        void applyEnvironment();

        public:
        
        Config() = default;
        
        // Throws `YAML::Exception` if the file cannot be loaded at all. Values of 
        // the wrong type keep their defaults and are recorded in `getProblems()`.
        Config(const std::filesystem::path &);
        
        // Never throws. A missing file gives defaults. Environment overrides are 
        // applied last.
        static Config load();
        
        // `$FASTPUT_CONFIG`, then the XDG location, then `~/.config`. Empty if 
        // none of those variables are set.
        static std::filesystem::path locate();
        
        const std::vector<std::string> &getProblems() const {
            return problems;
        }
        
        CONFIG_ATTR(std::string, tputPath, constants::DEFAULT_TPUT_PATH)
        CONFIG_ATTR(std::string, logFile, )
        CONFIG_ATTR(int, logVerbosity, 0)
    };
}

#undef CONFIG_ATTR

#endif
