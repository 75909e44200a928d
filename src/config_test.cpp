#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch.hpp>
#include <unistd.h>
#include <stdlib.h>

#include "constants.hpp"
#include "config.hpp"

namespace {
    // Unsets every variable the configuration reads for the duration of a test.
    struct CleanEnvironment {
        std::filesystem::path dir;
        
        CleanEnvironment() : 
            dir {std::filesystem::temp_directory_path() 
                / ("fastput_config_test_" + std::to_string(getpid()))} 
        {
            std::filesystem::create_directories(dir);
            unsetenv(fastput::constants::ENV_CONFIG.c_str());
            unsetenv(fastput::constants::ENV_TPUT.c_str());
            unsetenv(fastput::constants::ENV_LOG.c_str());
            unsetenv(fastput::constants::ENV_XDG_CONFIG_HOME.c_str());
            setenv(fastput::constants::ENV_HOME.c_str(), dir.c_str(), 1);
        }
        ~CleanEnvironment() {
            std::error_code err;
            std::filesystem::remove_all(dir, err);
        }
        
        std::filesystem::path write(const std::string &name, const std::string &text) {
            std::filesystem::path filePath {dir / name};
            std::ofstream fout {filePath};
            fout << text;
            return filePath;
        }
    };
}

TEST_CASE_METHOD(CleanEnvironment, "Config.defaults")
{
    fastput::Config config {fastput::Config::load()};
    CHECK(config.get_tputPath() == "tput");
    CHECK(config.get_logFile().empty());
    CHECK(config.get_logVerbosity() == 0);
    CHECK(config.getProblems().empty());
}

TEST_CASE_METHOD(CleanEnvironment, "Config.locate")
{
    CHECK(fastput::Config::locate() == dir / ".config" / "fastput" / "config.yaml");
    
    setenv(fastput::constants::ENV_XDG_CONFIG_HOME.c_str(), "/xdg", 1);
    CHECK(fastput::Config::locate() == std::filesystem::path {"/xdg/fastput/config.yaml"});
    
    setenv(fastput::constants::ENV_CONFIG.c_str(), "/explicit.yaml", 1);
    CHECK(fastput::Config::locate() == std::filesystem::path {"/explicit.yaml"});
}

TEST_CASE_METHOD(CleanEnvironment, "Config.readsFile")
{
    std::filesystem::path filePath {write(
        "config.yaml", 
        "tput_path: /usr/bin/tput\nlog_file: /tmp/fastput.log\nlog_verbosity: 1\n"
    )};
    setenv(fastput::constants::ENV_CONFIG.c_str(), filePath.c_str(), 1);
    
    fastput::Config config {fastput::Config::load()};
    CHECK(config.get_tputPath() == "/usr/bin/tput");
    CHECK(config.get_logFile() == "/tmp/fastput.log");
    CHECK(config.get_logVerbosity() == 1);
    CHECK(config.getProblems().empty());
}

TEST_CASE_METHOD(CleanEnvironment, "Config.homeLocation")
{
    std::filesystem::create_directories(dir / ".config" / "fastput");
    write(".config/fastput/config.yaml", "tput_path: /opt/tput\n");
    
    CHECK(fastput::Config::load().get_tputPath() == "/opt/tput");
}

TEST_CASE_METHOD(CleanEnvironment, "Config.wrongTypeKeepsDefault")
{
    std::filesystem::path filePath {write(
        "config.yaml", 
        "tput_path: [a, b]\nlog_verbosity: loud\nlog_file: /tmp/x.log\n"
    )};
    setenv(fastput::constants::ENV_CONFIG.c_str(), filePath.c_str(), 1);
    
    fastput::Config config {fastput::Config::load()};
    CHECK(config.get_tputPath() == "tput");
    CHECK(config.get_logVerbosity() == 0);
    CHECK(config.get_logFile() == "/tmp/x.log");
    CHECK(config.getProblems().size() == 2);
}

TEST_CASE_METHOD(CleanEnvironment, "Config.malformedFile")
{
    std::filesystem::path filePath {write("config.yaml", "tput_path: [unclosed\n")};
    setenv(fastput::constants::ENV_CONFIG.c_str(), filePath.c_str(), 1);
    
    fastput::Config config {fastput::Config::load()};
    CHECK(config.get_tputPath() == "tput");
    CHECK(config.getProblems().size() == 1);
    
    CHECK_THROWS_AS(fastput::Config {filePath}, YAML::Exception);
}

TEST_CASE_METHOD(CleanEnvironment, "Config.notAMapping")
{
    std::filesystem::path filePath {write("config.yaml", "- tput\n")};
    setenv(fastput::constants::ENV_CONFIG.c_str(), filePath.c_str(), 1);
    
    fastput::Config config {fastput::Config::load()};
    CHECK(config.get_tputPath() == "tput");
    CHECK(config.getProblems().size() == 1);
}

TEST_CASE_METHOD(CleanEnvironment, "Config.missingExplicitFile")
{
    setenv(fastput::constants::ENV_CONFIG.c_str(), (dir / "absent.yaml").c_str(), 1);
    
    fastput::Config config {fastput::Config::load()};
    CHECK(config.get_tputPath() == "tput");
    CHECK(config.getProblems().empty());
}

TEST_CASE_METHOD(CleanEnvironment, "Config.environmentOverrides")
{
    std::filesystem::path filePath {write("config.yaml", "tput_path: /from/file\n")};
    setenv(fastput::constants::ENV_CONFIG.c_str(), filePath.c_str(), 1);
    setenv(fastput::constants::ENV_TPUT.c_str(), "/from/env", 1);
    setenv(fastput::constants::ENV_LOG.c_str(), "/tmp/env.log", 1);
    
    fastput::Config config {fastput::Config::load()};
    CHECK(config.get_tputPath() == "/from/env");
    CHECK(config.get_logFile() == "/tmp/env.log");
}
