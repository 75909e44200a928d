#include <algorithm>
#include <typeinfo>
#include <string>

#include "loguru.hpp"

#include "constants.hpp"
#include "logging.hpp"
#include "config.hpp"

namespace fastput {

bool log::configureLogging(const Config &config) {
    bool verbose {config.get_logVerbosity() > loguru::Verbosity_INFO};
    
    // stdout carries escape sequences and stderr belongs to the delegate.
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
    loguru::g_preamble_uptime = false;
    loguru::g_preamble_thread = false;
    loguru::g_preamble_file = verbose;
    
    if (config.get_logFile().empty()) {
        return true;
    }
    
    // Scripts call us many times per run, so keep earlier invocations.
    return loguru::add_file(
        config.get_logFile().c_str(), 
        loguru::Append, 
        std::clamp<loguru::Verbosity>(
            config.get_logVerbosity(), loguru::Verbosity_WARNING, loguru::Verbosity_MAX
        )
    );
}

void log::logVersion() {
    LOG_F(1, "fastput version: %s", constants::VERSION.c_str());
}

void log::logConfigProblems(const Config &config) {
    for (const std::string &problem : config.getProblems()) {
        LOG_F(WARNING, "%s", problem.c_str());
    }
}

void log::logExceptionWarning(const std::exception &e) {
    LOG_F(WARNING, "%s --> %s", typeid(e).name(), e.what());
}
void log::logErrorCodeWarning(const std::error_code &err) {
    if (err.value() == 0) {
        return;
    }
    LOG_F(
        WARNING, 
        "Error Code: %d --> %s --> %s", 
        err.value(), err.message().c_str(), err.category().name()
    );
}

}
