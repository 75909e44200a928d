#ifndef FASTPUT_LOGGING_HPP
#define FASTPUT_LOGGING_HPP

#include <system_error>
#include <exception>

namespace fastput {
    class Config;
}

namespace fastput::log {
    // Returns false if the configured log file could not be opened.
    bool configureLogging(const Config &);
    void logVersion();
    void logConfigProblems(const Config &);
    
    void logExceptionWarning(const std::exception &);
    void logErrorCodeWarning(const std::error_code &);
}

#endif
