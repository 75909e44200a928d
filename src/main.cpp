#include <exception>
#include <iostream>
#include <cstdlib>
#include <string>
#include <vector>

#include "loguru.hpp"

#include "dispatcher.hpp"
#include "constants.hpp"
#include "delegate.hpp"
#include "logging.hpp"
#include "config.hpp"

int main(int argc, char **argv) {
    fastput::Config config {fastput::Config::load()};
    
    // stderr belongs to the caller, so a bad log file is not reported there.
    if (!fastput::log::configureLogging(config)) {
        LOG_F(WARNING, "Cannot open log file %s.", config.get_logFile().c_str());
    }
    
    fastput::log::logVersion();
    fastput::log::logConfigProblems(config);
    
    std::vector<std::string> args {argv + 1, argv + argc};
    
    try {
        fastput::ProcessDelegate delegate {config.get_tputPath()};
        fastput::Dispatcher dispatcher {std::cout, delegate};
        int status {dispatcher.dispatch(args)};
        DLOG_F(1, "Exit status: %d", status);
        return status;
    } catch (const std::exception &e) {
        fastput::log::logExceptionWarning(e);
        std::cerr << fastput::constants::PROGRAM_NAME << ": " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
