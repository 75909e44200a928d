#include <system_error>
#include <iostream>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <cerrno>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "loguru.hpp"

#include "constants.hpp"
#include "delegate.hpp"
#include "logging.hpp"

namespace fastput {

ProcessDelegate::ProcessDelegate(const std::string &program) : program {program} {
}

static bool isExecutableFile(const std::filesystem::path &path) {
    std::error_code err;
    return std::filesystem::is_regular_file(path, err) && access(path.c_str(), X_OK) == 0;
}

static bool sameFile(const std::filesystem::path &path, const std::filesystem::path &self) {
    if (self.empty()) {
        return false;
    }
    std::error_code err;
    bool same {std::filesystem::equivalent(path, self, err)};
    return !err && same;
}

std::filesystem::path findExecutable(
    const std::string &program, 
    const std::string &searchPath, 
    const std::filesystem::path &self
) {
    if (program.empty()) {
        return {};
    }
    if (program.find('/') != std::string::npos) {
        return program;
    }
    
    std::size_t start {};
    while (true) {
        std::size_t end {searchPath.find(':', start)};
        std::string dir {searchPath.substr(
            start, end == std::string::npos ? std::string::npos : end - start
        )};
        // An empty entry means the current directory.
        std::filesystem::path candidate {
            (dir.empty() ? std::filesystem::path {"."} : std::filesystem::path {dir}) / program
        };
        if (isExecutableFile(candidate)) {
            if (!sameFile(candidate, self)) {
                return candidate;
            }
            DLOG_F(1, "Skipping %s, it is this executable.", candidate.c_str());
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return {};
}

std::filesystem::path selfExecutable() {
    std::error_code err;
    std::filesystem::path self {std::filesystem::read_symlink(constants::SELF_EXE_LINK, err)};
    if (err) {
        log::logErrorCodeWarning(err);
        return {};
    }
    return self;
}

int ProcessDelegate::run(const std::vector<std::string> &args) {
    const char *pathEnv {std::getenv(constants::ENV_PATH.c_str())};
    std::filesystem::path executable {findExecutable(
        program, 
        pathEnv ? pathEnv : constants::DEFAULT_SEARCH_PATH, 
        selfExecutable()
    )};
    if (executable.empty()) {
        LOG_F(WARNING, "Delegate not found: %s", program.c_str());
        std::cerr << constants::PROGRAM_NAME << ": " << program << ": command not found\n";
        return constants::EXIT_NOT_FOUND;
    }
    LOG_F(1, "Delegating %zu argument(s) to %s.", args.size(), executable.c_str());

    // Everything the child needs is built before forking.
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(program.c_str()));
    for (const std::string &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Anything we already wrote must reach the terminal before the child's output.
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    pid_t pid {fork()};
    if (pid < 0) {
        std::error_code err {errno, std::generic_category()};
        log::logErrorCodeWarning(err);
        std::cerr << constants::PROGRAM_NAME << ": fork: " << err.message() << '\n';
        return EXIT_FAILURE;
    }
    if (pid == 0) {
        execv(executable.c_str(), argv.data());
        int execErr {errno};
        std::fprintf(
            stderr, 
            "%s: %s: %s\n", 
            constants::PROGRAM_NAME.c_str(), 
            executable.c_str(), 
            std::strerror(execErr)
        );
        _exit(execErr == ENOENT ? constants::EXIT_NOT_FOUND : constants::EXIT_NOT_EXECUTABLE);
    }

    int status {};
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) {
            continue;
        }
        std::error_code err {errno, std::generic_category()};
        log::logErrorCodeWarning(err);
        return EXIT_FAILURE;
    }
    
    if (WIFEXITED(status)) {
        DLOG_F(1, "Delegate exited with %d.", WEXITSTATUS(status));
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        LOG_F(WARNING, "Delegate killed by signal %d.", WTERMSIG(status));
        return constants::EXIT_SIGNAL_BASE + WTERMSIG(status);
    }
    return EXIT_FAILURE;
}

}
