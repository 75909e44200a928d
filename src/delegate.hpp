#ifndef FASTPUT_DELEGATE_HPP
#define FASTPUT_DELEGATE_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace fastput {
    // Runs a request fastput does not handle itself. Output goes wherever the 
    // implementation sends it, never through the dispatcher.
    class Delegate {
        public:
        virtual ~Delegate() = default;
        
        // Receives the argument list exactly as fastput received it. Returns the 
        // exit status to report.
        virtual int run(const std::vector<std::string> &) = 0;
    };

    // Runs the real tput as a child process that shares our stdin, stdout and 
    // stderr, then waits for it.
    class ProcessDelegate : public Delegate {
        std::string program;
        
        public:
        ProcessDelegate(const std::string &);
        
        int run(const std::vector<std::string> &) override;
    };
    
    // Names containing a slash are returned unchanged. Otherwise each entry of 
    // the colon separated search path is tried in order, skipping any candidate 
    // that is the file `self` (so fastput installed as `tput` finds the real one). 
    // Returns an empty path when nothing matches.
    std::filesystem::path findExecutable(
        const std::string &, 
        const std::string &, 
        const std::filesystem::path &
    );
    
    // Resolved path of the running executable, empty if unavailable.
    std::filesystem::path selfExecutable();
}

#endif
