#ifndef FASTPUT_OPTIONS_HPP
#define FASTPUT_OPTIONS_HPP

#include <string>
#include <vector>

namespace fastput::opt {
    enum class Action {
        Dispatch, 
        ForceDelegate, 
        PrintVersion
    };
    
    struct ScanResult {
        Action action {Action::Dispatch};
        std::string termType;
        std::vector<std::string> operands;
        std::vector<char> ignoredFlags;
    };

    // Short options `-S`, `-T <term>` and `-V`, scanned with getopt conventions. 
    // Scanning stops at the first operand or after `--`. `-S` and `-V` end the 
    // scan where they appear, so whichever comes first wins. Unknown flags and a 
    // `-T` missing its value are recorded and otherwise ignored.
    ScanResult scan(const std::vector<std::string> &);
}

#endif
