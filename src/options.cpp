#include "options.hpp"

namespace fastput {

opt::ScanResult opt::scan(const std::vector<std::string> &args) {
    ScanResult result {};
    
    std::size_t idx {};
    while (idx < args.size()) {
        const std::string &arg {args[idx]};
        if (arg == "--") {
            ++idx;
            break;
        }
        // A lone `-` is an operand, same as getopt.
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }
        ++idx;
        
        for (std::size_t pos {1}; pos < arg.size(); ++pos) {
            char flag {arg[pos]};
            if (flag == 'S') {
                result.action = Action::ForceDelegate;
                return result;
            }
            if (flag == 'V') {
                result.action = Action::PrintVersion;
                return result;
            }
            if (flag != 'T') {
                result.ignoredFlags.push_back(flag);
                continue;
            }
            
            // `-Txterm` or `-T xterm`.
            if (pos + 1 < arg.size()) {
                result.termType = arg.substr(pos + 1);
            } else if (idx < args.size()) {
                result.termType = args[idx];
                ++idx;
            } else {
                result.ignoredFlags.push_back(flag);
            }
            break;
        }
    }
    
    result.operands.assign(args.begin() + idx, args.end());
    return result;
}

}
