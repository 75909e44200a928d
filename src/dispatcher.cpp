#include <cstdlib>

#include "loguru.hpp"

#include "capability.hpp"
#include "dispatcher.hpp"
#include "constants.hpp"
#include "options.hpp"

namespace fastput {

Resolution resolve(const std::vector<std::string> &args) {
    opt::ScanResult scanned {opt::scan(args)};
    for (char flag : scanned.ignoredFlags) {
        LOG_F(WARNING, "Ignoring option -%c.", flag);
    }
    
    if (scanned.action == opt::Action::PrintVersion) {
        return Emit {constants::VERSION_LINE};
    }
    if (scanned.action == opt::Action::ForceDelegate) {
        DLOG_F(1, "Delegation forced by -S.");
        return Delegation {};
    }
    if (!scanned.termType.empty()) {
        DLOG_F(1, "Terminal type %s has no effect.", scanned.termType.c_str());
    }
    
    if (scanned.operands.empty()) {
        DLOG_F(1, "No capability given.");
        return Delegation {};
    }
    const std::string &name {scanned.operands.front()};
    const cap::Rule *rule {cap::find(name)};
    if (rule == nullptr) {
        DLOG_F(1, "Unknown capability `%s`.", name.c_str());
        return Delegation {};
    }
    
    std::vector<std::string> capArgs {scanned.operands.begin() + 1, scanned.operands.end()};
    return Emit {cap::render(*rule, capArgs)};
}

Dispatcher::Dispatcher(std::ostream &out, Delegate &delegate) : 
    out {out}, 
    delegate {delegate} 
{
}

int Dispatcher::dispatch(const std::vector<std::string> &args) {
    Resolution resolution {resolve(args)};
    
    if (const Emit *emit {std::get_if<Emit>(&resolution)}) {
        out.write(emit->bytes.data(), static_cast<std::streamsize>(emit->bytes.size()));
        out.flush();
        if (!out) {
            LOG_F(ERROR, "Failed to write %zu byte(s) to output.", emit->bytes.size());
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }
    
    return delegate.run(args);
}

}
