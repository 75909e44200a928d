#ifndef FASTPUT_DISPATCHER_HPP
#define FASTPUT_DISPATCHER_HPP

#include <variant>
#include <ostream>
#include <string>
#include <vector>

#include "delegate.hpp"

namespace fastput {
    // Bytes to write ourselves.
    struct Emit {
        std::string bytes;
    };
    
    // Hand the original argument list to the delegate.
    struct Delegation {
    };
    
    using Resolution = std::variant<Emit, Delegation>;
    
    // Decides what a request turns into without performing it.
    Resolution resolve(const std::vector<std::string> &);

    class Dispatcher {
        std::ostream &out;
        Delegate &delegate;
        
        public:
        Dispatcher(std::ostream &, Delegate &);
        Dispatcher(const Dispatcher &) = delete;
        Dispatcher &operator=(const Dispatcher &) = delete;
        
        // Writes the capability bytes (no trailing newline) and returns 0, or 
        // returns whatever the delegate returns.
        int dispatch(const std::vector<std::string> &);
    };
}

#endif
