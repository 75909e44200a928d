#ifndef FASTPUT_CONSTANTS_HPP
#define FASTPUT_CONSTANTS_HPP

#include <filesystem>
#include <string>

namespace fastput::constants {
    #ifdef FASTPUT_VERSION
    inline const std::string VERSION {FASTPUT_VERSION};
    #else
    inline const std::string VERSION {"Unknown"};
    #endif

    inline const std::string PROGRAM_NAME {"fastput"};
    
    // Printed by `-V`. Scripts parse this, so keep the shape stable.
    inline const std::string VERSION_LINE {PROGRAM_NAME + " (" + VERSION + ")\n"};

    inline const std::string ESC {"\033"};
    
    inline const std::string DEFAULT_TPUT_PATH {"tput"};
    inline const std::string DEFAULT_SEARCH_PATH {"/usr/local/bin:/usr/bin:/bin"};
    inline const std::filesystem::path SELF_EXE_LINK {"/proc/self/exe"};
    
    inline const std::filesystem::path CONFIG_FILE {std::filesystem::path {"fastput"} / "config.yaml"};
    inline const std::filesystem::path USER_CONFIG_DIR {".config"};
    
    inline const std::string ENV_CONFIG {"FASTPUT_CONFIG"};
    inline const std::string ENV_TPUT {"FASTPUT_TPUT"};
    inline const std::string ENV_LOG {"FASTPUT_LOG"};
    inline const std::string ENV_XDG_CONFIG_HOME {"XDG_CONFIG_HOME"};
    inline const std::string ENV_HOME {"HOME"};
    inline const std::string ENV_PATH {"PATH"};

    // Shell conventions for commands that cannot be run.
    inline constexpr int EXIT_NOT_EXECUTABLE = 126;
    inline constexpr int EXIT_NOT_FOUND = 127;
    inline constexpr int EXIT_SIGNAL_BASE = 128;
}

#endif
