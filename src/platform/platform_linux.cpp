#include "../platform.hpp"
#include <cstdlib>

namespace ragmill::platform {

    namespace system {

        namespace {
            std::filesystem::path xdg_dir(const char* variable, const char* home_fallback) {
                const char* xdg = std::getenv(variable);
                if (xdg && *xdg) return std::filesystem::path(xdg) / "ragmill";
                const char* home = std::getenv("HOME");
                return home ? std::filesystem::path(home) / home_fallback / "ragmill" : std::filesystem::path();
            }
        }

        std::filesystem::path get_config_dir() {
            return xdg_dir("XDG_CONFIG_HOME", ".config");
        }

        std::filesystem::path get_data_dir() {
            return xdg_dir("XDG_DATA_HOME", ".local/share");
        }
    }

}
