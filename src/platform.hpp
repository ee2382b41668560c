#pragma once

#include <filesystem>

namespace ragmill::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        /**
         * @brief $XDG_CONFIG_HOME/ragmill, else ~/.config/ragmill. Empty if neither is known.
         */
        std::filesystem::path get_config_dir();

        /**
         * @brief $XDG_DATA_HOME/ragmill, else ~/.local/share/ragmill. Empty if neither is known.
         */
        std::filesystem::path get_data_dir();
    }

}
