#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace ragmill::engine {

    /**
     * @brief Glob-based exclusion rules for the document loader.
     *
     * Patterns without a '/' are matched against the file or directory name, patterns
     * containing '/' against the path relative to the source root. '*' does not cross
     * directory separators, '**' does.
     */
    class Ignore {
    public:
        /**
         * @brief Loads patterns from an ignore file (one glob per line, '#' comments).
         * @return false if the file does not exist.
         */
        bool load(const std::filesystem::path& ignore_file);

        void add(const std::string& pattern);

        /**
         * @brief Adds the built-in exclusions (VCS metadata, build output, our own database).
         */
        void add_defaults();

        /**
         * @param relative Path relative to the source root, '/'-separated.
         * @return true if the entry should be skipped.
         */
        bool check(const std::string& relative) const;

        size_t size() const { return m_patterns.size(); }

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
            bool anchored; // matched against the relative path instead of the name
        };
        std::vector<Pattern> m_patterns;

        static std::string glob_to_regex(const std::string& glob);
    };

}
