#include "ignore.hpp"
#include <fstream>

namespace ragmill::engine {

    bool Ignore::load(const std::filesystem::path& ignore_file) {
        std::ifstream file(ignore_file);
        if (!file) return false;

        std::string line;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            add(line);
        }
        return true;
    }

    void Ignore::add(const std::string& pattern) {
        std::string glob = pattern;
        while (glob.size() > 1 && glob.back() == '/') glob.pop_back();
        bool anchored = glob.find('/') != std::string::npos;
        if (anchored && glob.front() == '/') glob.erase(0, 1);
        m_patterns.push_back({std::regex(glob_to_regex(glob)), pattern, anchored});
    }

    void Ignore::add_defaults() {
        static const char* defaults[] = {
            ".git", ".svn", ".hg",
            "build", "dist", "node_modules", "__pycache__",
            "*.o", "*.obj", "*.exe", "*.dll", "*.so", "*.dylib",
            ".DS_Store", "Thumbs.db",
            "ragmill.db", "ragmill.db-wal", "ragmill.db-shm", "ragmill.db-journal",
            ".ragmillignore"
        };
        for (const char* p : defaults) {
            add(p);
        }
    }

    bool Ignore::check(const std::string& relative) const {
        auto slash = relative.find_last_of('/');
        std::string name = (slash == std::string::npos) ? relative : relative.substr(slash + 1);

        for (const auto& p : m_patterns) {
            if (std::regex_match(p.anchored ? relative : name, p.regex)) return true;
        }
        return false;
    }

    std::string Ignore::glob_to_regex(const std::string& glob) {
        std::string regex_str = "^";
        for (size_t i = 0; i < glob.size(); ++i) {
            char c = glob[i];
            if (c == '*') {
                if (i + 1 < glob.size() && glob[i + 1] == '*') {
                    regex_str += ".*";
                    ++i;
                } else {
                    regex_str += "[^/]*";
                }
            } else if (c == '?') {
                regex_str += "[^/]";
            } else if (std::string(".+()|^$[]{}\\").find(c) != std::string::npos) {
                regex_str += '\\';
                regex_str += c;
            } else {
                regex_str += c;
            }
        }
        regex_str += "$";
        return regex_str;
    }

}
