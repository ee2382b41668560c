#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "ragmill/types.hpp"
#include "ignore.hpp"

namespace ragmill::engine {

    /**
     * @brief A file found under the source root, not read yet.
     */
    struct SourceEntry {
        std::string id;
        std::filesystem::path path;
        std::uintmax_t size = 0;
        int64_t last_modified_ms = 0;
    };

    struct LoadFailure {
        std::string document_id;
        std::filesystem::path path;
        std::string message;
    };

    class Loader {
    public:
        using DocumentCallback = std::function<void(Document&&)>;
        using FailureCallback = std::function<void(const LoadFailure&)>;

        /**
         * @param root Source directory. A ".ragmillignore" file in it adds to the default ignores.
         */
        explicit Loader(const std::filesystem::path& root);
        Loader(const std::filesystem::path& root, Ignore ignore);

        /**
         * @brief Enumerates candidate files, sorted by id. Re-running it yields the same list
         * as long as the directory is unchanged.
         * @throws LoadError if the root is not a readable directory.
         */
        std::vector<SourceEntry> list() const;

        /**
         * @brief Reads, hashes and normalizes one file.
         * @throws LoadError if the file is unreadable or its format unsupported.
         */
        Document load(const SourceEntry& entry) const;

        /**
         * @brief Loads every entry in order. Failing files are reported through on_failure
         * and skipped.
         * @return Number of documents delivered.
         */
        size_t for_each(const DocumentCallback& on_document, const FailureCallback& on_failure) const;

        const std::filesystem::path& root() const { return m_root; }

        static std::string relative_id(const std::filesystem::path& root, const std::filesystem::path& path);

    private:
        std::filesystem::path m_root;
        Ignore m_ignore;
    };

}
