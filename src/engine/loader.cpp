#include "loader.hpp"
#include "converter.hpp"
#include "ragmill/errors.hpp"
#include "ragmill/sha256.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace ragmill::engine {

    namespace {

        int64_t to_epoch_ms(std::filesystem::file_time_type t) {
            // file_time_type's epoch is unspecified before C++20; shift through the system clock.
            auto now_file = std::filesystem::file_time_type::clock::now();
            auto now_sys = std::chrono::system_clock::now();
            auto sys = now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(t - now_file);
            return std::chrono::duration_cast<std::chrono::milliseconds>(sys.time_since_epoch()).count();
        }

        // A failed increment leaves the iterator unusable, so the walk ends there.
        void step(std::filesystem::recursive_directory_iterator& it) {
            std::error_code ec;
            it.increment(ec);
            if (ec) {
                std::cerr << "[Loader] Stopping directory walk early: " << ec.message() << "\n";
                it = std::filesystem::recursive_directory_iterator();
            }
        }

    }

    Loader::Loader(const std::filesystem::path& root) : m_root(root) {
        m_ignore.add_defaults();
        m_ignore.load(root / ".ragmillignore");
    }

    Loader::Loader(const std::filesystem::path& root, Ignore ignore)
        : m_root(root), m_ignore(std::move(ignore)) {}

    std::string Loader::relative_id(const std::filesystem::path& root, const std::filesystem::path& path) {
        return path.lexically_relative(root).generic_string();
    }

    std::vector<SourceEntry> Loader::list() const {
        std::error_code ec;
        if (!std::filesystem::is_directory(m_root, ec)) {
            throw LoadError(m_root.string(), "source directory not found");
        }

        std::vector<SourceEntry> entries;
        auto options = std::filesystem::directory_options::skip_permission_denied;
        std::filesystem::recursive_directory_iterator it(m_root, options, ec);
        if (ec) {
            throw LoadError(m_root.string(), "cannot open source directory: " + ec.message());
        }

        const std::filesystem::recursive_directory_iterator end;
        for (; it != end; step(it)) {
            const auto& path = it->path();
            std::string id = relative_id(m_root, path);

            if (m_ignore.check(id)) {
                if (it->is_directory(ec)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!it->is_regular_file(ec)) continue;

            SourceEntry entry;
            entry.id = std::move(id);
            entry.path = path;
            entry.size = it->file_size(ec);
            entry.last_modified_ms = to_epoch_ms(it->last_write_time(ec));
            entries.push_back(std::move(entry));
        }

        std::sort(entries.begin(), entries.end(),
                  [](const SourceEntry& a, const SourceEntry& b) { return a.id < b.id; });
        return entries;
    }

    Document Loader::load(const SourceEntry& entry) const {
        std::ifstream file(entry.path, std::ios::binary);
        if (!file.is_open()) {
            throw LoadError(entry.id, "cannot open file");
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw LoadError(entry.id, "read error");
        }
        std::string bytes = buffer.str();

        Format format = detect_format(entry.path, bytes);

        Document doc;
        doc.id = entry.id;
        doc.path = entry.path;
        doc.size = bytes.size();
        doc.last_modified_ms = entry.last_modified_ms;
        doc.hash = crypto::SHA256::hash_bytes(bytes);
        doc.format = to_string(format);
        doc.content = convert_to_text(entry.id, format, bytes);
        return doc;
    }

    size_t Loader::for_each(const DocumentCallback& on_document, const FailureCallback& on_failure) const {
        size_t delivered = 0;
        for (const auto& entry : list()) {
            try {
                on_document(load(entry));
                ++delivered;
            } catch (const LoadError& e) {
                if (on_failure) on_failure({entry.id, entry.path, e.what()});
            }
        }
        return delivered;
    }

}
