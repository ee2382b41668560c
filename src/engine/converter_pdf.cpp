#include "converter.hpp"
#include "ragmill/errors.hpp"

#include <limits>
#include <memory>
#include <mutex>
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-global.h>
#include <poppler/cpp/poppler-page.h>

namespace ragmill::engine {

    namespace {

        std::once_flag g_quiet_poppler;

        // Poppler prints parser complaints about damaged files to stderr; we report them as LoadError instead.
        void discard_poppler_message(const std::string&, void*) {}

    }

    std::string pdf_to_text(const std::string& document_id, std::string_view bytes) {
        std::call_once(g_quiet_poppler, [] { poppler::set_debug_error_function(discard_poppler_message, nullptr); });

        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            throw LoadError(document_id, "PDF is too large");
        }

        std::unique_ptr<poppler::document> doc(
            poppler::document::load_from_raw_data(bytes.data(), static_cast<int>(bytes.size())));
        if (!doc) {
            throw LoadError(document_id, "cannot parse PDF");
        }
        if (doc->is_locked()) {
            throw LoadError(document_id, "PDF is encrypted");
        }

        std::string text;
        const int pages = doc->pages();
        for (int i = 0; i < pages; ++i) {
            std::unique_ptr<poppler::page> page(doc->create_page(i));
            if (!page) continue;

            poppler::byte_array utf8 = page->text().to_utf8();
            std::string page_text(utf8.begin(), utf8.end());
            size_t last = page_text.find_last_not_of(" \t\r\n\f");
            if (last == std::string::npos) continue;
            page_text.erase(last + 1);

            if (!text.empty()) text += "\n\n";
            text += page_text;
        }

        if (!text.empty()) text += '\n';
        return text;
    }

}
