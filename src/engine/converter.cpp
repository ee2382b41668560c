#include "converter.hpp"
#include "ragmill/errors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace ragmill::engine {

    namespace {

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            return s;
        }

        bool starts_with(std::string_view s, std::string_view prefix) {
            return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
        }

        const std::unordered_map<std::string, Format>& extension_table() {
            static const std::unordered_map<std::string, Format> table = {
                {".txt", Format::PlainText}, {".text", Format::PlainText}, {".log", Format::PlainText},
                {".rst", Format::PlainText}, {".adoc", Format::PlainText}, {".org", Format::PlainText},
                {".c", Format::PlainText}, {".cc", Format::PlainText}, {".cpp", Format::PlainText},
                {".h", Format::PlainText}, {".hpp", Format::PlainText}, {".py", Format::PlainText},
                {".js", Format::PlainText}, {".ts", Format::PlainText}, {".java", Format::PlainText},
                {".go", Format::PlainText}, {".rs", Format::PlainText}, {".sh", Format::PlainText},
                {".sql", Format::PlainText}, {".xml", Format::PlainText}, {".yaml", Format::PlainText},
                {".yml", Format::PlainText}, {".toml", Format::PlainText}, {".ini", Format::PlainText},
                {".cfg", Format::PlainText},
                {".md", Format::Markdown}, {".markdown", Format::Markdown}, {".mdx", Format::Markdown},
                {".html", Format::Html}, {".htm", Format::Html}, {".xhtml", Format::Html},
                {".json", Format::Json},
                {".csv", Format::Csv}, {".tsv", Format::Csv},
                {".pdf", Format::Pdf},
                {".docx", Format::Docx}, {".docm", Format::Docx},
                {".xlsx", Format::Xlsx}, {".xlsm", Format::Xlsx},
                {".pptx", Format::Pptx}, {".pptm", Format::Pptx},
                {".odt", Format::OpenDocument}, {".ods", Format::OpenDocument}, {".odp", Format::OpenDocument},
                // Containers we have no converter for.
                {".doc", Format::Unsupported}, {".xls", Format::Unsupported}, {".ppt", Format::Unsupported},
                {".rtf", Format::Unsupported}, {".zip", Format::Unsupported}, {".png", Format::Unsupported},
                {".jpg", Format::Unsupported}, {".jpeg", Format::Unsupported}, {".gif", Format::Unsupported}
            };
            return table;
        }

        void append_utf8(std::string& out, uint32_t cp) {
            if (cp < 0x80) {
                out += static_cast<char>(cp);
            } else if (cp < 0x800) {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x10000) {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x110000) {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        // Decodes the entity starting at html[i] == '&'. Returns chars consumed, 0 if not an entity.
        size_t decode_entity(std::string_view html, size_t i, std::string& out) {
            static const std::unordered_map<std::string, uint32_t> named = {
                {"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''},
                {"nbsp", ' '}, {"copy", 0xA9}, {"reg", 0xAE}, {"hellip", 0x2026},
                {"mdash", 0x2014}, {"ndash", 0x2013}
            };

            size_t semi = html.find(';', i);
            if (semi == std::string_view::npos || semi - i > 10) return 0;
            std::string name(html.substr(i + 1, semi - i - 1));
            if (name.empty()) return 0;

            uint32_t cp = 0;
            if (name[0] == '#') {
                try {
                    bool hex = name.size() > 1 && (name[1] == 'x' || name[1] == 'X');
                    cp = static_cast<uint32_t>(std::stoul(name.substr(hex ? 2 : 1), nullptr, hex ? 16 : 10));
                } catch (const std::exception&) {
                    return 0;
                }
            } else {
                auto it = named.find(name);
                if (it == named.end()) return 0;
                cp = it->second;
            }
            append_utf8(out, cp);
            return semi - i + 1;
        }

        std::string normalize_newlines(std::string_view bytes) {
            if (starts_with(bytes, "\xEF\xBB\xBF")) bytes.remove_prefix(3);

            std::string out;
            out.reserve(bytes.size());
            for (size_t i = 0; i < bytes.size(); ++i) {
                if (bytes[i] == '\r') {
                    out += '\n';
                    if (i + 1 < bytes.size() && bytes[i + 1] == '\n') ++i;
                } else {
                    out += bytes[i];
                }
            }
            return out;
        }

        [[maybe_unused]] std::string extracted_text(const std::string& document_id, const std::string& extracted) {
            std::string text = normalize_newlines(extracted);
            if (!is_valid_utf8(text)) {
                throw LoadError(document_id, "extracted text is not valid UTF-8");
            }
            return text;
        }

    }

    const char* to_string(Format format) {
        switch (format) {
            case Format::PlainText: return "text";
            case Format::Markdown: return "markdown";
            case Format::Html: return "html";
            case Format::Json: return "json";
            case Format::Csv: return "csv";
            case Format::Pdf: return "pdf";
            case Format::Docx: return "docx";
            case Format::Xlsx: return "xlsx";
            case Format::Pptx: return "pptx";
            case Format::OpenDocument: return "opendocument";
            case Format::Unsupported: return "unsupported";
        }
        return "unsupported";
    }

    bool is_valid_utf8(std::string_view text) {
        size_t i = 0;
        while (i < text.size()) {
            auto c = static_cast<unsigned char>(text[i]);
            size_t len;
            uint32_t cp;
            if (c < 0x80) { ++i; continue; }
            else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
            else return false;

            if (i + len > text.size()) return false;
            for (size_t k = 1; k < len; ++k) {
                auto cc = static_cast<unsigned char>(text[i + k]);
                if ((cc & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (cc & 0x3F);
            }
            // Overlong forms, surrogates, out of range.
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
                (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                return false;
            }
            i += len;
        }
        return true;
    }

    Format detect_format(const std::filesystem::path& path, std::string_view bytes) {
        std::string ext = lower(path.extension().string());
        auto it = extension_table().find(ext);
        if (it != extension_table().end()) return it->second;

        // Unknown extension: sniff.
        std::string_view head = bytes.substr(0, std::min<size_t>(bytes.size(), 8192));
        if (starts_with(head, "%PDF")) return Format::Pdf;
        // A bare zip says nothing about which office format it holds.
        if (starts_with(head, "PK\x03\x04")) return Format::Unsupported;
        if (head.find('\0') != std::string_view::npos) return Format::Unsupported;

        size_t first = head.find_first_not_of(" \t\r\n");
        if (first != std::string_view::npos) {
            std::string probe = lower(std::string(head.substr(first, 15)));
            if (starts_with(probe, "<!doctype html") || starts_with(probe, "<html")) return Format::Html;
        }
        return Format::PlainText;
    }

    std::string html_to_text(std::string_view html) {
        static const std::unordered_set<std::string> block_tags = {
            "p", "div", "br", "li", "ul", "ol", "tr", "table", "section", "article", "header",
            "footer", "pre", "blockquote", "h1", "h2", "h3", "h4", "h5", "h6", "hr", "title", "main", "nav"
        };

        std::string out;
        out.reserve(html.size());
        size_t i = 0;
        while (i < html.size()) {
            char c = html[i];
            if (c == '<') {
                if (html.compare(i, 4, "<!--") == 0) {
                    size_t end = html.find("-->", i + 4);
                    i = (end == std::string_view::npos) ? html.size() : end + 3;
                    continue;
                }
                size_t close = html.find('>', i);
                if (close == std::string_view::npos) break;

                std::string_view tag = html.substr(i + 1, close - i - 1);
                bool closing = !tag.empty() && tag[0] == '/';
                if (closing) tag.remove_prefix(1);
                size_t name_end = 0;
                while (name_end < tag.size() && std::isalnum(static_cast<unsigned char>(tag[name_end]))) ++name_end;
                std::string name = lower(std::string(tag.substr(0, name_end)));

                i = close + 1;
                if (!closing && (name == "script" || name == "style")) {
                    size_t end = lower(std::string(html.substr(i))).find("</" + name);
                    if (end == std::string::npos) break;
                    i += end;
                    continue;
                }
                if (block_tags.count(name)) {
                    if (!out.empty() && out.back() != '\n') out += '\n';
                    if (!closing && name == "li") out += "- ";
                }
            } else if (c == '&') {
                size_t used = decode_entity(html, i, out);
                if (used == 0) {
                    out += '&';
                    ++i;
                } else {
                    i += used;
                }
            } else if (c == ' ' || c == '\t' || c == '\n') {
                if (!out.empty() && out.back() != ' ' && out.back() != '\n') out += ' ';
                ++i;
            } else {
                out += c;
                ++i;
            }
        }

        // Collapse runs of blank lines and trailing spaces.
        std::string text;
        text.reserve(out.size());
        int newlines = 0;
        for (char ch : out) {
            if (ch == '\n') {
                while (!text.empty() && text.back() == ' ') text.pop_back();
                if (++newlines > 2) continue;
            } else {
                if (newlines > 0 && ch == ' ') continue;
                newlines = 0;
            }
            text += ch;
        }
        size_t first = text.find_first_not_of(" \n");
        if (first == std::string::npos) return "";
        size_t last = text.find_last_not_of(" \n");
        return text.substr(first, last - first + 1) + "\n";
    }

    bool can_convert(Format format) {
        switch (format) {
            case Format::Pdf:
#ifdef RAGMILL_HAVE_POPPLER
                return true;
#else
                return false;
#endif
            case Format::Docx:
            case Format::Xlsx:
            case Format::Pptx:
            case Format::OpenDocument:
#ifdef RAGMILL_HAVE_OFFICE
                return true;
#else
                return false;
#endif
            case Format::Unsupported:
                return false;
            default:
                return true;
        }
    }

    std::string convert_to_text(const std::string& document_id, Format format, std::string_view bytes) {
        if (format == Format::Unsupported) {
            throw LoadError(document_id, "unsupported format");
        }
        if (!can_convert(format)) {
            throw LoadError(document_id, std::string("no ") + to_string(format) + " converter in this build");
        }

#ifdef RAGMILL_HAVE_POPPLER
        if (format == Format::Pdf) {
            return extracted_text(document_id, pdf_to_text(document_id, bytes));
        }
#endif
#ifdef RAGMILL_HAVE_OFFICE
        if (format == Format::Docx || format == Format::Xlsx || format == Format::Pptx ||
            format == Format::OpenDocument) {
            return extracted_text(document_id, office_to_text(document_id, format, bytes));
        }
#endif
        if (bytes.find('\0') != std::string_view::npos) {
            throw LoadError(document_id, "binary content");
        }

        std::string text = normalize_newlines(bytes);
        if (!is_valid_utf8(text)) {
            throw LoadError(document_id, "content is not valid UTF-8");
        }

        switch (format) {
            case Format::Html:
                return html_to_text(text);
            case Format::Json:
                try {
                    return nlohmann::json::parse(text).dump(2) + "\n";
                } catch (const nlohmann::json::exception& e) {
                    throw LoadError(document_id, std::string("invalid JSON: ") + e.what());
                }
            default:
                break;
        }
        return text;
    }

}
