#include "converter.hpp"
#include "ragmill/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>
#include <memory>
#include <vector>
#include <pugixml.hpp>
#include <zip.h>

namespace ragmill::engine {

    namespace {

        // Parts larger than this are treated as hostile (zip bombs) rather than inflated.
        constexpr zip_uint64_t kMaxPartSize = 64ull * 1024 * 1024;

        struct ZipDiscard {
            void operator()(zip_t* archive) const { zip_discard(archive); }
        };

        class Archive {
        public:
            Archive(const std::string& document_id, std::string_view bytes) : m_document_id(document_id) {
                zip_error_t error;
                zip_error_init(&error);
                zip_source_t* source = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
                if (!source) {
                    std::string message = zip_error_strerror(&error);
                    zip_error_fini(&error);
                    throw LoadError(document_id, "cannot read archive: " + message);
                }
                zip_t* archive = zip_open_from_source(source, ZIP_RDONLY, &error);
                if (!archive) {
                    zip_source_free(source);
                    std::string message = zip_error_strerror(&error);
                    zip_error_fini(&error);
                    throw LoadError(document_id, "not a valid office archive: " + message);
                }
                zip_error_fini(&error);
                m_archive.reset(archive);
            }

            bool contains(const std::string& name) const {
                return zip_name_locate(m_archive.get(), name.c_str(), 0) >= 0;
            }

            std::vector<std::string> names() const {
                std::vector<std::string> out;
                zip_int64_t count = zip_get_num_entries(m_archive.get(), 0);
                for (zip_int64_t i = 0; i < count; ++i) {
                    if (const char* name = zip_get_name(m_archive.get(), static_cast<zip_uint64_t>(i), 0)) {
                        out.emplace_back(name);
                    }
                }
                return out;
            }

            std::string read(const std::string& name) const {
                zip_stat_t st;
                zip_stat_init(&st);
                if (zip_stat(m_archive.get(), name.c_str(), 0, &st) != 0 || !(st.valid & ZIP_STAT_SIZE)) {
                    throw LoadError(m_document_id, "archive has no part " + name);
                }
                if (st.size > kMaxPartSize) {
                    throw LoadError(m_document_id, "archive part " + name + " is too large");
                }

                zip_file_t* file = zip_fopen(m_archive.get(), name.c_str(), 0);
                if (!file) {
                    throw LoadError(m_document_id, "cannot open archive part " + name);
                }
                std::string data(static_cast<size_t>(st.size), '\0');
                zip_int64_t got = zip_fread(file, data.data(), st.size);
                zip_fclose(file);
                if (got < 0 || static_cast<zip_uint64_t>(got) != st.size) {
                    throw LoadError(m_document_id, "truncated archive part " + name);
                }
                return data;
            }

            void parse(const std::string& name, pugi::xml_document& doc) const {
                std::string data = read(name);
                pugi::xml_parse_result result = doc.load_buffer(data.data(), data.size());
                if (!result) {
                    throw LoadError(m_document_id, "malformed XML in " + name + ": " + result.description());
                }
            }

        private:
            std::string m_document_id;
            std::unique_ptr<zip_t, ZipDiscard> m_archive;
        };

        // Element name without its namespace prefix ("w:p" -> "p").
        std::string_view local_name(const pugi::xml_node& node) {
            std::string_view name = node.name();
            size_t colon = name.find(':');
            return colon == std::string_view::npos ? name : name.substr(colon + 1);
        }

        void trim_right(std::string& s) {
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.pop_back();
        }

        void append_paragraph(std::string& out, std::string line) {
            trim_right(line);
            if (line.empty()) return;
            if (!out.empty()) out += "\n\n";
            out += line;
        }

        // Parts named prefix<N>.xml, ordered by N.
        std::vector<std::string> numbered_parts(const Archive& archive, const std::string& prefix) {
            std::vector<std::pair<long, std::string>> found;
            for (const auto& name : archive.names()) {
                if (name.size() <= prefix.size() + 4 || name.compare(0, prefix.size(), prefix) != 0) continue;
                if (name.compare(name.size() - 4, 4, ".xml") != 0) continue;
                std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - 4);
                bool numeric = !digits.empty() && digits.size() <= 9 &&
                               std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); });
                if (!numeric) continue;
                found.emplace_back(std::stol(digits), name);
            }
            std::sort(found.begin(), found.end());

            std::vector<std::string> out;
            for (auto& entry : found) out.push_back(std::move(entry.second));
            return out;
        }

        // Runs of w:t / a:t text inside one paragraph, with tabs and breaks kept.
        void collect_runs(const pugi::xml_node& node, std::string& line) {
            for (pugi::xml_node child : node.children()) {
                std::string_view name = local_name(child);
                if (name == "t") {
                    line += child.text().get();
                } else if (name == "tab") {
                    line += '\t';
                } else if (name == "br" || name == "cr") {
                    line += '\n';
                } else if (name == "p") {
                    continue; // nested paragraphs (text boxes) are visited on their own
                } else {
                    collect_runs(child, line);
                }
            }
        }

        int docx_heading_level(const pugi::xml_node& paragraph) {
            pugi::xml_node style = paragraph.child("w:pPr").child("w:pStyle");
            std::string_view value = style.attribute("w:val").value();
            if (value.rfind("Heading", 0) == 0 && value.size() == 8 && value[7] >= '1' && value[7] <= '6') {
                return value[7] - '0';
            }
            if (value == "Title") return 1;
            return 0;
        }

        std::string docx_to_text(const Archive& archive) {
            pugi::xml_document doc;
            archive.parse("word/document.xml", doc);

            std::string out;
            for (pugi::xpath_node hit : doc.select_nodes("//w:p")) {
                pugi::xml_node paragraph = hit.node();
                std::string line;
                collect_runs(paragraph, line);
                int level = docx_heading_level(paragraph);
                if (level > 0 && !line.empty()) line = std::string(level, '#') + " " + line;
                append_paragraph(out, std::move(line));
            }
            return out;
        }

        std::string pptx_to_text(const Archive& archive) {
            std::string out;
            size_t number = 0;
            for (const auto& part : numbered_parts(archive, "ppt/slides/slide")) {
                pugi::xml_document doc;
                archive.parse(part, doc);
                append_paragraph(out, "## Slide " + std::to_string(++number));
                for (pugi::xpath_node hit : doc.select_nodes("//a:p")) {
                    std::string line;
                    collect_runs(hit.node(), line);
                    append_paragraph(out, std::move(line));
                }
            }
            return out;
        }

        std::string cell_text(const pugi::xml_node& node) {
            std::string text;
            for (pugi::xpath_node hit : node.select_nodes(".//*[local-name()='t']")) {
                text += hit.node().text().get();
            }
            return text;
        }

        // Sheet names in workbook order, mapped to their worksheet part.
        std::vector<std::pair<std::string, std::string>> xlsx_sheets(const Archive& archive) {
            pugi::xml_document rels;
            archive.parse("xl/_rels/workbook.xml.rels", rels);
            std::map<std::string, std::string> targets;
            for (pugi::xml_node rel : rels.document_element().children()) {
                std::string target = rel.attribute("Target").value();
                if (!target.empty() && target[0] == '/') {
                    target.erase(0, 1);
                } else {
                    target = "xl/" + target;
                }
                targets[rel.attribute("Id").value()] = target;
            }

            pugi::xml_document workbook;
            archive.parse("xl/workbook.xml", workbook);
            std::vector<std::pair<std::string, std::string>> sheets;
            for (pugi::xpath_node hit : workbook.select_nodes("//*[local-name()='sheet']")) {
                pugi::xml_node sheet = hit.node();
                auto it = targets.find(sheet.attribute("r:id").value());
                if (it == targets.end() || !archive.contains(it->second)) continue;
                sheets.emplace_back(sheet.attribute("name").value(), it->second);
            }
            return sheets;
        }

        std::string xlsx_to_text(const Archive& archive) {
            std::vector<std::string> shared;
            if (archive.contains("xl/sharedStrings.xml")) {
                pugi::xml_document strings;
                archive.parse("xl/sharedStrings.xml", strings);
                for (pugi::xml_node si : strings.document_element().children("si")) {
                    shared.push_back(cell_text(si));
                }
            }

            std::string out;
            for (const auto& [name, part] : xlsx_sheets(archive)) {
                pugi::xml_document sheet;
                archive.parse(part, sheet);
                append_paragraph(out, "## " + name);

                std::string table;
                bool header_done = false;
                for (pugi::xml_node row : sheet.document_element().child("sheetData").children("row")) {
                    std::vector<std::string> cells;
                    for (pugi::xml_node c : row.children("c")) {
                        std::string_view type = c.attribute("t").value();
                        std::string value;
                        if (type == "s") {
                            size_t index = c.child("v").text().as_ullong(shared.size());
                            if (index < shared.size()) value = shared[index];
                        } else if (type == "inlineStr") {
                            value = cell_text(c.child("is"));
                        } else {
                            value = c.child("v").text().get();
                        }
                        std::replace(value.begin(), value.end(), '\n', ' ');
                        cells.push_back(std::move(value));
                    }
                    if (std::all_of(cells.begin(), cells.end(), [](const std::string& v) { return v.empty(); })) {
                        continue;
                    }

                    std::string line = "|";
                    for (const auto& v : cells) line += " " + v + " |";
                    if (!table.empty()) table += '\n';
                    table += line;
                    if (!header_done) {
                        table += "\n|";
                        for (size_t i = 0; i < cells.size(); ++i) table += " --- |";
                        header_done = true;
                    }
                }
                append_paragraph(out, std::move(table));
            }
            return out;
        }

        void collect_odf(const pugi::xml_node& node, std::string& line) {
            for (pugi::xml_node child : node.children()) {
                if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
                    line += child.value();
                    continue;
                }
                std::string_view name = child.name();
                if (name == "text:s") {
                    line.append(child.attribute("text:c").as_uint(1), ' ');
                } else if (name == "text:tab") {
                    line += '\t';
                } else if (name == "text:line-break") {
                    line += '\n';
                } else if (name == "text:note") {
                    continue; // footnote bodies are their own paragraphs
                } else {
                    collect_odf(child, line);
                }
            }
        }

        std::string odf_to_text(const Archive& archive) {
            pugi::xml_document doc;
            archive.parse("content.xml", doc);

            pugi::xpath_node_set paragraphs = doc.select_nodes("//text:h | //text:p");
            paragraphs.sort();

            std::string out;
            for (pugi::xpath_node hit : paragraphs) {
                pugi::xml_node node = hit.node();
                std::string line;
                collect_odf(node, line);
                if (std::strcmp(node.name(), "text:h") == 0 && !line.empty()) {
                    int level = std::clamp(node.attribute("text:outline-level").as_int(1), 1, 6);
                    line = std::string(level, '#') + " " + line;
                }
                append_paragraph(out, std::move(line));
            }
            return out;
        }

    }

    std::string office_to_text(const std::string& document_id, Format format, std::string_view bytes) {
        Archive archive(document_id, bytes);

        std::string text;
        try {
            switch (format) {
                case Format::Docx: text = docx_to_text(archive); break;
                case Format::Pptx: text = pptx_to_text(archive); break;
                case Format::Xlsx: text = xlsx_to_text(archive); break;
                case Format::OpenDocument: text = odf_to_text(archive); break;
                default:
                    throw LoadError(document_id, std::string("not an office format: ") + to_string(format));
            }
        } catch (const pugi::xpath_exception& e) {
            throw LoadError(document_id, std::string("XPath failure: ") + e.what());
        }

        if (!text.empty()) text += '\n';
        return text;
    }

}
