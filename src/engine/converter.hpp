#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ragmill::engine {

    enum class Format {
        PlainText,
        Markdown,
        Html,
        Json,
        Csv,
        Pdf,
        Docx,
        Xlsx,
        Pptx,
        OpenDocument,
        Unsupported
    };

    const char* to_string(Format format);

    /**
     * @brief Picks a format from the extension, falling back to sniffing the content.
     */
    Format detect_format(const std::filesystem::path& path, std::string_view bytes);

    /**
     * @brief Converts raw file bytes to normalized plain text (UTF-8, LF line endings, no BOM).
     * @throws LoadError for unsupported or malformed input.
     */
    std::string convert_to_text(const std::string& document_id, Format format, std::string_view bytes);

    bool is_valid_utf8(std::string_view text);

    /**
     * @brief True when this build links the library that converts the given container format.
     * Text formats are always convertible; Unsupported never is.
     */
    bool can_convert(Format format);

    /**
     * @brief Extracts the text layer of a PDF page by page, pages separated by a blank line.
     * Scanned pages without a text layer contribute nothing.
     * @throws LoadError for encrypted or unreadable files.
     */
    std::string pdf_to_text(const std::string& document_id, std::string_view bytes);

    /**
     * @brief Extracts text from a zipped office document (Docx, Xlsx, Pptx or OpenDocument).
     *
     * Headings become "#" lines, spreadsheet rows become "|" separated table rows, and
     * every sheet or slide gets a "##" title so the chunker can cut between them.
     * @throws LoadError for corrupt archives or missing parts.
     */
    std::string office_to_text(const std::string& document_id, Format format, std::string_view bytes);

    /**
     * @brief Strips markup from an HTML document, keeping block structure as line breaks.
     */
    std::string html_to_text(std::string_view html);

}
