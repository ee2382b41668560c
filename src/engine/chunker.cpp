#include "chunker.hpp"
#include "ragmill/errors.hpp"

#include <algorithm>

namespace ragmill::engine {

    namespace {

        bool is_continuation_byte(char c) {
            return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
        }

        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        // Moves pos back to the first byte of the code point containing it.
        size_t align_back(const std::string& text, size_t pos) {
            while (pos > 0 && pos < text.size() && is_continuation_byte(text[pos])) --pos;
            return pos;
        }

        // Moves pos forward to the first byte of the next code point at or after it.
        size_t align_forward(const std::string& text, size_t pos) {
            while (pos < text.size() && is_continuation_byte(text[pos])) ++pos;
            return pos;
        }

        bool ends_paragraph(const std::string& text, size_t cut) {
            return cut >= 2 && text[cut - 1] == '\n' && text[cut - 2] == '\n';
        }

        // 。！？ in UTF-8
        bool ends_cjk_sentence(const std::string& text, size_t cut) {
            if (cut < 3) return false;
            const auto* p = reinterpret_cast<const unsigned char*>(text.data()) + cut - 3;
            return (p[0] == 0xE3 && p[1] == 0x80 && p[2] == 0x82) ||
                   (p[0] == 0xEF && p[1] == 0xBC && (p[2] == 0x81 || p[2] == 0x9F));
        }

        bool ends_sentence(const std::string& text, size_t cut) {
            char last = text[cut - 1];
            if (last == '\n') return true;
            if ((last == '.' || last == '!' || last == '?') && cut < text.size() && is_space(text[cut])) {
                return true;
            }
            return ends_cjk_sentence(text, cut);
        }

        bool ends_word(const std::string& text, size_t cut) {
            return text[cut - 1] == ' ' || text[cut - 1] == '\t';
        }

    }

    void ChunkerConfig::validate() const {
        if (chunk_size == 0) {
            throw ValidationError("chunk_size must be greater than zero");
        }
        if (overlap >= chunk_size) {
            throw ValidationError("chunk overlap (" + std::to_string(overlap) +
                                  ") must be smaller than chunk_size (" + std::to_string(chunk_size) + ")");
        }
        if (min_chunk_size > chunk_size) {
            throw ValidationError("min_chunk_size (" + std::to_string(min_chunk_size) +
                                  ") must not exceed chunk_size (" + std::to_string(chunk_size) + ")");
        }
    }

    size_t ChunkerConfig::max_chunk_length() const {
        return min_chunk_size > 0 ? chunk_size + min_chunk_size - 1 : chunk_size;
    }

    Chunker::Chunker(const ChunkerConfig& config) : m_config(config) {
        m_config.validate();
    }

    size_t Chunker::find_cut(const std::string& text, size_t start, size_t limit) const {
        // Boundaries in the first half of the window are ignored so chunks keep a useful size.
        // A chunk must also outgrow the overlap, otherwise the next one could not advance.
        size_t floor = start + std::max(m_config.chunk_size / 2, m_config.overlap);

        for (size_t cut = limit; cut > floor; --cut) {
            if (ends_paragraph(text, cut)) return cut;
        }
        for (size_t cut = limit; cut > floor; --cut) {
            if (ends_sentence(text, cut)) return cut;
        }
        for (size_t cut = limit; cut > floor; --cut) {
            if (ends_word(text, cut)) return cut;
        }

        size_t cut = align_back(text, limit);
        return cut > start ? cut : limit;
    }

    std::vector<Chunk> Chunker::split(const std::string& document_id, const std::string& text) const {
        std::vector<Chunk> chunks;
        const size_t n = text.size();
        if (n == 0) return chunks;

        size_t start = 0;
        while (true) {
            size_t end;
            if (start + m_config.chunk_size >= n) {
                end = n;
            } else {
                end = find_cut(text, start, start + m_config.chunk_size);
                if (m_config.min_chunk_size > 0 && n - end < m_config.min_chunk_size) {
                    end = n; // merge the runt tail into this chunk
                }
            }

            Chunk chunk;
            chunk.document_id = document_id;
            chunk.index = chunks.size();
            chunk.start_offset = start;
            chunk.end_offset = end;
            chunk.content = text.substr(start, end - start);
            chunks.push_back(std::move(chunk));

            if (end == n) break;

            size_t next = end;
            if (m_config.overlap > 0) {
                next = end - start > m_config.overlap ? align_back(text, end - m_config.overlap) : start;
                if (next <= start) {
                    // A hard cut pulled back to a code point boundary can be no longer than the overlap.
                    next = align_forward(text, start + 1);
                }
            }
            start = next;
        }

        return chunks;
    }

}
