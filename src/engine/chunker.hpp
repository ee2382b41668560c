#pragma once

#include <string>
#include <vector>
#include "ragmill/types.hpp"

namespace ragmill::engine {

    /**
     * @brief Chunk sizing, in bytes of UTF-8 text.
     * max_chunk_length() must stay within the embedder's maximum input length.
     */
    struct ChunkerConfig {
        size_t chunk_size = 500;
        size_t overlap = 50;
        size_t min_chunk_size = 100;

        /**
         * @brief Throws ValidationError for impossible combinations (e.g. overlap >= chunk_size).
         */
        void validate() const;

        /**
         * @brief Longest chunk split() can emit, counting a runt tail merged into the last chunk.
         */
        size_t max_chunk_length() const;
    };

    class Chunker {
    public:
        explicit Chunker(const ChunkerConfig& config);

        /**
         * @brief Splits normalized text into ordered chunks without embeddings.
         *
         * Cuts prefer paragraph breaks, then sentence ends, then whitespace, and fall back
         * to a hard cut. Chunk i+1 repeats the last `overlap` bytes of chunk i (less only where a
         * code point boundary forces it). Every byte of
         * the input is covered by at least one chunk; empty input yields no chunks.
         */
        std::vector<Chunk> split(const std::string& document_id, const std::string& text) const;

        const ChunkerConfig& config() const { return m_config; }

    private:
        ChunkerConfig m_config;

        size_t find_cut(const std::string& text, size_t start, size_t limit) const;
    };

}
