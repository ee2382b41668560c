#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ragmill::engine {

    enum class DocumentStatus {
        Unprocessed,
        Processed,
        Stale
    };

    const char* to_string(DocumentStatus status);
    DocumentStatus document_status_from_string(const std::string& value);

    enum class Metric {
        Cosine,
        InnerProduct
    };

    const char* to_string(Metric metric);
    Metric metric_from_string(const std::string& value);

    /**
     * @brief A source file after format normalization.
     * The id is the path relative to the source root with '/' separators.
     */
    struct Document {
        std::string id;
        std::filesystem::path path;
        std::string content;
        std::string hash;
        std::string format;
        std::uintmax_t size = 0;
        int64_t last_modified_ms = 0;
        DocumentStatus status = DocumentStatus::Unprocessed;
    };

    /**
     * @brief Persisted bookkeeping for one document (the incremental indexing state).
     */
    struct DocumentRecord {
        std::string id;
        std::string hash;
        std::uintmax_t size = 0;
        int64_t last_modified_ms = 0;
        DocumentStatus status = DocumentStatus::Unprocessed;
        std::string model;
        size_t chunk_count = 0;
        int64_t updated_at_ms = 0;
    };

    struct Chunk {
        int64_t id = 0; // store row id, 0 until stored
        std::string document_id;
        size_t index = 0;
        std::string content;
        size_t start_offset = 0;
        size_t end_offset = 0; // exclusive
        std::vector<float> embedding;
        std::string model;
    };

    struct ScoredChunk {
        Chunk chunk;
        float score = 0.0f;
    };

    // Ordered by score descending, ties by (document id, chunk index) ascending.
    using RetrievalResult = std::vector<ScoredChunk>;

}
