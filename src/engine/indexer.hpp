#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "ragmill/types.hpp"
#include "cancellation.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "resilience.hpp"

namespace ragmill::engine {

    class Embedder;
    class VectorStore;

    struct IndexOptions {
        std::filesystem::path source_root;
        bool incremental = true; // false: re-index every document regardless of its hash
    };

    struct IndexFailure {
        std::string document_id;
        std::string kind;
        std::string message;
    };

    struct IndexSummary {
        size_t documents_indexed = 0;
        size_t documents_skipped = 0;
        size_t documents_failed = 0;
        size_t chunks_written = 0;
        bool cancelled = false;
        std::vector<IndexFailure> failures;
    };

    /**
     * @brief Drives documents through Loader, Chunker and Embedder into the VectorStore.
     *
     * Documents are processed in parallel by a bounded worker pool, chunks of one document
     * sequentially. Each document is committed all-or-nothing; a failing document is
     * reported in the summary and left stale or unprocessed.
     */
    class Indexer {
    public:
        /**
         * @brief Opens a new store connection. Called once per worker.
         */
        using StoreFactory = std::function<std::unique_ptr<VectorStore>()>;

        enum class Outcome { Indexed, Skipped, Cancelled };

        /**
         * @throws ValidationError if the chunking configuration is invalid.
         */
        Indexer(const Config& config, Embedder& embedder, StoreFactory store_factory);

        /**
         * @brief Indexes (or incrementally re-indexes) every document under options.source_root.
         * @throws LoadError if the source root cannot be listed, StoreError if no store
         *         connection can be opened, ConfigMismatchError if the embedder's dimension
         *         differs from the store's.
         */
        IndexSummary run(const IndexOptions& options, const CancellationToken& cancel = {});

        /**
         * @brief Chunks, embeds and commits one loaded document.
         * @param chunks_written Set to the number of chunks committed.
         * @throws EmbeddingError, StoreError, ValidationError; nothing is committed then.
         */
        Outcome index_document(VectorStore& store, const Document& doc, bool incremental,
                               const CancellationToken& cancel, size_t& chunks_written);

        /**
         * @brief Explicitly removes a document and its chunks.
         * @return false if the document was not indexed.
         */
        bool remove_document(const std::string& document_id);

        const Chunker& chunker() const { return m_chunker; }

    private:
        Config m_config;
        Embedder& m_embedder;
        StoreFactory m_store_factory;
        Chunker m_chunker;
        CircuitBreaker m_breaker;

        void record_failed_state(VectorStore& store, const std::string& id, const Document* doc);
        void export_processed(const Document& doc) const;
        std::filesystem::path processed_path(const std::string& id) const;
    };

}
