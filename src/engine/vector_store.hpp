#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>
#include "ragmill/types.hpp"

namespace ragmill::engine {

    struct StoreOptions {
        size_t dimension = 384;
        Metric metric = Metric::Cosine;
        int busy_timeout_ms = 30000;
    };

    struct NearestQuery {
        std::vector<float> vector;
        size_t k = 5;
        std::optional<std::string> model;   // only rows embedded by this model
        std::optional<float> threshold;     // drop rows scoring below
    };

    /**
     * @brief Chunk and document persistence on SQLite (WAL mode).
     *
     * One VectorStore is one connection. Threads that work concurrently (indexing workers,
     * a retriever) each open their own VectorStore on the same file; SQLite transactions
     * then give readers a consistent snapshot while a writer replaces a document.
     * Every method throws StoreError on database failure.
     */
    class VectorStore {
    public:
        VectorStore();
        ~VectorStore();

        VectorStore(const VectorStore&) = delete;
        VectorStore& operator=(const VectorStore&) = delete;

        /**
         * @brief Opens (creating if needed) the database and its schema.
         * @throws ConfigMismatchError if the file was created with another dimension or metric.
         */
        void open(const std::filesystem::path& path, const StoreOptions& options);
        void close();
        bool is_open() const { return m_db != nullptr; }

        const StoreOptions& options() const { return m_options; }

        /**
         * @brief Inserts a chunk or overwrites the one with the same (document, index).
         * @throws ValidationError if the vector does not have the store's dimension.
         */
        void upsert_chunk(const Chunk& chunk);

        /**
         * @return Number of chunks removed.
         */
        size_t delete_chunks_for_document(const std::string& document_id);

        /**
         * @brief Atomically swaps a document's chunks and records its new hash as processed.
         *
         * Delete, inserts and the document row update run in one transaction; concurrent
         * readers see either the old or the new chunk set, never a mix or an empty document.
         * Nothing is written if any step fails.
         * @throws ValidationError for wrong dimensions or non-contiguous chunk indices.
         */
        void replace_document(const DocumentRecord& record, const std::vector<Chunk>& chunks);

        std::optional<DocumentRecord> get_document(const std::string& id);
        std::optional<std::string> get_document_hash(const std::string& id);

        /**
         * @brief Inserts or updates the document's bookkeeping row (hash, status, model...).
         */
        void set_document_hash(const DocumentRecord& record);

        /**
         * @return false if no such document is recorded.
         */
        bool mark_document_status(const std::string& id, DocumentStatus status);

        /**
         * @brief Removes a document row and all of its chunks.
         * @return false if the document was unknown.
         */
        bool remove_document(const std::string& id);

        std::vector<DocumentRecord> list_documents();

        /**
         * @brief Number of documents in processed state.
         */
        size_t document_count();
        size_t chunk_count();
        size_t chunk_count(const std::string& document_id);

        /**
         * @brief Distinct embedding model identifiers present in the chunk table.
         */
        std::vector<std::string> models();

        /**
         * @brief Chunks of one document with index in [first, last], in order. No vectors.
         */
        std::vector<Chunk> chunks_for_document(const std::string& document_id, size_t first = 0,
                                               size_t last = static_cast<size_t>(INT64_MAX));

        /**
         * @brief k best chunks by the configured metric.
         * Ordered by score descending, ties by (document id, index) ascending. Vectors are not returned.
         */
        RetrievalResult nearest(const NearestQuery& query);

        static float similarity(Metric metric, const float* a, const float* b, size_t dim);

        /**
         * @brief Holds one read snapshot open across several calls on this store.
         */
        class ReadTransaction {
        public:
            explicit ReadTransaction(VectorStore& store);
            ~ReadTransaction();

            ReadTransaction(const ReadTransaction&) = delete;
            ReadTransaction& operator=(const ReadTransaction&) = delete;

        private:
            VectorStore& m_store;
            std::unique_lock<std::recursive_mutex> m_lock;
        };

    private:
        sqlite3* m_db = nullptr;
        StoreOptions m_options;
        std::recursive_mutex m_mutex;

        void exec(const char* sql);
        void initialize_schema();
        void check_vector(const std::vector<float>& vector) const;
        void insert_chunk(const Chunk& chunk);
        void write_document(const DocumentRecord& record);
        sqlite3* handle() const;
    };

}
