#include "vector_store.hpp"
#include "ragmill/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>

namespace ragmill::engine {

    namespace {

        int64_t now_ms() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        class Statement {
        public:
            Statement(sqlite3* db, const char* sql) : m_db(db) {
                if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
                    throw StoreError(std::string("[VectorStore] prepare failed: ") + sqlite3_errmsg(db));
                }
            }
            ~Statement() { sqlite3_finalize(m_stmt); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            void bind_text(int index, const std::string& value) {
                check(sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
            }
            void bind_int64(int index, int64_t value) {
                check(sqlite3_bind_int64(m_stmt, index, value));
            }
            void bind_blob(int index, const void* data, size_t bytes) {
                check(sqlite3_bind_blob(m_stmt, index, data, static_cast<int>(bytes), SQLITE_TRANSIENT));
            }

            /**
             * @return true while rows are produced, false when done.
             */
            bool step() {
                int rc = sqlite3_step(m_stmt);
                if (rc == SQLITE_ROW) return true;
                if (rc == SQLITE_DONE) return false;
                throw StoreError(std::string("[VectorStore] step failed: ") + sqlite3_errmsg(m_db));
            }

            int64_t column_int64(int col) const { return sqlite3_column_int64(m_stmt, col); }

            std::string column_text(int col) const {
                const auto* text = sqlite3_column_text(m_stmt, col);
                return text ? std::string(reinterpret_cast<const char*>(text),
                                          static_cast<size_t>(sqlite3_column_bytes(m_stmt, col)))
                            : std::string();
            }

            const void* column_blob(int col, size_t& bytes) const {
                const void* blob = sqlite3_column_blob(m_stmt, col);
                bytes = static_cast<size_t>(sqlite3_column_bytes(m_stmt, col));
                return blob;
            }

        private:
            sqlite3* m_db;
            sqlite3_stmt* m_stmt = nullptr;

            void check(int rc) {
                if (rc != SQLITE_OK) {
                    throw StoreError(std::string("[VectorStore] bind failed: ") + sqlite3_errmsg(m_db));
                }
            }
        };

        // Rolls back unless commit() was reached.
        class WriteTransaction {
        public:
            explicit WriteTransaction(sqlite3* db) : m_db(db) {
                run("BEGIN IMMEDIATE;");
            }
            ~WriteTransaction() {
                if (!m_done && sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                    std::cerr << "[VectorStore] Rollback failed: " << sqlite3_errmsg(m_db) << "\n";
                }
            }
            void commit() {
                run("COMMIT;");
                m_done = true;
            }

        private:
            sqlite3* m_db;
            bool m_done = false;

            void run(const char* sql) {
                char* err_msg = nullptr;
                if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
                    std::string message = err_msg ? err_msg : sqlite3_errmsg(m_db);
                    sqlite3_free(err_msg);
                    throw StoreError("[VectorStore] " + std::string(sql) + " failed: " + message);
                }
            }
        };

        DocumentRecord read_document(const Statement& stmt) {
            DocumentRecord record;
            record.id = stmt.column_text(0);
            record.hash = stmt.column_text(1);
            record.size = static_cast<std::uintmax_t>(stmt.column_int64(2));
            record.last_modified_ms = stmt.column_int64(3);
            record.status = document_status_from_string(stmt.column_text(4));
            record.model = stmt.column_text(5);
            record.chunk_count = static_cast<size_t>(stmt.column_int64(6));
            record.updated_at_ms = stmt.column_int64(7);
            return record;
        }

        constexpr const char* kDocumentColumns =
            "id, hash, size, last_modified, status, model, chunk_count, updated_at";

    }

    VectorStore::VectorStore() = default;
    VectorStore::~VectorStore() { close(); }

    void VectorStore::open(const std::filesystem::path& path, const StoreOptions& options) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        close();

        if (options.dimension == 0) {
            throw ValidationError("vector dimension must be greater than zero");
        }
        m_options = options;

        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            close();
            throw StoreError("[VectorStore] Failed to open " + path.string() + ": " + message);
        }
        sqlite3_busy_timeout(m_db, options.busy_timeout_ms);

        try {
            exec("PRAGMA journal_mode=WAL;");
            exec("PRAGMA synchronous=NORMAL;");
            initialize_schema();
        } catch (...) {
            close();
            throw;
        }
    }

    void VectorStore::close() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    sqlite3* VectorStore::handle() const {
        if (!m_db) throw StoreError("[VectorStore] database is not open");
        return m_db;
    }

    void VectorStore::exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(handle(), sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg ? err_msg : sqlite3_errmsg(m_db);
            sqlite3_free(err_msg);
            throw StoreError("[VectorStore] " + message);
        }
    }

    void VectorStore::initialize_schema() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS meta ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS documents ("
            "  id TEXT PRIMARY KEY,"
            "  hash TEXT NOT NULL DEFAULT '',"
            "  size INTEGER NOT NULL DEFAULT 0,"
            "  last_modified INTEGER NOT NULL DEFAULT 0,"
            "  status TEXT NOT NULL DEFAULT 'unprocessed',"
            "  model TEXT NOT NULL DEFAULT '',"
            "  chunk_count INTEGER NOT NULL DEFAULT 0,"
            "  updated_at INTEGER NOT NULL DEFAULT 0"
            ");"
            "CREATE TABLE IF NOT EXISTS chunks ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  document_id TEXT NOT NULL,"
            "  seq INTEGER NOT NULL,"
            "  content TEXT NOT NULL,"
            "  start_offset INTEGER NOT NULL,"
            "  end_offset INTEGER NOT NULL,"
            "  model TEXT NOT NULL,"
            "  dimension INTEGER NOT NULL,"
            "  embedding BLOB NOT NULL,"
            "  UNIQUE(document_id, seq)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_chunks_model ON chunks(model);";

        WriteTransaction txn(m_db);
        exec(sql);

        {
            Statement insert(m_db, "INSERT OR IGNORE INTO meta (key, value) VALUES (?, ?);");
            insert.bind_text(1, "dimension");
            insert.bind_text(2, std::to_string(m_options.dimension));
            insert.step();
        }
        {
            Statement insert(m_db, "INSERT OR IGNORE INTO meta (key, value) VALUES (?, ?);");
            insert.bind_text(1, "metric");
            insert.bind_text(2, to_string(m_options.metric));
            insert.step();
        }

        std::string stored_dimension, stored_metric;
        {
            Statement query(m_db, "SELECT key, value FROM meta WHERE key IN ('dimension', 'metric');");
            while (query.step()) {
                (query.column_text(0) == "dimension" ? stored_dimension : stored_metric) = query.column_text(1);
            }
        }
        txn.commit();

        if (stored_dimension != std::to_string(m_options.dimension)) {
            throw ConfigMismatchError("store was created for dimension " + stored_dimension +
                                      ", configured dimension is " + std::to_string(m_options.dimension));
        }
        if (stored_metric != to_string(m_options.metric)) {
            throw ConfigMismatchError("store was created with metric " + stored_metric +
                                      ", configured metric is " + to_string(m_options.metric));
        }
    }

    void VectorStore::check_vector(const std::vector<float>& vector) const {
        if (vector.size() != m_options.dimension) {
            throw ValidationError("vector has dimension " + std::to_string(vector.size()) +
                                  ", store expects " + std::to_string(m_options.dimension));
        }
    }

    void VectorStore::insert_chunk(const Chunk& chunk) {
        Statement stmt(m_db,
            "INSERT INTO chunks (document_id, seq, content, start_offset, end_offset, model, dimension, embedding) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(document_id, seq) DO UPDATE SET "
            "content = excluded.content, "
            "start_offset = excluded.start_offset, "
            "end_offset = excluded.end_offset, "
            "model = excluded.model, "
            "dimension = excluded.dimension, "
            "embedding = excluded.embedding;");

        stmt.bind_text(1, chunk.document_id);
        stmt.bind_int64(2, static_cast<int64_t>(chunk.index));
        stmt.bind_text(3, chunk.content);
        stmt.bind_int64(4, static_cast<int64_t>(chunk.start_offset));
        stmt.bind_int64(5, static_cast<int64_t>(chunk.end_offset));
        stmt.bind_text(6, chunk.model);
        stmt.bind_int64(7, static_cast<int64_t>(chunk.embedding.size()));
        stmt.bind_blob(8, chunk.embedding.data(), chunk.embedding.size() * sizeof(float));
        stmt.step();
    }

    void VectorStore::write_document(const DocumentRecord& record) {
        Statement stmt(m_db,
            "INSERT INTO documents (id, hash, size, last_modified, status, model, chunk_count, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET "
            "hash = excluded.hash, "
            "size = excluded.size, "
            "last_modified = excluded.last_modified, "
            "status = excluded.status, "
            "model = excluded.model, "
            "chunk_count = excluded.chunk_count, "
            "updated_at = excluded.updated_at;");

        stmt.bind_text(1, record.id);
        stmt.bind_text(2, record.hash);
        stmt.bind_int64(3, static_cast<int64_t>(record.size));
        stmt.bind_int64(4, record.last_modified_ms);
        stmt.bind_text(5, to_string(record.status));
        stmt.bind_text(6, record.model);
        stmt.bind_int64(7, static_cast<int64_t>(record.chunk_count));
        stmt.bind_int64(8, now_ms());
        stmt.step();
    }

    void VectorStore::upsert_chunk(const Chunk& chunk) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        handle();
        check_vector(chunk.embedding);
        insert_chunk(chunk);
    }

    size_t VectorStore::delete_chunks_for_document(const std::string& document_id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(), "DELETE FROM chunks WHERE document_id = ?;");
        stmt.bind_text(1, document_id);
        stmt.step();
        return static_cast<size_t>(sqlite3_changes(m_db));
    }

    void VectorStore::replace_document(const DocumentRecord& record, const std::vector<Chunk>& chunks) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        handle();

        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& chunk = chunks[i];
            if (chunk.document_id != record.id) {
                throw ValidationError("chunk belongs to '" + chunk.document_id + "', not '" + record.id + "'");
            }
            if (chunk.index != i) {
                throw ValidationError("chunk indices of '" + record.id + "' must be contiguous from 0");
            }
            check_vector(chunk.embedding);
        }

        WriteTransaction txn(m_db);
        {
            Statement del(m_db, "DELETE FROM chunks WHERE document_id = ?;");
            del.bind_text(1, record.id);
            del.step();
        }
        for (const auto& chunk : chunks) {
            insert_chunk(chunk);
        }

        DocumentRecord done = record;
        done.status = DocumentStatus::Processed;
        done.chunk_count = chunks.size();
        write_document(done);
        txn.commit();
    }

    std::optional<DocumentRecord> VectorStore::get_document(const std::string& id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents WHERE id = ?;";
        Statement stmt(handle(), sql.c_str());
        stmt.bind_text(1, id);
        if (!stmt.step()) return std::nullopt;
        return read_document(stmt);
    }

    std::optional<std::string> VectorStore::get_document_hash(const std::string& id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(), "SELECT hash FROM documents WHERE id = ?;");
        stmt.bind_text(1, id);
        if (!stmt.step()) return std::nullopt;
        return stmt.column_text(0);
    }

    void VectorStore::set_document_hash(const DocumentRecord& record) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        handle();
        write_document(record);
    }

    bool VectorStore::mark_document_status(const std::string& id, DocumentStatus status) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(), "UPDATE documents SET status = ?, updated_at = ? WHERE id = ?;");
        stmt.bind_text(1, to_string(status));
        stmt.bind_int64(2, now_ms());
        stmt.bind_text(3, id);
        stmt.step();
        return sqlite3_changes(m_db) > 0;
    }

    bool VectorStore::remove_document(const std::string& id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        handle();

        WriteTransaction txn(m_db);
        size_t removed = 0;
        {
            Statement del(m_db, "DELETE FROM chunks WHERE document_id = ?;");
            del.bind_text(1, id);
            del.step();
            removed += static_cast<size_t>(sqlite3_changes(m_db));
        }
        {
            Statement del(m_db, "DELETE FROM documents WHERE id = ?;");
            del.bind_text(1, id);
            del.step();
            removed += static_cast<size_t>(sqlite3_changes(m_db));
        }
        txn.commit();
        return removed > 0;
    }

    std::vector<DocumentRecord> VectorStore::list_documents() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        std::string sql = std::string("SELECT ") + kDocumentColumns + " FROM documents ORDER BY id;";
        Statement stmt(handle(), sql.c_str());
        std::vector<DocumentRecord> records;
        while (stmt.step()) {
            records.push_back(read_document(stmt));
        }
        return records;
    }

    size_t VectorStore::document_count() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(), "SELECT COUNT(*) FROM documents WHERE status = 'processed';");
        return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
    }

    size_t VectorStore::chunk_count() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(), "SELECT COUNT(*) FROM chunks;");
        return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
    }

    size_t VectorStore::chunk_count(const std::string& document_id) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(), "SELECT COUNT(*) FROM chunks WHERE document_id = ?;");
        stmt.bind_text(1, document_id);
        return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
    }

    std::vector<std::string> VectorStore::models() {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(), "SELECT DISTINCT model FROM chunks ORDER BY model;");
        std::vector<std::string> result;
        while (stmt.step()) {
            result.push_back(stmt.column_text(0));
        }
        return result;
    }

    std::vector<Chunk> VectorStore::chunks_for_document(const std::string& document_id, size_t first, size_t last) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        Statement stmt(handle(),
            "SELECT id, seq, content, start_offset, end_offset, model FROM chunks "
            "WHERE document_id = ? AND seq BETWEEN ? AND ? ORDER BY seq;");
        stmt.bind_text(1, document_id);
        stmt.bind_int64(2, static_cast<int64_t>(first));
        stmt.bind_int64(3, static_cast<int64_t>(std::min<size_t>(last, static_cast<size_t>(INT64_MAX))));

        std::vector<Chunk> chunks;
        while (stmt.step()) {
            Chunk chunk;
            chunk.id = stmt.column_int64(0);
            chunk.document_id = document_id;
            chunk.index = static_cast<size_t>(stmt.column_int64(1));
            chunk.content = stmt.column_text(2);
            chunk.start_offset = static_cast<size_t>(stmt.column_int64(3));
            chunk.end_offset = static_cast<size_t>(stmt.column_int64(4));
            chunk.model = stmt.column_text(5);
            chunks.push_back(std::move(chunk));
        }
        return chunks;
    }

    float VectorStore::similarity(Metric metric, const float* a, const float* b, size_t dim) {
        double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
        for (size_t i = 0; i < dim; ++i) {
            dot += static_cast<double>(a[i]) * b[i];
            norm_a += static_cast<double>(a[i]) * a[i];
            norm_b += static_cast<double>(b[i]) * b[i];
        }
        if (metric == Metric::InnerProduct) return static_cast<float>(dot);
        if (norm_a == 0.0 || norm_b == 0.0) return 0.0f;
        double cosine = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
        return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
    }

    RetrievalResult VectorStore::nearest(const NearestQuery& query) {
        std::lock_guard<std::recursive_mutex> lock(m_mutex);
        handle();
        check_vector(query.vector);

        RetrievalResult candidates;
        if (query.k == 0) return candidates;

        // One statement reads one snapshot, so a concurrent replace_document is seen whole or not at all.
        const char* sql = query.model
            ? "SELECT id, document_id, seq, content, start_offset, end_offset, model, embedding "
              "FROM chunks WHERE model = ? AND dimension = ?;"
            : "SELECT id, document_id, seq, content, start_offset, end_offset, model, embedding "
              "FROM chunks WHERE dimension = ?;";
        Statement stmt(m_db, sql);
        int param = 1;
        if (query.model) stmt.bind_text(param++, *query.model);
        stmt.bind_int64(param, static_cast<int64_t>(m_options.dimension));

        std::vector<float> row(m_options.dimension);
        while (stmt.step()) {
            size_t bytes = 0;
            const void* blob = stmt.column_blob(7, bytes);
            if (!blob || bytes != row.size() * sizeof(float)) continue;
            std::memcpy(row.data(), blob, bytes);

            float score = similarity(m_options.metric, query.vector.data(), row.data(), row.size());
            if (query.threshold && score < *query.threshold) continue;

            ScoredChunk scored;
            scored.score = score;
            scored.chunk.id = stmt.column_int64(0);
            scored.chunk.document_id = stmt.column_text(1);
            scored.chunk.index = static_cast<size_t>(stmt.column_int64(2));
            scored.chunk.content = stmt.column_text(3);
            scored.chunk.start_offset = static_cast<size_t>(stmt.column_int64(4));
            scored.chunk.end_offset = static_cast<size_t>(stmt.column_int64(5));
            scored.chunk.model = stmt.column_text(6);
            candidates.push_back(std::move(scored));
        }

        auto better = [](const ScoredChunk& a, const ScoredChunk& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.chunk.document_id != b.chunk.document_id) return a.chunk.document_id < b.chunk.document_id;
            return a.chunk.index < b.chunk.index;
        };
        size_t k = std::min(query.k, candidates.size());
        std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(k),
                          candidates.end(), better);
        candidates.resize(k);
        return candidates;
    }

    VectorStore::ReadTransaction::ReadTransaction(VectorStore& store)
        : m_store(store), m_lock(store.m_mutex) {
        m_store.exec("BEGIN DEFERRED;");
    }

    VectorStore::ReadTransaction::~ReadTransaction() {
        if (m_store.m_db && sqlite3_exec(m_store.m_db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "[VectorStore] Ending read transaction failed: " << sqlite3_errmsg(m_store.m_db) << "\n";
        }
    }

}
