#include "indexer.hpp"
#include "embedder.hpp"
#include "job_queue.hpp"
#include "loader.hpp"
#include "vector_store.hpp"
#include "ragmill/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>

namespace ragmill::engine {

    Indexer::Indexer(const Config& config, Embedder& embedder, StoreFactory store_factory)
        : m_config(config),
          m_embedder(embedder),
          m_store_factory(std::move(store_factory)),
          m_chunker(config.chunking),
          m_breaker(config.breaker_failure_threshold, config.breaker_cooldown) {}

    Indexer::Outcome Indexer::index_document(VectorStore& store, const Document& doc, bool incremental,
                                             const CancellationToken& cancel, size_t& chunks_written) {
        chunks_written = 0;
        const std::string model = m_embedder.model_id();

        auto record = store.get_document(doc.id);
        if (incremental && record && record->status == DocumentStatus::Processed &&
            record->hash == doc.hash && record->model == model) {
            return Outcome::Skipped;
        }

        auto chunks = m_chunker.split(doc.id, doc.content);
        for (auto& chunk : chunks) {
            if (cancel.cancelled()) return Outcome::Cancelled;
            chunk.embedding = embed_with_retry(m_embedder, chunk.content, m_config.retry, m_breaker, cancel);
            chunk.model = model;
        }
        if (cancel.cancelled()) return Outcome::Cancelled;

        DocumentRecord updated;
        updated.id = doc.id;
        updated.hash = doc.hash;
        updated.size = doc.size;
        updated.last_modified_ms = doc.last_modified_ms;
        updated.status = DocumentStatus::Processed;
        updated.model = model;
        updated.chunk_count = chunks.size();

        // Hash and processed status are recorded in the same transaction as the chunks.
        store.replace_document(updated, chunks);
        chunks_written = chunks.size();

        export_processed(doc);
        return Outcome::Indexed;
    }

    IndexSummary Indexer::run(const IndexOptions& options, const CancellationToken& cancel) {
        IndexSummary summary;
        std::mutex summary_mutex;

        Loader loader(options.source_root);
        auto entries = loader.list();

        size_t worker_count = std::max<size_t>(1, std::min(m_config.index_workers, entries.size()));
        std::vector<std::unique_ptr<VectorStore>> stores;
        for (size_t i = 0; i < worker_count; ++i) {
            stores.push_back(m_store_factory());
        }
        if (stores.front()->options().dimension != m_embedder.dimension()) {
            throw ConfigMismatchError("embedder " + m_embedder.model_id() + " produces dimension " +
                                      std::to_string(m_embedder.dimension()) + " but the store holds dimension " +
                                      std::to_string(stores.front()->options().dimension));
        }

        if (m_config.verbose) {
            std::cerr << "[Indexer] " << entries.size() << " files under " << options.source_root
                      << " (" << (options.incremental ? "incremental" : "full") << ", "
                      << worker_count << " workers, model " << m_embedder.model_id() << ")\n";
        }

        JobQueue<SourceEntry> queue;
        for (auto& entry : entries) {
            queue.push(std::move(entry));
        }
        queue.close();

        auto add_failure = [&](const std::string& id, const std::string& kind, const std::string& message) {
            std::cerr << "[Indexer] Failed " << id << ": " << message << "\n";
            std::lock_guard<std::mutex> lock(summary_mutex);
            ++summary.documents_failed;
            summary.failures.push_back({id, kind, message});
        };

        auto worker = [&](VectorStore& store) {
            SourceEntry entry;
            while (queue.pop(entry)) {
                if (cancel.cancelled()) {
                    queue.clear();
                    break;
                }

                Document doc;
                bool loaded = false;
                try {
                    doc = loader.load(entry);
                    loaded = true;

                    size_t written = 0;
                    Outcome outcome = index_document(store, doc, options.incremental, cancel, written);

                    std::lock_guard<std::mutex> lock(summary_mutex);
                    if (outcome == Outcome::Indexed) {
                        ++summary.documents_indexed;
                        summary.chunks_written += written;
                        if (m_config.verbose) {
                            std::cerr << "[Indexer] Indexed " << doc.id << " (" << written << " chunks)\n";
                        }
                    } else if (outcome == Outcome::Skipped) {
                        ++summary.documents_skipped;
                    }
                } catch (const LoadError& e) {
                    record_failed_state(store, entry.id, nullptr);
                    add_failure(entry.id, e.kind(), e.what());
                } catch (const Error& e) {
                    if (cancel.cancelled()) break;
                    record_failed_state(store, entry.id, loaded ? &doc : nullptr);
                    add_failure(entry.id, e.kind(), e.what());
                } catch (const std::exception& e) {
                    // Anything escaping here would terminate the worker thread.
                    record_failed_state(store, entry.id, loaded ? &doc : nullptr);
                    add_failure(entry.id, loaded ? "Error" : "LoadError", e.what());
                }
            }
        };

        std::vector<std::thread> threads;
        for (size_t i = 1; i < worker_count; ++i) {
            threads.emplace_back(worker, std::ref(*stores[i]));
        }
        worker(*stores[0]);
        for (auto& t : threads) {
            t.join();
        }

        summary.cancelled = cancel.cancelled();
        std::sort(summary.failures.begin(), summary.failures.end(),
                  [](const IndexFailure& a, const IndexFailure& b) { return a.document_id < b.document_id; });

        if (m_config.verbose) {
            std::cerr << "[Indexer] Done. Indexed: " << summary.documents_indexed
                      << ", Skipped: " << summary.documents_skipped
                      << ", Failed: " << summary.documents_failed
                      << ", Chunks: " << summary.chunks_written
                      << (summary.cancelled ? " (cancelled)" : "") << "\n";
        }
        return summary;
    }

    void Indexer::record_failed_state(VectorStore& store, const std::string& id, const Document* doc) {
        try {
            if (store.mark_document_status(id, DocumentStatus::Stale)) return;
            if (!doc) return;

            // Never indexed: remember it with an empty hash so the next run retries it.
            DocumentRecord record;
            record.id = id;
            record.size = doc->size;
            record.last_modified_ms = doc->last_modified_ms;
            record.status = DocumentStatus::Unprocessed;
            store.set_document_hash(record);
        } catch (const StoreError& e) {
            std::cerr << "[Indexer] Could not record failed state for " << id << ": " << e.what() << "\n";
        }
    }

    std::filesystem::path Indexer::processed_path(const std::string& id) const {
        return m_config.processed_dir / (id + ".md");
    }

    void Indexer::export_processed(const Document& doc) const {
        if (m_config.processed_dir.empty()) return;

        auto target = processed_path(doc.id);
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << doc.content;
        if (!out) {
            std::cerr << "[Indexer] Could not write processed text to " << target << "\n";
        }
    }

    bool Indexer::remove_document(const std::string& document_id) {
        auto store = m_store_factory();
        bool removed = store->remove_document(document_id);

        if (removed && !m_config.processed_dir.empty()) {
            std::error_code ec;
            std::filesystem::remove(processed_path(document_id), ec);
        }
        if (m_config.verbose) {
            std::cerr << "[Indexer] " << (removed ? "Removed " : "Not indexed: ") << document_id << "\n";
        }
        return removed;
    }

}
