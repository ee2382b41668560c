#include "retriever.hpp"
#include "embedder.hpp"
#include "ragmill/errors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace ragmill::engine {

    Retriever::Retriever(const Config& config, Embedder& embedder, VectorStore& store)
        : m_config(config),
          m_embedder(embedder),
          m_store(store),
          m_breaker(config.breaker_failure_threshold, config.breaker_cooldown) {}

    size_t Retriever::checked_top_k(const std::string& text, size_t top_k,
                                    const std::optional<float>& threshold) const {
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw ValidationError("query text is empty");
        }
        if (top_k == 0) {
            throw ValidationError("top_k must be at least 1");
        }
        if (threshold && m_config.metric == Metric::Cosine && (*threshold < -1.0f || *threshold > 1.0f)) {
            throw ValidationError("similarity threshold must lie in [-1, 1] for cosine similarity");
        }
        return std::min(top_k, m_config.max_top_k);
    }

    std::vector<float> Retriever::embed_query(const std::string& text, const CancellationToken& cancel) {
        if (m_embedder.dimension() != m_store.options().dimension) {
            throw ConfigMismatchError("query embedder " + m_embedder.model_id() + " has dimension " +
                                      std::to_string(m_embedder.dimension()) + ", the store holds " +
                                      std::to_string(m_store.options().dimension));
        }
        if (cancel.cancelled()) throw CancelledError("query cancelled");

        try {
            return embed_with_retry(m_embedder, text, m_config.retry, m_breaker, cancel);
        } catch (const EmbeddingError&) {
            if (cancel.cancelled()) throw CancelledError("query cancelled");
            throw;
        }
    }

    void Retriever::check_models() {
        const std::string model = m_embedder.model_id();
        auto models = m_store.models();
        if (models.empty() || std::find(models.begin(), models.end(), model) != models.end()) return;

        std::string indexed;
        for (const auto& m : models) indexed += (indexed.empty() ? "" : ", ") + m;
        throw ConfigMismatchError("corpus is indexed with " + indexed + ", query model is " + model +
                                  "; re-index or configure the matching model");
    }

    std::optional<NearestQuery> Retriever::prepare(const std::string& text, size_t top_k,
                                                   std::optional<float> threshold,
                                                   const CancellationToken& cancel) {
        size_t k = checked_top_k(text, top_k, threshold);
        check_models();
        if (m_store.chunk_count() == 0) return std::nullopt;

        // Embedding may take a network round trip; no snapshot is held meanwhile.
        NearestQuery nearest;
        nearest.vector = embed_query(text, cancel);
        nearest.k = k;
        nearest.model = m_embedder.model_id();
        nearest.threshold = threshold;

        if (cancel.cancelled()) throw CancelledError("query cancelled");
        return nearest;
    }

    RetrievalResult Retriever::query(const std::string& text, size_t top_k, std::optional<float> threshold,
                                     const CancellationToken& cancel) {
        auto nearest = prepare(text, top_k, threshold, cancel);
        if (!nearest) return {};

        VectorStore::ReadTransaction snapshot(m_store);
        check_models();
        return m_store.nearest(*nearest);
    }

    RetrievalResult Retriever::query(const std::string& text) {
        return query(text, m_config.default_top_k, m_config.similarity_threshold);
    }

    std::vector<SearchHit> Retriever::search(const std::string& text, const SearchOptions& options,
                                             const CancellationToken& cancel) {
        std::vector<SearchHit> hits;
        auto nearest = prepare(text, options.top_k, options.threshold, cancel);
        if (!nearest) return hits;

        VectorStore::ReadTransaction snapshot(m_store);
        check_models();
        auto matches = m_store.nearest(*nearest);

        using Key = std::pair<std::string, size_t>;
        std::map<Key, float> matched;
        for (const auto& m : matches) {
            matched.emplace(Key{m.chunk.document_id, m.chunk.index}, m.score);
        }

        auto emit = [&](const Chunk& chunk, float score, bool full) {
            SearchHit hit;
            hit.document_id = chunk.document_id;
            hit.content = chunk.content;
            hit.chunk_index = chunk.index;
            auto own = matched.find({chunk.document_id, chunk.index});
            hit.similarity = own != matched.end() ? own->second : score;
            hit.is_context = own == matched.end();
            hit.is_full_document = full;
            hits.push_back(std::move(hit));
        };

        std::set<Key> emitted;
        std::set<std::string> whole_documents;

        for (const auto& m : matches) {
            const auto& id = m.chunk.document_id;
            const size_t index = m.chunk.index;

            if (options.full_document) {
                if (!whole_documents.insert(id).second) continue;
                for (const auto& chunk : m_store.chunks_for_document(id)) {
                    emit(chunk, m.score, true);
                }
            } else if (options.with_context && options.context_size > 0) {
                size_t first = index >= options.context_size ? index - options.context_size : 0;
                for (const auto& chunk : m_store.chunks_for_document(id, first, index + options.context_size)) {
                    if (!emitted.insert({id, chunk.index}).second) continue;
                    emit(chunk, m.score, false);
                }
            } else {
                emit(m.chunk, m.score, false);
            }
        }
        return hits;
    }

    size_t Retriever::document_count() {
        return m_store.document_count();
    }

}
