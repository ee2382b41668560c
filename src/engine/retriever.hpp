#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ragmill/types.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "resilience.hpp"
#include "vector_store.hpp"

namespace ragmill::engine {

    class Embedder;

    struct SearchOptions {
        size_t top_k = 5;
        std::optional<float> threshold;
        bool with_context = false;
        size_t context_size = 1;
        bool full_document = false;
    };

    struct SearchHit {
        std::string document_id;
        std::string content;
        size_t chunk_index = 0;
        float similarity = 0.0f;
        bool is_context = false;       // neighbour of a match, not a match itself
        bool is_full_document = false; // emitted as part of a whole-document expansion
    };

    /**
     * @brief Answers similarity queries against the indexed corpus.
     *
     * The query is embedded with the same model as the corpus and the nearest-neighbour
     * search is restricted to chunks of that model. Read-only; one Retriever per store
     * connection.
     */
    class Retriever {
    public:
        Retriever(const Config& config, Embedder& embedder, VectorStore& store);

        /**
         * @brief top_k best chunks, best first, ties by (document id, chunk index).
         *
         * top_k above max_top_k is clamped; a corpus smaller than top_k returns what exists.
         * An empty corpus gives an empty result.
         * @throws ValidationError for empty text, top_k == 0 or an out-of-range threshold.
         * @throws ConfigMismatchError if the corpus was embedded with another model.
         * @throws EmbeddingError, StoreError, CancelledError.
         */
        RetrievalResult query(const std::string& text, size_t top_k, std::optional<float> threshold,
                              const CancellationToken& cancel = {});

        /**
         * @brief query() with the configured default top_k and threshold.
         */
        RetrievalResult query(const std::string& text);

        /**
         * @brief query() followed by optional neighbour or whole-document expansion, all
         * read from one snapshot of the store.
         */
        std::vector<SearchHit> search(const std::string& text, const SearchOptions& options,
                                      const CancellationToken& cancel = {});

        size_t document_count();

    private:
        Config m_config;
        Embedder& m_embedder;
        VectorStore& m_store;
        CircuitBreaker m_breaker;

        size_t checked_top_k(const std::string& text, size_t top_k, const std::optional<float>& threshold) const;
        std::vector<float> embed_query(const std::string& text, const CancellationToken& cancel);
        std::optional<NearestQuery> prepare(const std::string& text, size_t top_k, std::optional<float> threshold,
                                            const CancellationToken& cancel);
        void check_models();
    };

}
