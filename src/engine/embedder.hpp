#pragma once

#include <string>
#include <vector>
#include <memory>
#include "ragmill/types.hpp"

namespace ragmill::engine {

    struct Config;

    /**
     * @brief Abstract base class for embedding generation.
     *
     * Implementations must be safe to call from several indexing workers at once.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @param text The input text chunk, clipped to max_input_length().
         * @return Exactly dimension() floats.
         * @throws EmbeddingError on model or transport failure.
         */
        virtual std::vector<float> embed(const std::string& text) = 0;

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         */
        virtual size_t dimension() const = 0;

        /**
         * @brief Longest accepted input, in bytes. Longer input is truncated.
         */
        virtual size_t max_input_length() const = 0;

        /**
         * @brief Identifier stored with every vector, e.g. "ollama:all-minilm".
         */
        virtual std::string model_id() const = 0;

        /**
         * @brief Truncates text to at most max_bytes without splitting a UTF-8 sequence.
         */
        static std::string clip_input(const std::string& text, size_t max_bytes);

    protected:
        /**
         * @brief Throws a non-retryable EmbeddingError if the model answered with the wrong size.
         */
        void check_dimension(const std::vector<float>& vector) const;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     size_t dimension, size_t max_input);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     size_t dimension, size_t max_input);

    /**
     * @brief Deterministic hashing-trick embedder. Needs no model; equal text gives equal vectors.
     */
    std::unique_ptr<Embedder> create_hash_embedder(size_t dimension, size_t max_input = 8192,
                                                   const std::string& name = "fnv");

    /**
     * @brief Builds the backend named by config.embedding_backend.
     * @throws ValidationError for an unknown backend or missing credentials.
     */
    std::unique_ptr<Embedder> create_embedder(const Config& config);

}
