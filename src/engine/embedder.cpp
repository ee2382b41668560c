#include "embedder.hpp"
#include "config.hpp"
#include "ragmill/errors.hpp"

namespace ragmill::engine {

    std::string Embedder::clip_input(const std::string& text, size_t max_bytes) {
        if (text.size() <= max_bytes) return text;
        size_t cut = max_bytes;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        return text.substr(0, cut);
    }

    void Embedder::check_dimension(const std::vector<float>& vector) const {
        if (vector.size() != dimension()) {
            throw EmbeddingError(model_id() + " returned " + std::to_string(vector.size()) +
                                 " values, expected " + std::to_string(dimension()), false);
        }
    }

    std::unique_ptr<Embedder> create_embedder(const Config& config) {
        const auto& backend = config.embedding_backend;
        if (backend == "ollama") {
            return create_ollama_embedder(config.embedding_model, config.embedding_endpoint,
                                          config.embedding_dimension, config.embedding_max_input);
        }
        if (backend == "openai") {
            if (config.openai_key.empty()) {
                throw ValidationError("embedding_backend 'openai' needs openai_key or OPENAI_API_KEY");
            }
            return create_openai_embedder(config.openai_key, config.embedding_model,
                                          config.embedding_dimension, config.embedding_max_input);
        }
        if (backend == "hash") {
            return create_hash_embedder(config.embedding_dimension, config.embedding_max_input,
                                        config.embedding_model);
        }
        throw ValidationError("unknown embedding_backend '" + backend + "'");
    }

}
