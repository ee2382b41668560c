#include "embedder.hpp"
#include "http.hpp"
#include "ragmill/errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ragmill::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint, size_t dimension, size_t max_input)
            : m_model(model), m_endpoint(endpoint), m_dimension(dimension), m_max_input(max_input) {}

        std::vector<float> embed(const std::string& text) override {
            std::string json_str;
            try {
                json body = {
                    {"model", m_model},
                    {"prompt", clip_input(text, m_max_input)}
                };
                json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);
            } catch (const json::exception& e) {
                throw EmbeddingError(std::string("[OllamaEmbedder] JSON serialization error: ") + e.what(), false);
            }

            auto response = http::post_json(m_endpoint, json_str);
            if (response.status != 200) {
                throw EmbeddingError("[OllamaEmbedder] HTTP " + std::to_string(response.status) + ": " +
                                         response.body.substr(0, 200),
                                     http::is_retryable_status(response.status));
            }

            std::vector<float> embedding;
            try {
                auto resp_json = json::parse(response.body);
                if (!resp_json.contains("embedding")) {
                    throw EmbeddingError("[OllamaEmbedder] response has no 'embedding' field", false);
                }
                embedding = resp_json["embedding"].get<std::vector<float>>();
            } catch (const json::exception& e) {
                throw EmbeddingError(std::string("[OllamaEmbedder] JSON parse error: ") + e.what());
            }
            check_dimension(embedding);
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }
        size_t max_input_length() const override { return m_max_input; }
        std::string model_id() const override { return "ollama:" + m_model; }

    private:
        std::string m_model;
        std::string m_endpoint;
        size_t m_dimension;
        size_t m_max_input;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint,
                                                     size_t dimension, size_t max_input) {
        return std::make_unique<OllamaEmbedder>(model, endpoint, dimension, max_input);
    }

}
