#include "embedder.hpp"
#include "http.hpp"
#include "ragmill/errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ragmill::engine {

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model, size_t dimension, size_t max_input)
            : m_api_key(api_key), m_model(model), m_dimension(dimension), m_max_input(max_input) {}

        std::vector<float> embed(const std::string& text) override {
            json body = {
                {"model", m_model},
                {"input", clip_input(text, m_max_input)},
                {"dimensions", m_dimension}
            };
            std::string json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);

            auto response = http::post_json("https://api.openai.com/v1/embeddings", json_str,
                                            {"Authorization: Bearer " + m_api_key});

            std::vector<float> embedding;
            try {
                auto resp_json = json::parse(response.body);
                if (resp_json.contains("error")) {
                    throw EmbeddingError("[OpenAIEmbedder] API Error: " + resp_json["error"].dump(),
                                         http::is_retryable_status(response.status));
                }
                if (response.status != 200) {
                    throw EmbeddingError("[OpenAIEmbedder] HTTP " + std::to_string(response.status),
                                         http::is_retryable_status(response.status));
                }
                if (!resp_json.contains("data") || resp_json["data"].empty()) {
                    throw EmbeddingError("[OpenAIEmbedder] response has no data", false);
                }
                embedding = resp_json["data"][0]["embedding"].get<std::vector<float>>();
            } catch (const json::exception& e) {
                throw EmbeddingError(std::string("[OpenAIEmbedder] JSON parse error: ") + e.what());
            }
            check_dimension(embedding);
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }
        size_t max_input_length() const override { return m_max_input; }
        std::string model_id() const override { return "openai:" + m_model; }

    private:
        std::string m_api_key;
        std::string m_model;
        size_t m_dimension;
        size_t m_max_input;
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model,
                                                     size_t dimension, size_t max_input) {
        return std::make_unique<OpenAIEmbedder>(api_key, model, dimension, max_input);
    }

}
