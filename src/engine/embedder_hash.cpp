#include "embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace ragmill::engine {

    // Tokens are hashed into buckets (FNV-1a) and the counts L2-normalized.
    class HashEmbedder : public Embedder {
    public:
        HashEmbedder(size_t dimension, size_t max_input, const std::string& name)
            : m_dimension(dimension), m_max_input(max_input), m_name(name) {}

        std::vector<float> embed(const std::string& input) override {
            std::string text = clip_input(input, m_max_input);
            std::vector<float> vec(m_dimension, 0.0f);

            std::string token;
            auto flush = [&]() {
                if (token.empty()) return;
                vec[fnv1a(token) % m_dimension] += 1.0f;
                token.clear();
            };

            for (char c : text) {
                auto uc = static_cast<unsigned char>(c);
                // Bytes >= 0x80 belong to multi-byte characters and stay inside tokens.
                if (uc >= 0x80 || std::isalnum(uc)) {
                    token += static_cast<char>(std::tolower(uc));
                } else {
                    flush();
                }
            }
            flush();

            float norm = 0.0f;
            for (float v : vec) norm += v * v;
            if (norm > 0.0f) {
                norm = std::sqrt(norm);
                for (float& v : vec) v /= norm;
            }
            return vec;
        }

        size_t dimension() const override { return m_dimension; }
        size_t max_input_length() const override { return m_max_input; }
        std::string model_id() const override { return "hash:" + m_name + "-" + std::to_string(m_dimension); }

    private:
        size_t m_dimension;
        size_t m_max_input;
        std::string m_name;

        static uint64_t fnv1a(const std::string& s) {
            uint64_t h = 1469598103934665603ull;
            for (unsigned char c : s) {
                h ^= c;
                h *= 1099511628211ull;
            }
            return h;
        }
    };

    std::unique_ptr<Embedder> create_hash_embedder(size_t dimension, size_t max_input, const std::string& name) {
        return std::make_unique<HashEmbedder>(dimension == 0 ? 1 : dimension, max_input, name);
    }

}
