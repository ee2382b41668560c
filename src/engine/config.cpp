#include "config.hpp"
#include "ragmill/errors.hpp"
#include "../platform.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace ragmill::engine {

    namespace {

        const char* env(const char* name) {
            const char* value = std::getenv(name);
            return (value && *value) ? value : nullptr;
        }

        size_t env_size(const char* name, size_t fallback) {
            const char* value = env(name);
            if (!value) return fallback;
            try {
                return static_cast<size_t>(std::stoul(value));
            } catch (const std::exception&) {
                throw ValidationError(std::string(name) + " must be a non-negative integer, got '" + value + "'");
            }
        }

    }

    Config Config::load(const std::filesystem::path& path) {
        Config cfg;
        if (!std::filesystem::exists(path)) return cfg;

        std::ifstream f(path);
        if (!f) {
            throw ValidationError("cannot read config file " + path.string());
        }

        try {
            nlohmann::json j = nlohmann::json::parse(f);

            if (j.contains("source_dir")) cfg.source_dir = j["source_dir"].get<std::string>();
            if (j.contains("processed_dir")) cfg.processed_dir = j["processed_dir"].get<std::string>();
            if (j.contains("database")) cfg.database_path = j["database"].get<std::string>();

            if (j.contains("chunk_size")) cfg.chunking.chunk_size = j["chunk_size"];
            if (j.contains("chunk_overlap")) cfg.chunking.overlap = j["chunk_overlap"];
            if (j.contains("min_chunk_size")) cfg.chunking.min_chunk_size = j["min_chunk_size"];

            if (j.contains("embedding_backend")) cfg.embedding_backend = j["embedding_backend"].get<std::string>();
            if (j.contains("embedding_model")) cfg.embedding_model = j["embedding_model"].get<std::string>();
            if (j.contains("embedding_endpoint")) cfg.embedding_endpoint = j["embedding_endpoint"].get<std::string>();
            if (j.contains("embedding_dimension")) cfg.embedding_dimension = j["embedding_dimension"];
            if (j.contains("embedding_max_input")) cfg.embedding_max_input = j["embedding_max_input"];
            if (j.contains("openai_key")) cfg.openai_key = j["openai_key"].get<std::string>();

            if (j.contains("metric")) cfg.metric = metric_from_string(j["metric"].get<std::string>());
            if (j.contains("default_top_k")) cfg.default_top_k = j["default_top_k"];
            if (j.contains("max_top_k")) cfg.max_top_k = j["max_top_k"];
            if (j.contains("similarity_threshold") && !j["similarity_threshold"].is_null()) {
                cfg.similarity_threshold = j["similarity_threshold"].get<float>();
            }

            if (j.contains("index_workers")) cfg.index_workers = j["index_workers"];
            if (j.contains("retry_max_attempts")) cfg.retry.max_attempts = j["retry_max_attempts"];
            if (j.contains("retry_initial_backoff_ms")) {
                cfg.retry.initial_backoff = std::chrono::milliseconds(j["retry_initial_backoff_ms"].get<long long>());
            }
            if (j.contains("retry_max_backoff_ms")) {
                cfg.retry.max_backoff = std::chrono::milliseconds(j["retry_max_backoff_ms"].get<long long>());
            }
            if (j.contains("breaker_failure_threshold")) cfg.breaker_failure_threshold = j["breaker_failure_threshold"];
            if (j.contains("breaker_cooldown_ms")) {
                cfg.breaker_cooldown = std::chrono::milliseconds(j["breaker_cooldown_ms"].get<long long>());
            }
            if (j.contains("verbose")) cfg.verbose = j["verbose"];
        } catch (const nlohmann::json::exception& e) {
            throw ValidationError("invalid config file " + path.string() + ": " + e.what());
        }
        return cfg;
    }

    void Config::apply_environment() {
        if (const char* v = env("RAGMILL_SOURCE_DIR")) source_dir = v;
        if (const char* v = env("RAGMILL_PROCESSED_DIR")) processed_dir = v;
        if (const char* v = env("RAGMILL_DATABASE")) database_path = v;
        chunking.chunk_size = env_size("RAGMILL_CHUNK_SIZE", chunking.chunk_size);
        chunking.overlap = env_size("RAGMILL_CHUNK_OVERLAP", chunking.overlap);
        chunking.min_chunk_size = env_size("RAGMILL_MIN_CHUNK_SIZE", chunking.min_chunk_size);
        if (const char* v = env("RAGMILL_EMBEDDING_BACKEND")) embedding_backend = v;
        if (const char* v = env("EMBEDDING_MODEL")) embedding_model = v;
        if (const char* v = env("RAGMILL_EMBEDDING_ENDPOINT")) embedding_endpoint = v;
        embedding_dimension = env_size("RAGMILL_EMBEDDING_DIMENSION", embedding_dimension);
        if (const char* v = env("OPENAI_API_KEY")) openai_key = v;
        if (const char* v = env("RAGMILL_METRIC")) metric = metric_from_string(v);
        index_workers = env_size("RAGMILL_INDEX_WORKERS", index_workers);
    }

    void Config::validate() const {
        chunking.validate();
        if (chunking.max_chunk_length() > embedding_max_input) {
            throw ValidationError("chunk_size (" + std::to_string(chunking.chunk_size) + ") plus min_chunk_size (" +
                                  std::to_string(chunking.min_chunk_size) + ") exceeds embedding_max_input (" +
                                  std::to_string(embedding_max_input) + ")");
        }
        if (embedding_dimension == 0) {
            throw ValidationError("embedding_dimension must be greater than zero");
        }
        if (embedding_backend != "ollama" && embedding_backend != "openai" && embedding_backend != "hash") {
            throw ValidationError("unknown embedding_backend '" + embedding_backend + "'");
        }
        if (index_workers == 0 || index_workers > 64) {
            throw ValidationError("index_workers must be between 1 and 64");
        }
        if (max_top_k == 0 || default_top_k == 0 || default_top_k > max_top_k) {
            throw ValidationError("default_top_k must be between 1 and max_top_k");
        }
        if (similarity_threshold && metric == Metric::Cosine &&
            (*similarity_threshold < -1.0f || *similarity_threshold > 1.0f)) {
            throw ValidationError("similarity_threshold must lie in [-1, 1] for cosine similarity");
        }
        if (retry.max_attempts == 0) {
            throw ValidationError("retry_max_attempts must be at least 1");
        }
    }

    void Config::save(const std::filesystem::path& path) const {
        nlohmann::json j;
        j["source_dir"] = source_dir.string();
        if (!processed_dir.empty()) j["processed_dir"] = processed_dir.string();
        if (!database_path.empty()) j["database"] = database_path.string();
        j["chunk_size"] = chunking.chunk_size;
        j["chunk_overlap"] = chunking.overlap;
        j["min_chunk_size"] = chunking.min_chunk_size;
        j["embedding_backend"] = embedding_backend;
        j["embedding_model"] = embedding_model;
        j["embedding_endpoint"] = embedding_endpoint;
        j["embedding_dimension"] = embedding_dimension;
        j["embedding_max_input"] = embedding_max_input;
        if (!openai_key.empty()) j["openai_key"] = openai_key;
        j["metric"] = to_string(metric);
        j["default_top_k"] = default_top_k;
        j["max_top_k"] = max_top_k;
        if (similarity_threshold) j["similarity_threshold"] = *similarity_threshold;
        j["index_workers"] = index_workers;
        j["retry_max_attempts"] = retry.max_attempts;
        j["retry_initial_backoff_ms"] = retry.initial_backoff.count();
        j["retry_max_backoff_ms"] = retry.max_backoff.count();
        j["breaker_failure_threshold"] = breaker_failure_threshold;
        j["breaker_cooldown_ms"] = breaker_cooldown.count();
        j["verbose"] = verbose;

        std::ofstream f(path);
        if (!f) {
            throw ValidationError("cannot write config file " + path.string());
        }
        f << j.dump(4);
    }

    std::filesystem::path Config::resolved_database_path() const {
        if (!database_path.empty()) return database_path;
        auto data_dir = platform::system::get_data_dir();
        if (data_dir.empty()) data_dir = std::filesystem::current_path();
        return data_dir / "ragmill.db";
    }

}
