#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "ragmill/types.hpp"
#include "chunker.hpp"
#include "resilience.hpp"

namespace ragmill::engine {

    struct Config {
        std::filesystem::path source_dir = "data/source";
        std::filesystem::path processed_dir; // empty: do not export normalized text
        std::filesystem::path database_path; // empty: <data dir>/ragmill.db

        ChunkerConfig chunking;

        std::string embedding_backend = "ollama"; // ollama, openai, hash
        std::string embedding_model = "all-minilm";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings"; // for ollama
        size_t embedding_dimension = 384;
        size_t embedding_max_input = 2048;
        std::string openai_key = "";

        Metric metric = Metric::Cosine;
        size_t default_top_k = 5;
        size_t max_top_k = 100;
        std::optional<float> similarity_threshold;

        size_t index_workers = 2;
        RetryPolicy retry;
        size_t breaker_failure_threshold = 5;
        std::chrono::milliseconds breaker_cooldown{30000};

        bool verbose = true;

        /**
         * @brief Reads a JSON config file. A missing file yields the defaults.
         * @throws ValidationError if the file is not valid JSON or has badly typed values.
         */
        static Config load(const std::filesystem::path& path);

        /**
         * @brief Overrides fields from RAGMILL_* (and EMBEDDING_MODEL, OPENAI_API_KEY) variables.
         */
        void apply_environment();

        /**
         * @brief Rejects inconsistent settings with ValidationError.
         */
        void validate() const;

        void save(const std::filesystem::path& path) const;

        /**
         * @brief database_path, or the platform data directory default.
         */
        std::filesystem::path resolved_database_path() const;
    };

}
