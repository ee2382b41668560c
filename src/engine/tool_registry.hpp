#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "cancellation.hpp"
#include "config.hpp"
#include "indexer.hpp"

namespace ragmill::engine {

    class Embedder;

    struct Tool {
        std::string name;
        std::string description;
        nlohmann::json input_schema;
        std::function<nlohmann::json(const nlohmann::json& arguments)> handler;
    };

    /**
     * @brief Named capabilities exposed to the front ends, populated once at startup.
     */
    class ToolRegistry {
    public:
        /**
         * @throws ValidationError if a tool with the same name is already registered.
         */
        void add(Tool tool);
        bool contains(const std::string& name) const;

        /**
         * @brief Tool descriptions in MCP `tools/list` form: [{name, description, inputSchema}].
         */
        nlohmann::json list() const;

        /**
         * @brief Runs a tool after checking the arguments' required fields.
         * @throws ValidationError for unknown tools or missing arguments; whatever the handler throws.
         */
        nlohmann::json call(const std::string& name, const nlohmann::json& arguments) const;

    private:
        std::map<std::string, Tool> m_tools;
    };

    /**
     * @brief Shared state of the RAG tools: configuration, embedder and store access.
     */
    struct ToolContext {
        Config config;
        Embedder& embedder;
        Indexer::StoreFactory store_factory;
        CancellationToken cancel;
    };

    /**
     * @brief Registers rag_search, rag_document_count, rag_index and rag_remove_document.
     */
    void register_rag_tools(ToolRegistry& registry, std::shared_ptr<ToolContext> context);

}
