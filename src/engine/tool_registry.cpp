#include "tool_registry.hpp"
#include "retriever.hpp"
#include "vector_store.hpp"
#include "ragmill/errors.hpp"

namespace ragmill::engine {

    using json = nlohmann::json;

    void ToolRegistry::add(Tool tool) {
        if (m_tools.count(tool.name)) {
            throw ValidationError("tool already registered: " + tool.name);
        }
        std::string name = tool.name;
        m_tools.emplace(std::move(name), std::move(tool));
    }

    bool ToolRegistry::contains(const std::string& name) const {
        return m_tools.count(name) > 0;
    }

    json ToolRegistry::list() const {
        json tools = json::array();
        for (const auto& [name, tool] : m_tools) {
            tools.push_back({
                {"name", name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return tools;
    }

    json ToolRegistry::call(const std::string& name, const json& arguments) const {
        auto it = m_tools.find(name);
        if (it == m_tools.end()) {
            throw ValidationError("unknown tool: " + name);
        }
        const json args = arguments.is_null() ? json::object() : arguments;
        if (!args.is_object()) {
            throw ValidationError("arguments of " + name + " must be an object");
        }
        if (it->second.input_schema.contains("required")) {
            for (const auto& field : it->second.input_schema["required"]) {
                if (!args.contains(field.get<std::string>())) {
                    throw ValidationError("missing argument '" + field.get<std::string>() + "' for " + name);
                }
            }
        }
        return it->second.handler(args);
    }

    namespace {

        template <typename T>
        T argument(const json& args, const char* key, T fallback) {
            if (!args.contains(key) || args[key].is_null()) return fallback;
            try {
                return args[key].get<T>();
            } catch (const json::exception&) {
                throw ValidationError(std::string("argument '") + key + "' has the wrong type");
            }
        }

        size_t count_argument(const json& args, const char* key, size_t fallback) {
            long long value = argument<long long>(args, key, static_cast<long long>(fallback));
            if (value < 0) {
                throw ValidationError(std::string("argument '") + key + "' must not be negative");
            }
            return static_cast<size_t>(value);
        }

        json search_tool(ToolContext& ctx, const json& args) {
            std::string query = argument<std::string>(args, "query", "");

            SearchOptions options;
            options.top_k = count_argument(args, "limit", 5);
            options.with_context = argument<bool>(args, "with_context", true);
            options.context_size = count_argument(args, "context_size", 1);
            options.full_document = argument<bool>(args, "full_document", false);
            if (args.contains("threshold") && !args["threshold"].is_null()) {
                options.threshold = argument<float>(args, "threshold", 0.0f);
            } else {
                options.threshold = ctx.config.similarity_threshold;
            }

            auto store = ctx.store_factory();
            Retriever retriever(ctx.config, ctx.embedder, *store);
            if (retriever.document_count() == 0) {
                throw ValidationError("No documents are indexed yet. Run `ragmill index` to index the source directory.");
            }

            auto hits = retriever.search(query, options, ctx.cancel);

            json results = json::array();
            for (const auto& hit : hits) {
                results.push_back({
                    {"document_id", hit.document_id},
                    {"content", hit.content},
                    {"chunk_index", hit.chunk_index},
                    {"similarity", hit.similarity},
                    {"is_context", hit.is_context},
                    {"is_full_document", hit.is_full_document}
                });
            }

            std::string message = hits.empty()
                ? "No results matched the query '" + query + "'"
                : "Search results for '" + query + "' (" + std::to_string(hits.size()) + ")";
            return {{"results", results}, {"message", message}};
        }

        json count_tool(ToolContext& ctx) {
            auto store = ctx.store_factory();
            size_t count = store->document_count();
            return {{"count", count}, {"message", "Documents in the index: " + std::to_string(count)}};
        }

        json index_tool(ToolContext& ctx, const json& args) {
            IndexOptions options;
            options.source_root = argument<std::string>(args, "source_dir", ctx.config.source_dir.string());
            options.incremental = argument<bool>(args, "incremental", true);

            Indexer indexer(ctx.config, ctx.embedder, ctx.store_factory);
            auto summary = indexer.run(options, ctx.cancel);

            json failures = json::array();
            for (const auto& f : summary.failures) {
                failures.push_back({{"document_id", f.document_id}, {"kind", f.kind}, {"message", f.message}});
            }
            return {
                {"documents_indexed", summary.documents_indexed},
                {"documents_skipped", summary.documents_skipped},
                {"documents_failed", summary.documents_failed},
                {"chunks_written", summary.chunks_written},
                {"cancelled", summary.cancelled},
                {"failures", failures}
            };
        }

        json remove_tool(ToolContext& ctx, const json& args) {
            std::string id = argument<std::string>(args, "document_id", "");
            if (id.empty()) {
                throw ValidationError("document_id must not be empty");
            }
            Indexer indexer(ctx.config, ctx.embedder, ctx.store_factory);
            bool removed = indexer.remove_document(id);
            return {{"removed", removed}, {"document_id", id}};
        }

    }

    void register_rag_tools(ToolRegistry& registry, std::shared_ptr<ToolContext> context) {
        registry.add({
            "rag_search",
            "Semantic search over the indexed documents. Returns the most similar chunks, "
            "optionally with neighbouring chunks or whole documents.",
            {
                {"type", "object"},
                {"properties", {
                    {"query", {{"type", "string"}, {"description", "Search text."}}},
                    {"limit", {{"type", "integer"}, {"description", "Number of matches (default 5)."}}},
                    {"with_context", {{"type", "boolean"}, {"description", "Include neighbouring chunks (default true)."}}},
                    {"context_size", {{"type", "integer"}, {"description", "Neighbours on each side (default 1)."}}},
                    {"full_document", {{"type", "boolean"}, {"description", "Return whole matching documents (default false)."}}},
                    {"threshold", {{"type", "number"}, {"description", "Minimum similarity."}}}
                }},
                {"required", {"query"}}
            },
            [context](const json& args) { return search_tool(*context, args); }
        });

        registry.add({
            "rag_document_count",
            "Number of documents in the index.",
            {{"type", "object"}, {"properties", json::object()}},
            [context](const json&) { return count_tool(*context); }
        });

        registry.add({
            "rag_index",
            "Index or incrementally re-index the documents of a source directory.",
            {
                {"type", "object"},
                {"properties", {
                    {"source_dir", {{"type", "string"}, {"description", "Directory to index (default: configured source_dir)."}}},
                    {"incremental", {{"type", "boolean"}, {"description", "Skip unchanged documents (default true)."}}}
                }}
            },
            [context](const json& args) { return index_tool(*context, args); }
        });

        registry.add({
            "rag_remove_document",
            "Remove a document and its chunks from the index.",
            {
                {"type", "object"},
                {"properties", {
                    {"document_id", {{"type", "string"}, {"description", "Document id (path relative to the source root)."}}}
                }},
                {"required", {"document_id"}}
            },
            [context](const json& args) { return remove_tool(*context, args); }
        });
    }

}
