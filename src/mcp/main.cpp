#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "../platform.hpp"
#include "ragmill/errors.hpp"
#include "../engine/config.hpp"
#include "../engine/embedder.hpp"
#include "../engine/tool_registry.hpp"
#include "../engine/vector_store.hpp"

using json = nlohmann::json;

// stdout carries the JSON-RPC stream; everything else goes to stderr.
void send_response(const json& id, const json& result) {
    json response = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
    std::cout << response.dump() << std::endl;
}

void send_error(const json& id, int code, const std::string& message) {
    json response = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
    std::cout << response.dump() << std::endl;
}

json tool_result(const json& payload, bool is_error) {
    return {
        {"content", {
            {
                {"type", "text"},
                {"text", payload.is_string() ? payload.get<std::string>() : payload.dump(2)}
            }
        }},
        {"isError", is_error}
    };
}

int main(int argc, char* argv[]) {
    std::filesystem::path config_path = ragmill::platform::system::get_config_dir() / "config.json";
    if (argc > 2 && std::string(argv[1]) == "--config") {
        config_path = argv[2];
    }

    std::shared_ptr<ragmill::engine::ToolContext> context;
    std::unique_ptr<ragmill::engine::Embedder> embedder;
    ragmill::engine::ToolRegistry registry;

    try {
        auto config = ragmill::engine::Config::load(config_path);
        config.apply_environment();
        config.validate();
        embedder = ragmill::engine::create_embedder(config);

        auto db_path = config.resolved_database_path();
        if (db_path.has_parent_path()) {
            std::filesystem::create_directories(db_path.parent_path());
        }
        ragmill::engine::StoreOptions options;
        options.dimension = config.embedding_dimension;
        options.metric = config.metric;

        context = std::make_shared<ragmill::engine::ToolContext>(ragmill::engine::ToolContext{
            config,
            *embedder,
            [db_path, options]() {
                auto store = std::make_unique<ragmill::engine::VectorStore>();
                store->open(db_path, options);
                return store;
            },
            {}
        });
        ragmill::engine::register_rag_tools(registry, context);
    } catch (const std::exception& e) {
        std::cerr << "[ragmill-mcp] Startup failed: " << e.what() << "\n";
        return 1;
    }
    std::cerr << "[ragmill-mcp] Ready (" << embedder->model_id() << ").\n";

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;

        json req;
        try {
            req = json::parse(line);
        } catch (const json::parse_error& e) {
            std::cerr << "[ragmill-mcp] Malformed request: " << e.what() << "\n";
            send_error(nullptr, -32700, "Parse error");
            continue;
        }

        auto id = req.value("id", json(nullptr));
        try {
            std::string method = req.value("method", "");

            if (method == "initialize") {
                json result = {
                    {"protocolVersion", "2024-11-05"},
                    {"capabilities", {
                        {"tools", json::object()}
                    }},
                    {"serverInfo", {
                        {"name", "ragmill-mcp"},
                        {"version", "0.1.0"}
                    }}
                };
                send_response(id, result);
                continue;
            }

            if (method == "notifications/initialized") {
                continue;
            }

            if (method == "ping") {
                send_response(id, json::object());
                continue;
            }

            if (method == "tools/list") {
                send_response(id, {{"tools", registry.list()}});
                continue;
            }

            if (method == "tools/call") {
                auto params = req.value("params", json::object());
                std::string name = params.value("name", "");
                auto args = params.value("arguments", json::object());

                if (!registry.contains(name)) {
                    send_error(id, -32602, "Unknown tool: " + name);
                    continue;
                }

                // Tool failures are results the client shows to the model, not protocol errors.
                try {
                    send_response(id, tool_result(registry.call(name, args), false));
                } catch (const ragmill::Error& e) {
                    std::cerr << "[ragmill-mcp] " << name << " failed: " << e.kind() << ": " << e.what() << "\n";
                    send_response(id, tool_result(std::string(e.kind()) + ": " + e.what(), true));
                }
                continue;
            }

            if (!req.contains("id")) continue;
            send_error(id, -32601, "Method not found");

        } catch (const std::exception& e) {
            std::cerr << "[ragmill-mcp] Error: " << e.what() << "\n";
            if (req.contains("id")) send_error(id, -32603, e.what());
        }
    }

    return 0;
}
