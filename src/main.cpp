#include <iostream>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "platform.hpp"
#include "ragmill/errors.hpp"
#include "engine/config.hpp"
#include "engine/embedder.hpp"
#include "engine/indexer.hpp"
#include "engine/retriever.hpp"
#include "engine/vector_store.hpp"

namespace {

    // Cancelled by SIGINT/SIGTERM; the running index or query stops at the next check.
    ragmill::engine::CancellationToken g_cancel;

    void signal_handler(int) {
        g_cancel.cancel();
    }

    void print_usage() {
        std::cerr << "Usage: ragmill [--config FILE] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  index [--source-dir D] [--processed-dir D] [--full]   Index the source directory\n";
        std::cerr << "  query <text> [--top-k N] [--threshold T] [--context N] [--full-document]\n";
        std::cerr << "  count                                                 Number of indexed documents\n";
        std::cerr << "  documents                                             List documents and their state\n";
        std::cerr << "  remove <id>                                           Remove a document from the index\n";
    }

    struct Arguments {
        std::optional<std::filesystem::path> config_path;
        std::string command;
        std::vector<std::string> positional;
        std::vector<std::pair<std::string, std::string>> options;
        std::vector<std::string> flags;

        std::optional<std::string> option(const std::string& name) const {
            for (const auto& [key, value] : options) {
                if (key == name) return value;
            }
            return std::nullopt;
        }

        bool flag(const std::string& name) const {
            for (const auto& f : flags) {
                if (f == name) return true;
            }
            return false;
        }
    };

    Arguments parse_arguments(int argc, char* argv[]) {
        static const std::vector<std::string> valued = {
            "--config", "--source-dir", "--processed-dir", "--top-k", "--threshold", "--context"
        };

        Arguments args;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool takes_value = false;
            for (const auto& v : valued) {
                if (arg == v) takes_value = true;
            }

            if (takes_value) {
                if (i + 1 >= argc) throw ragmill::ValidationError(arg + " needs a value");
                std::string value = argv[++i];
                if (arg == "--config") args.config_path = value;
                else args.options.emplace_back(arg, value);
            } else if (arg.rfind("--", 0) == 0) {
                args.flags.push_back(arg);
            } else if (args.command.empty()) {
                args.command = arg;
            } else {
                args.positional.push_back(arg);
            }
        }
        return args;
    }

    size_t parse_count(const std::string& name, const std::string& value) {
        try {
            size_t pos = 0;
            long long n = std::stoll(value, &pos);
            if (pos != value.size() || n < 0) throw std::invalid_argument(value);
            return static_cast<size_t>(n);
        } catch (const std::logic_error&) {
            throw ragmill::ValidationError(name + " expects a non-negative integer, got '" + value + "'");
        }
    }

    float parse_float(const std::string& name, const std::string& value) {
        try {
            size_t pos = 0;
            float f = std::stof(value, &pos);
            if (pos != value.size()) throw std::invalid_argument(value);
            return f;
        } catch (const std::logic_error&) {
            throw ragmill::ValidationError(name + " expects a number, got '" + value + "'");
        }
    }

    ragmill::engine::Config load_config(const Arguments& args) {
        std::filesystem::path path;
        if (args.config_path) {
            path = *args.config_path;
        } else {
            auto config_dir = ragmill::platform::system::get_config_dir();
            path = config_dir / "config.json";
        }

        auto config = ragmill::engine::Config::load(path);
        config.apply_environment();
        if (auto dir = args.option("--source-dir")) config.source_dir = *dir;
        if (auto dir = args.option("--processed-dir")) config.processed_dir = *dir;
        config.validate();

        if (config.verbose) {
            std::cerr << "[ragmill] Config: " << path << "\n";
        }
        return config;
    }

    ragmill::engine::Indexer::StoreFactory make_store_factory(const ragmill::engine::Config& config) {
        auto db_path = config.resolved_database_path();
        if (db_path.has_parent_path()) {
            std::filesystem::create_directories(db_path.parent_path());
        }

        ragmill::engine::StoreOptions options;
        options.dimension = config.embedding_dimension;
        options.metric = config.metric;

        return [db_path, options]() {
            auto store = std::make_unique<ragmill::engine::VectorStore>();
            store->open(db_path, options);
            return store;
        };
    }

    int run_index(const ragmill::engine::Config& config, const Arguments& args) {
        auto embedder = ragmill::engine::create_embedder(config);
        ragmill::engine::Indexer indexer(config, *embedder, make_store_factory(config));

        ragmill::engine::IndexOptions options;
        options.source_root = config.source_dir;
        options.incremental = !args.flag("--full");

        auto summary = indexer.run(options, g_cancel);

        std::cout << "Indexed: " << summary.documents_indexed
                  << ", Skipped: " << summary.documents_skipped
                  << ", Failed: " << summary.documents_failed
                  << ", Chunks written: " << summary.chunks_written << "\n";
        for (const auto& failure : summary.failures) {
            std::cout << "  " << failure.document_id << ": " << failure.kind << ": " << failure.message << "\n";
        }
        if (summary.cancelled) {
            std::cout << "Interrupted; rerun to finish the remaining documents.\n";
            return 130;
        }
        return summary.documents_failed == 0 ? 0 : 2;
    }

    int run_query(const ragmill::engine::Config& config, const Arguments& args) {
        if (args.positional.empty()) {
            throw ragmill::ValidationError("query needs the search text");
        }
        std::string text;
        for (const auto& word : args.positional) {
            text += (text.empty() ? "" : " ") + word;
        }

        ragmill::engine::SearchOptions options;
        options.top_k = config.default_top_k;
        options.threshold = config.similarity_threshold;
        if (auto v = args.option("--top-k")) options.top_k = parse_count("--top-k", *v);
        if (auto v = args.option("--threshold")) options.threshold = parse_float("--threshold", *v);
        if (auto v = args.option("--context")) {
            options.with_context = true;
            options.context_size = parse_count("--context", *v);
        }
        options.full_document = args.flag("--full-document");

        auto embedder = ragmill::engine::create_embedder(config);
        auto store = make_store_factory(config)();
        ragmill::engine::Retriever retriever(config, *embedder, *store);

        auto hits = retriever.search(text, options, g_cancel);
        if (hits.empty()) {
            std::cout << "No results for '" << text << "'\n";
            return 0;
        }

        for (const auto& hit : hits) {
            std::cout << "--- " << hit.document_id << " #" << hit.chunk_index
                      << " (" << std::fixed << std::setprecision(4) << hit.similarity << ")"
                      << (hit.is_context ? " [context]" : "") << "\n";
            std::cout << hit.content << "\n\n";
        }
        return 0;
    }

    int run_count(const ragmill::engine::Config& config) {
        auto store = make_store_factory(config)();
        std::cout << store->document_count() << "\n";
        return 0;
    }

    int run_documents(const ragmill::engine::Config& config) {
        auto store = make_store_factory(config)();
        for (const auto& doc : store->list_documents()) {
            std::cout << std::left << std::setw(10) << ragmill::engine::to_string(doc.status)
                      << std::setw(6) << doc.chunk_count << " " << doc.id
                      << (doc.model.empty() ? "" : "  [" + doc.model + "]") << "\n";
        }
        return 0;
    }

    int run_remove(const ragmill::engine::Config& config, const Arguments& args) {
        if (args.positional.size() != 1) {
            throw ragmill::ValidationError("remove needs exactly one document id");
        }
        auto embedder = ragmill::engine::create_embedder(config);
        ragmill::engine::Indexer indexer(config, *embedder, make_store_factory(config));
        if (!indexer.remove_document(args.positional[0])) {
            std::cout << "Not indexed: " << args.positional[0] << "\n";
            return 1;
        }
        std::cout << "Removed: " << args.positional[0] << "\n";
        return 0;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        auto args = parse_arguments(argc, argv);
        if (args.command.empty() || args.flag("--help")) {
            print_usage();
            return args.command.empty() ? 1 : 0;
        }

        auto config = load_config(args);

        if (args.command == "index") return run_index(config, args);
        if (args.command == "query") return run_query(config, args);
        if (args.command == "count") return run_count(config);
        if (args.command == "documents") return run_documents(config);
        if (args.command == "remove") return run_remove(config, args);

        std::cerr << "Unknown command: " << args.command << "\n";
        print_usage();
        return 1;
    } catch (const ragmill::CancelledError&) {
        std::cerr << "[ragmill] Interrupted.\n";
        return 130;
    } catch (const ragmill::Error& e) {
        std::cerr << "[ragmill] " << e.kind() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ragmill] Error: " << e.what() << "\n";
        return 1;
    }
}
