#include <iostream>
#include <string>
#include <memory>
#include <csignal>
#include <cstdlib>

#include "analysis/Analyzer.hpp"
#include "analysis/ClusterLabeler.hpp"
#include "core/Config.hpp"
#include "core/SqliteItemStore.hpp"
#include "pipeline/IngestionPipeline.hpp"
#include "providers/CompletionClient.hpp"
#include "providers/EmbeddingClient.hpp"
#include "providers/RerankClient.hpp"
#include "providers/WebExtractor.hpp"
#include "search/HybridSearch.hpp"
#include "server/ApiHandler.hpp"
#include "server/wserver.hpp"

using namespace later;

void signal_handler(int signum) {
    if (signum == SIGINT) {
        // SQLite commits per statement; nothing to flush.
        std::cout << "\nSIGINT received, shutting down..." << std::endl;
        std::exit(0);
    }
}

static std::string config_path(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    const char* env = std::getenv("LATER_CONFIG");
    return env ? env : "";
}

int main(int argc, char** argv)
{
    Config config;
    try {
        config = Config::load(config_path(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);

    try {
        SqliteItemStore store(config.store.path);
        std::cout << "[store] Opened " << config.store.path << std::endl;

        WebExtractor extractor(config.extractor.timeoutSeconds);

        CompletionClient completion(config.completion.apiKey, config.completion.baseUrl,
                                    config.completion.timeoutSeconds);
        completion.setModel(config.completion.model);

        EmbeddingClient embedder(config.embedding.apiKey, config.embedding.baseUrl,
                                 config.embedding.timeoutSeconds);
        embedder.setModel(config.embedding.model);

        std::unique_ptr<RerankClient> reranker;
        if (!config.rerank.apiKey.empty()) {
            reranker = std::make_unique<RerankClient>(config.rerank.apiKey, config.rerank.baseUrl,
                                                      config.rerank.timeoutSeconds);
            reranker->setModel(config.rerank.model);
        } else {
            std::cout << "[search] No rerank API key, reranking disabled" << std::endl;
        }

        PipelineOptions options;
        options.vectorizer = config.vectorizer;
        options.maxInputTokens = config.embedding.maxInputTokens;
        options.embeddingBatchSize = config.embedding.batchSize;
        options.retry = config.retry;
        options.workerThreads = config.server.workerThreads;
        IngestionPipeline pipeline(store, extractor, completion, embedder, options);

        Analyzer analyzer;
        ClusterLabeler labeler(completion, config.labeler);
        HybridSearch search(store, embedder, reranker.get(), config.search);

        wServer server;
        ApiHandler api(store, pipeline, analyzer, labeler, search);
        api.registerRoutes(server);

        server.run(config.server.port);
    } catch (const std::exception& e) {
        std::cerr << "[server] Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
