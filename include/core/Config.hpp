#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace later {

struct ServerConfig {
    uint16_t port = 8080;
    int workerThreads = 4;        // background ingestion pool
};

struct StoreConfig {
    std::string path = "later.db";
};

// One remote HTTP provider.
struct ProviderConfig {
    std::string baseUrl;
    std::string model;
    std::string apiKey;
    long timeoutSeconds = 30;
};

struct EmbeddingConfig : ProviderConfig {
    int maxInputTokens = 8000;
    int batchSize = 16;
};

struct VectorizerConfig {
    int chunkTokens = 512;
    double overlapFraction = 0.15;
};

struct SearchConfig {
    double semanticThreshold = 0.35;
    double rerankThreshold = 0.35;
    double lexicalThreshold = 0.0;
    int fetchMultiplier = 4;
    bool rerank = true;
    bool lexicalFallback = true;
};

struct LabelerConfig {
    int maxConcurrency = 4;
    int maxTokensPerCluster = 1500;
    std::string fallbackLabel = "Unlabeled";
};

struct RetryConfig {
    int maxAttempts = 3;
    long initialDelayMs = 500;
    double multiplier = 2.0;
    long maxDelayMs = 8000;
};

struct Config {
    ServerConfig server;
    StoreConfig store;
    ProviderConfig extractor{"", "", "", 30};
    ProviderConfig completion{"https://api.mistral.ai", "mistral-medium-latest", "", 60};
    EmbeddingConfig embedding;
    ProviderConfig rerank{"https://api.cohere.com", "rerank-english-v3.0", "", 30};
    VectorizerConfig vectorizer;
    SearchConfig search;
    LabelerConfig labeler;
    RetryConfig retry;

    Config();

    // Defaults, then the JSON file (if the path is non-empty), then the environment.
    static Config load(const std::string& path);

    static Config fromJson(const nlohmann::json& j);

    // Throws ValidationError on an out-of-range value.
    void validate() const;

    void applyEnvironment();
};

} // namespace later
