#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace later {

namespace {
    template <typename T>
    void readField(const nlohmann::json& j, const char* key, T& target) {
        if (j.contains(key) && !j[key].is_null()) {
            try {
                target = j[key].get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw ValidationError(std::string("Invalid config field '") + key + "': " + e.what());
            }
        }
    }

    void readProvider(const nlohmann::json& j, ProviderConfig& target) {
        readField(j, "base_url", target.baseUrl);
        readField(j, "model", target.model);
        readField(j, "api_key", target.apiKey);
        readField(j, "timeout_seconds", target.timeoutSeconds);
    }

    std::string envOr(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        if (value && *value) return value;
        return fallback;
    }
}

Config::Config() {
    embedding.baseUrl = "https://api.mistral.ai";
    embedding.model = "mistral-embed";
    embedding.timeoutSeconds = 30;
}

Config Config::fromJson(const nlohmann::json& j) {
    Config config;
    if (!j.is_object()) {
        throw ValidationError("Config root must be a JSON object");
    }

    if (j.contains("server")) {
        const auto& s = j["server"];
        readField(s, "port", config.server.port);
        readField(s, "worker_threads", config.server.workerThreads);
    }
    if (j.contains("store")) {
        readField(j["store"], "path", config.store.path);
    }
    if (j.contains("extractor")) readProvider(j["extractor"], config.extractor);
    if (j.contains("completion")) readProvider(j["completion"], config.completion);
    if (j.contains("rerank")) readProvider(j["rerank"], config.rerank);
    if (j.contains("embedding")) {
        const auto& e = j["embedding"];
        readProvider(e, config.embedding);
        readField(e, "max_input_tokens", config.embedding.maxInputTokens);
        readField(e, "batch_size", config.embedding.batchSize);
    }
    if (j.contains("vectorizer")) {
        const auto& v = j["vectorizer"];
        readField(v, "chunk_tokens", config.vectorizer.chunkTokens);
        readField(v, "overlap_fraction", config.vectorizer.overlapFraction);
    }
    if (j.contains("search")) {
        const auto& s = j["search"];
        readField(s, "semantic_threshold", config.search.semanticThreshold);
        readField(s, "rerank_threshold", config.search.rerankThreshold);
        readField(s, "lexical_threshold", config.search.lexicalThreshold);
        readField(s, "fetch_multiplier", config.search.fetchMultiplier);
        readField(s, "rerank", config.search.rerank);
        readField(s, "lexical_fallback", config.search.lexicalFallback);
    }
    if (j.contains("labeler")) {
        const auto& l = j["labeler"];
        readField(l, "max_concurrency", config.labeler.maxConcurrency);
        readField(l, "max_tokens_per_cluster", config.labeler.maxTokensPerCluster);
        readField(l, "fallback_label", config.labeler.fallbackLabel);
    }
    if (j.contains("retry")) {
        const auto& r = j["retry"];
        readField(r, "max_attempts", config.retry.maxAttempts);
        readField(r, "initial_delay_ms", config.retry.initialDelayMs);
        readField(r, "multiplier", config.retry.multiplier);
        readField(r, "max_delay_ms", config.retry.maxDelayMs);
    }
    return config;
}

Config Config::load(const std::string& path) {
    Config config;
    if (!path.empty()) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ValidationError("Cannot open config file: " + path);
        }
        try {
            nlohmann::json j;
            file >> j;
            config = fromJson(j);
        } catch (const nlohmann::json::parse_error& e) {
            throw ValidationError("Config parse error in " + path + ": " + e.what());
        }
        std::cout << "[config] loaded " << path << std::endl;
    }
    config.applyEnvironment();
    config.validate();
    return config;
}

void Config::applyEnvironment() {
    std::string mistralKey = envOr("MISTRAL_API_KEY", "");
    if (!mistralKey.empty()) {
        completion.apiKey = mistralKey;
        embedding.apiKey = mistralKey;
    }
    rerank.apiKey = envOr("COHERE_API_KEY", rerank.apiKey);
    store.path = envOr("LATER_DB_PATH", store.path);
}

void Config::validate() const {
    if (server.workerThreads < 1) {
        throw ValidationError("server.worker_threads must be at least 1");
    }
    if (embedding.maxInputTokens < 1) {
        throw ValidationError("embedding.max_input_tokens must be positive");
    }
    if (embedding.batchSize < 1) {
        throw ValidationError("embedding.batch_size must be positive");
    }
    if (vectorizer.chunkTokens < 2 || vectorizer.chunkTokens > embedding.maxInputTokens) {
        throw ValidationError("vectorizer.chunk_tokens must be in [2, embedding.max_input_tokens]");
    }
    if (vectorizer.overlapFraction < 0.0 || vectorizer.overlapFraction > 0.5) {
        throw ValidationError("vectorizer.overlap_fraction must be in [0, 0.5]");
    }
    if (search.fetchMultiplier < 1) {
        throw ValidationError("search.fetch_multiplier must be at least 1");
    }
    if (labeler.maxConcurrency < 1) {
        throw ValidationError("labeler.max_concurrency must be at least 1");
    }
    if (labeler.maxTokensPerCluster < 1) {
        throw ValidationError("labeler.max_tokens_per_cluster must be positive");
    }
    if (retry.maxAttempts < 1 || retry.initialDelayMs < 0 || retry.multiplier < 1.0 ||
        retry.maxDelayMs < retry.initialDelayMs) {
        throw ValidationError("retry settings are inconsistent");
    }
    for (const ProviderConfig* p : {&extractor, &completion, static_cast<const ProviderConfig*>(&embedding), &rerank}) {
        if (p->timeoutSeconds < 1) {
            throw ValidationError("provider timeout_seconds must be at least 1");
        }
    }
}

} // namespace later
