#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "core/Config.hpp"
#include "core/Errors.hpp"

using namespace later;
using json = nlohmann::json;

TEST(Config, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.embedding.model, "mistral-embed");
    EXPECT_EQ(config.embedding.maxInputTokens, 8000);
    EXPECT_EQ(config.vectorizer.chunkTokens, 512);
    EXPECT_DOUBLE_EQ(config.search.semanticThreshold, 0.35);
    EXPECT_EQ(config.retry.maxAttempts, 3);
}

TEST(Config, FromJsonOverridesNamedFields) {
    json j = {
        {"server", {{"port", 9090}, {"worker_threads", 2}}},
        {"store", {{"path", "/tmp/x.db"}}},
        {"embedding", {{"model", "embed-2"}, {"batch_size", 8}}},
        {"vectorizer", {{"chunk_tokens", 256}, {"overlap_fraction", 0.1}}},
        {"search", {{"rerank", false}, {"fetch_multiplier", 6}}},
        {"labeler", {{"fallback_label", "Misc"}}},
        {"retry", {{"max_attempts", 5}}}
    };
    Config config = Config::fromJson(j);
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.workerThreads, 2);
    EXPECT_EQ(config.store.path, "/tmp/x.db");
    EXPECT_EQ(config.embedding.model, "embed-2");
    EXPECT_EQ(config.embedding.baseUrl, "https://api.mistral.ai");
    EXPECT_EQ(config.embedding.batchSize, 8);
    EXPECT_EQ(config.vectorizer.chunkTokens, 256);
    EXPECT_FALSE(config.search.rerank);
    EXPECT_EQ(config.search.fetchMultiplier, 6);
    EXPECT_EQ(config.labeler.fallbackLabel, "Misc");
    EXPECT_EQ(config.retry.maxAttempts, 5);
}

TEST(Config, RejectsWrongTypes) {
    EXPECT_THROW(Config::fromJson(json::array()), ValidationError);
    EXPECT_THROW(Config::fromJson({{"server", {{"port", "eighty"}}}}), ValidationError);
}

TEST(Config, ValidateCatchesInconsistentValues) {
    Config config;
    config.vectorizer.chunkTokens = 9000;
    EXPECT_THROW(config.validate(), ValidationError);

    config = Config();
    config.vectorizer.overlapFraction = 0.7;
    EXPECT_THROW(config.validate(), ValidationError);

    config = Config();
    config.retry.maxDelayMs = 10;
    EXPECT_THROW(config.validate(), ValidationError);

    config = Config();
    config.rerank.timeoutSeconds = 0;
    EXPECT_THROW(config.validate(), ValidationError);
}

TEST(Config, LoadReadsFileThenEnvironment) {
    std::string path = ::testing::TempDir() + "later_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"store": {"path": "from-file.db"}, "rerank": {"api_key": "file-key"}})";
    }

    ::unsetenv("LATER_DB_PATH");
    ::setenv("COHERE_API_KEY", "env-key", 1);
    Config config = Config::load(path);
    EXPECT_EQ(config.store.path, "from-file.db");
    EXPECT_EQ(config.rerank.apiKey, "env-key");
    ::unsetenv("COHERE_API_KEY");

    std::remove(path.c_str());
}

TEST(Config, LoadFailsOnMissingOrBrokenFile) {
    EXPECT_THROW(Config::load("/nonexistent/later.json"), ValidationError);

    std::string path = ::testing::TempDir() + "later_broken_config.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(Config::load(path), ValidationError);
    std::remove(path.c_str());
}
