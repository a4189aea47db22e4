#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "providers/EmbeddingClient.hpp"
#include "providers/RerankClient.hpp"

using namespace later;

TEST(EmbeddingClient, ParsesVectorsByIndex) {
    auto vectors = EmbeddingClient::parseEmbeddings(
        R"({"data":[{"index":1,"embedding":[0.5,0.25]},{"index":0,"embedding":[1,0]}]})", 2);
    ASSERT_EQ(vectors.size(), 2u);
    EXPECT_EQ(vectors[0], (std::vector<float>{1.0f, 0.0f}));
    EXPECT_EQ(vectors[1], (std::vector<float>{0.5f, 0.25f}));
}

TEST(EmbeddingClient, MalformedPayloadsAreProviderErrors) {
    EXPECT_THROW(EmbeddingClient::parseEmbeddings(R"({"data":[{"embedding":["x"]}]})", 1), ProviderError);
    EXPECT_THROW(EmbeddingClient::parseEmbeddings(R"({"data":[{"index":"0","embedding":[1]}]})", 1),
                 ProviderError);
    EXPECT_THROW(EmbeddingClient::parseEmbeddings(R"({"data":[]})", 1), ProviderError);
    EXPECT_THROW(EmbeddingClient::parseEmbeddings("not json", 1), ProviderError);
}

TEST(RerankClient, ParsesScoresIntoBatchOrder) {
    auto scores = RerankClient::parseScores(
        R"({"results":[{"index":2,"relevance_score":0.9},{"index":0,"relevance_score":0.1}]})", 3);
    EXPECT_EQ(scores, (std::vector<double>{0.1, 0.0, 0.9}));
}

TEST(RerankClient, MalformedPayloadsAreProviderErrors) {
    EXPECT_THROW(RerankClient::parseScores(R"({"results":[{"index":0,"relevance_score":"high"}]})", 1),
                 ProviderError);
    EXPECT_THROW(RerankClient::parseScores(R"({"results":[{"index":-1,"relevance_score":0.5}]})", 1),
                 ProviderError);
    EXPECT_THROW(RerankClient::parseScores(R"({"results":[{"index":4,"relevance_score":0.5}]})", 1),
                 ProviderError);
    EXPECT_THROW(RerankClient::parseScores(R"({"results":{}})", 1), ProviderError);
}
