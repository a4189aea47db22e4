#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockProviders.hpp"
#include "core/Errors.hpp"
#include "embedding/Tokenizer.hpp"
#include "embedding/VectorMath.hpp"
#include "embedding/Vectorizer.hpp"

using namespace later;
using namespace later::testing;
using ::testing::_;
using ::testing::Invoke;

namespace {
    std::string wordsText(int n) {
        std::string text;
        for (int i = 0; i < n; ++i) {
            if (i) text += (i % 7 == 0) ? "\n" : " ";
            text += "w" + std::to_string(i);
        }
        return text;
    }
}

TEST(Tokenizer, SplitsOnWhitespace) {
    std::string text = "  alpha\tbeta\n\ngamma ";
    EXPECT_EQ(Tokenizer::countTokens(text), 3);
    auto words = Tokenizer::words(text);
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "alpha");
    EXPECT_EQ(words[2], "gamma");

    auto spans = Tokenizer::tokenize(text);
    EXPECT_EQ(text.substr(spans[1].begin, spans[1].end - spans[1].begin), "beta");
    EXPECT_EQ(Tokenizer::countTokens("   "), 0);
}

TEST(VectorMath, CosineAndMean) {
    EXPECT_FLOAT_EQ(VectorMath::cosineSimilarity({1, 0}, {2, 0}), 1.0f);
    EXPECT_NEAR(VectorMath::cosineSimilarity({1, 0}, {0, 3}), 0.0f, 1e-6);
    EXPECT_FLOAT_EQ(VectorMath::cosineSimilarity({0, 0}, {1, 0}), 0.0f);
    EXPECT_NEAR(VectorMath::cosineDistance({1, 0}, {-1, 0}), 2.0f, 1e-6);

    auto m = VectorMath::mean({{1, 2}, {3, 4}});
    EXPECT_FLOAT_EQ(m[0], 2.0f);
    EXPECT_FLOAT_EQ(m[1], 3.0f);
    EXPECT_THROW(VectorMath::mean({{1, 2}, {3}}), ValidationError);

    auto unit = VectorMath::l2Normalize({3, 4});
    EXPECT_FLOAT_EQ(unit[0], 0.6f);
    EXPECT_FLOAT_EQ(unit[1], 0.8f);
}

TEST(Vectorizer, ChunksOverlapAndCoverText) {
    std::string text = wordsText(25);
    auto chunks = Vectorizer::splitChunks(text, 10, 0.2);

    // stride 8: [0,10) [8,18) [16,25)
    ASSERT_EQ(chunks.size(), 3u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].position, static_cast<int>(i));
        EXPECT_LE(chunks[i].tokenCount, 10);
        EXPECT_NE(text.find(chunks[i].text), std::string::npos);
    }
    EXPECT_EQ(Tokenizer::words(chunks[0].text).front(), "w0");
    EXPECT_EQ(Tokenizer::words(chunks[1].text).front(), "w8");
    EXPECT_EQ(Tokenizer::words(chunks[2].text).back(), "w24");
    EXPECT_EQ(chunks[2].tokenCount, 9);
}

TEST(Vectorizer, ShortTextIsOneChunk) {
    auto chunks = Vectorizer::splitChunks("one two three", 512, 0.15);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].text, "one two three");
    EXPECT_EQ(chunks[0].tokenCount, 3);
}

TEST(Vectorizer, RejectsBadOverlap) {
    EXPECT_THROW(Vectorizer::splitChunks("a b c", 2, 0.6), ValidationError);
    EXPECT_THROW(Vectorizer::splitChunks("a b c", 2, -0.1), ValidationError);
    EXPECT_THROW(Vectorizer::splitChunks("a b c", 0, 0.1), ValidationError);
}

TEST(Vectorizer, UnderLimitUsesDirectEmbedding) {
    KeywordEmbedder embedder({"cat", "dog"});
    Vectorizer vectorizer(embedder, VectorizerConfig{4, 0.25}, 2);

    std::string text = "cat cat dog bird fish cat";
    auto result = vectorizer.vectorize(text, 100);

    EXPECT_FALSE(result.pooled);
    EXPECT_EQ(result.tokenCount, 6);
    EXPECT_EQ(result.fullEmbedding, embedder.embed(text));
    ASSERT_EQ(result.chunks.size(), 2u);
    for (const auto& chunk : result.chunks) {
        EXPECT_EQ(chunk.embedding, embedder.embed(chunk.text));
    }
}

TEST(Vectorizer, OverLimitPoolsChunkMean) {
    MockEmbeddingProvider embedder;
    EXPECT_CALL(embedder, embed(_, _)).Times(0);
    EXPECT_CALL(embedder, embedBatch(_, _))
        .WillRepeatedly(Invoke([](const std::vector<std::string>& texts, const CancelToken*) {
            std::vector<std::vector<float>> out;
            for (const auto& t : texts) {
                out.push_back({static_cast<float>(Tokenizer::countTokens(t)), 1.0f});
            }
            return out;
        }));

    Vectorizer vectorizer(embedder, VectorizerConfig{512, 0.0}, 16);
    std::string text = wordsText(30);
    auto result = vectorizer.vectorize(text, 10);

    EXPECT_TRUE(result.pooled);
    ASSERT_EQ(result.chunks.size(), 3u);
    std::vector<std::vector<float>> vectors;
    for (const auto& c : result.chunks) vectors.push_back(c.embedding);
    EXPECT_EQ(result.fullEmbedding, VectorMath::mean(vectors));
}

TEST(Vectorizer, EmptyTextIsRejectedWithoutProviderCalls) {
    MockEmbeddingProvider embedder;
    EXPECT_CALL(embedder, embed(_, _)).Times(0);
    EXPECT_CALL(embedder, embedBatch(_, _)).Times(0);

    Vectorizer vectorizer(embedder);
    EXPECT_THROW(vectorizer.vectorize(" \n\t ", 8000), ValidationError);
}

TEST(Vectorizer, ProviderErrorsPropagate) {
    MockEmbeddingProvider embedder;
    EXPECT_CALL(embedder, embedBatch(_, _))
        .WillOnce(::testing::Throw(ProviderTimeoutError("slow")));

    Vectorizer vectorizer(embedder);
    EXPECT_THROW(vectorizer.vectorize("some words here", 8000), ProviderTimeoutError);
}
