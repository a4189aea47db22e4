#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include "MockProviders.hpp"
#include "core/Errors.hpp"
#include "core/SqliteItemStore.hpp"
#include "pipeline/IngestionPipeline.hpp"
#include "pipeline/RetryPolicy.hpp"

using namespace later;
using namespace later::testing;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;
using json = nlohmann::json;

namespace {
    ArticleContent article(const std::string& url, const std::string& text,
                           std::optional<std::string> canonical = std::nullopt) {
        ArticleContent content;
        content.url = url;
        content.canonicalUrl = canonical;
        content.title = "A Title";
        content.sourceSite = "Example";
        content.markdown = "# A Title\n\n" + text;
        content.text = text;
        return content;
    }

    json summaryJson(double expiry = 0.3) {
        return {{"summary", "Short summary."}, {"expiry_score", expiry}};
    }

    // Decodes a provider payload whose vector holds a string.
    class MalformedPayloadEmbedder : public EmbeddingProvider {
    public:
        std::vector<float> embed(const std::string&, const CancelToken*) override {
            json payload = json::parse(R"({"embedding":["x"]})");
            return payload["embedding"].get<std::vector<float>>();
        }
    };
}

class IngestionPipelineTest : public ::testing::Test {
protected:
    SqliteItemStore store{":memory:"};
    MockContentExtractor extractor;
    MockCompletionProvider completion;
    KeywordEmbedder embedder{{"cat", "dog"}};
    int sleeps = 0;
    std::unique_ptr<IngestionPipeline> pipeline;

    void SetUp() override {
        PipelineOptions options;
        options.vectorizer.chunkTokens = 4;
        options.vectorizer.overlapFraction = 0.25;
        options.workerThreads = 2;
        options.sleeper = [this](std::chrono::milliseconds) { ++sleeps; };
        pipeline = std::make_unique<IngestionPipeline>(store, extractor, completion, embedder, options);
    }

    void TearDown() override {
        pipeline.reset();
    }
};

TEST_F(IngestionPipelineTest, IngestRunsEveryStage) {
    EXPECT_CALL(extractor, extract("https://example.com/cats", _))
        .WillOnce(Return(article("https://example.com/cats", "the cat sat on the mat with another cat")));
    EXPECT_CALL(completion, complete(_, ::testing::HasSubstr("the cat sat"), _, _))
        .WillOnce(Return(summaryJson(0.8)));

    auto item = pipeline->ingest("alice", "example.com/cats");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->serverStatus, ServerStatus::Classified);
    EXPECT_EQ(item->clientStatus, ClientStatus::Queued);
    EXPECT_EQ(item->title, std::optional<std::string>("A Title"));
    EXPECT_EQ(item->summary, std::optional<std::string>("Short summary."));
    EXPECT_DOUBLE_EQ(item->expiryScore.value_or(-1), 0.8);
    EXPECT_EQ(item->tokenCount, std::optional<int>(9));
    EXPECT_TRUE(item->hasEmbedding());
    EXPECT_FALSE(item->errorMessage.has_value());
    EXPECT_EQ(store.countChunks("alice", item->id), 3);
}

TEST_F(IngestionPipelineTest, DuplicateSubmissionConflicts) {
    pipeline->submit("alice", "https://example.com/a");
    EXPECT_THROW(pipeline->submit("alice", "https://example.com/a/"), ConflictError);
    EXPECT_THROW(pipeline->submit("alice", "example.com/a#section"), ConflictError);
    EXPECT_EQ(store.listItems("alice", {}).size(), 1u);
}

TEST_F(IngestionPipelineTest, SubmitValidatesInput) {
    EXPECT_THROW(pipeline->submit("", "https://example.com"), ValidationError);
    EXPECT_THROW(pipeline->submit("alice", "not a url"), ValidationError);
    EXPECT_TRUE(store.listItems("alice", {}).empty());
}

TEST_F(IngestionPipelineTest, TimeoutIsRetried) {
    EXPECT_CALL(extractor, extract(_, _))
        .WillOnce(Throw(ProviderTimeoutError("slow site")))
        .WillOnce(Return(article("https://example.com/x", "dog days")));
    EXPECT_CALL(completion, complete(_, _, _, _)).WillOnce(Return(summaryJson()));

    auto item = pipeline->ingest("alice", "https://example.com/x");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->serverStatus, ServerStatus::Classified);
    EXPECT_EQ(sleeps, 1);
}

TEST_F(IngestionPipelineTest, RetriesStopAtMaxAttempts) {
    EXPECT_CALL(extractor, extract(_, _))
        .Times(3)
        .WillRepeatedly(Throw(ProviderError("rate limited", 429, true)));
    EXPECT_CALL(completion, complete(_, _, _, _)).Times(0);

    auto item = pipeline->ingest("alice", "https://example.com/x");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->clientStatus, ClientStatus::Error);
    EXPECT_EQ(sleeps, 2);
}

TEST_F(IngestionPipelineTest, PermanentFailureRecordsError) {
    EXPECT_CALL(extractor, extract(_, _)).WillOnce(Throw(ExtractionError("page is empty")));
    EXPECT_CALL(completion, complete(_, _, _, _)).Times(0);

    auto item = pipeline->ingest("alice", "https://example.com/empty");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->clientStatus, ClientStatus::Error);
    EXPECT_EQ(item->serverStatus, ServerStatus::Saved);
    EXPECT_EQ(item->errorMessage, std::optional<std::string>("page is empty"));
    EXPECT_EQ(sleeps, 0);
}

TEST_F(IngestionPipelineTest, ResumesFromFirstIncompleteStage) {
    EXPECT_CALL(extractor, extract(_, _))
        .Times(1)
        .WillOnce(Return(article("https://example.com/r", "cat and dog")));
    EXPECT_CALL(completion, complete(_, _, _, _))
        .WillOnce(Return(json{{"summary", 42}}))
        .WillOnce(Return(summaryJson()));

    auto failed = pipeline->ingest("alice", "https://example.com/r");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->clientStatus, ClientStatus::Error);
    EXPECT_EQ(failed->serverStatus, ServerStatus::Extracted);

    auto resumed = pipeline->run("alice", failed->id);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed->serverStatus, ServerStatus::Classified);
    EXPECT_EQ(resumed->clientStatus, ClientStatus::Queued);
    EXPECT_FALSE(resumed->errorMessage.has_value());
}

TEST_F(IngestionPipelineTest, CanonicalConflictRemovesNewRow) {
    EXPECT_CALL(extractor, extract("https://example.com/story", _))
        .WillOnce(Return(article("https://example.com/story", "cat story")));
    EXPECT_CALL(extractor, extract("https://short.link/abc", _))
        .WillOnce(Return(article("https://short.link/abc", "cat story", "https://example.com/story/")));
    EXPECT_CALL(completion, complete(_, _, _, _)).WillOnce(Return(summaryJson()));

    ASSERT_TRUE(pipeline->ingest("alice", "https://example.com/story").has_value());
    EXPECT_THROW(pipeline->ingest("alice", "https://short.link/abc"), ConflictError);

    auto items = store.listItems("alice", {});
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].url, "https://example.com/story");
}

TEST_F(IngestionPipelineTest, DeletedItemStopsQuietly) {
    Item item = pipeline->submit("alice", "https://example.com/gone");
    EXPECT_CALL(extractor, extract(_, _))
        .WillOnce(Invoke([&](const std::string& url, const CancelToken*) {
            store.deleteItem("alice", item.id);
            return article(url, "cat");
        }));
    EXPECT_CALL(completion, complete(_, _, _, _)).Times(0);

    EXPECT_FALSE(pipeline->run("alice", item.id).has_value());
    EXPECT_FALSE(pipeline->run("alice", "no-such-item").has_value());
}

TEST_F(IngestionPipelineTest, SubmitAsyncFinishesInBackground) {
    EXPECT_CALL(extractor, extract(_, _)).WillOnce(Return(article("https://example.com/bg", "dog walk")));
    EXPECT_CALL(completion, complete(_, _, _, _)).WillOnce(Return(summaryJson()));

    Item item = pipeline->submitAsync("alice", "https://example.com/bg");
    EXPECT_EQ(item.clientStatus, ClientStatus::Adding);
    pipeline->drain();

    auto done = store.getItem("alice", item.id);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->serverStatus, ServerStatus::Classified);
    EXPECT_FALSE(pipeline->cancel(item.id));
}

TEST_F(IngestionPipelineTest, RetryAsyncNeedsKnownItem) {
    EXPECT_THROW(pipeline->retryAsync("alice", "missing"), NotFoundError);
}

TEST_F(IngestionPipelineTest, UnexpectedExceptionIsRecordedOnItem) {
    MalformedPayloadEmbedder badEmbedder;
    PipelineOptions options;
    options.sleeper = [this](std::chrono::milliseconds) { ++sleeps; };
    IngestionPipeline local(store, extractor, completion, badEmbedder, options);

    EXPECT_CALL(extractor, extract(_, _)).WillOnce(Return(article("https://example.com/bad", "cat and dog")));
    EXPECT_CALL(completion, complete(_, _, _, _)).WillOnce(Return(summaryJson()));

    std::optional<Item> item;
    ASSERT_NO_THROW(item = local.ingest("alice", "https://example.com/bad"));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->clientStatus, ClientStatus::Error);
    EXPECT_EQ(item->serverStatus, ServerStatus::Summarised);
    ASSERT_TRUE(item->errorMessage.has_value());
    EXPECT_NE(item->errorMessage->find("type must be number"), std::string::npos);
    EXPECT_EQ(sleeps, 0);
}

TEST(RetryPolicy, DelaysGrowAndCap) {
    RetryConfig config;
    config.initialDelayMs = 100;
    config.multiplier = 3.0;
    config.maxDelayMs = 500;
    RetryPolicy policy(config, [](std::chrono::milliseconds) {});
    EXPECT_EQ(policy.delayFor(1).count(), 100);
    EXPECT_EQ(policy.delayFor(2).count(), 300);
    EXPECT_EQ(policy.delayFor(3).count(), 500);
}

TEST(RetryPolicy, CancelledTokenStopsRetrying) {
    auto token = makeCancelToken();
    token->cancel();
    int calls = 0;
    RetryPolicy policy({}, [](std::chrono::milliseconds) {});
    EXPECT_THROW(policy.run("op", [&]() -> int {
        ++calls;
        throw ProviderTimeoutError("slow");
    }, token.get()), ProviderTimeoutError);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicy, CancellationDuringBackoffStopsRetrying) {
    auto token = makeCancelToken();
    int calls = 0;
    int sleeps = 0;
    RetryPolicy policy({}, [&](std::chrono::milliseconds) {
        ++sleeps;
        token->cancel();
    });
    EXPECT_THROW(policy.run("op", [&]() -> int {
        ++calls;
        throw ProviderTimeoutError("slow");
    }, token.get()), ProviderTimeoutError);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(sleeps, 1);
}
