#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <map>
#include <memory>
#include "MockProviders.hpp"
#include "core/Errors.hpp"
#include "core/SqliteItemStore.hpp"
#include "server/ApiHandler.hpp"
#include "server/wserver.hpp"

using namespace later;
using namespace later::testing;
using ::testing::_;
using ::testing::Return;
using json = nlohmann::json;

namespace {
    http::Request makeRequest(HttpRequest method, const std::string& target,
                              const std::string& body = "", const std::string& user = "alice") {
        http::Request req;
        req.method = method;
        size_t qm = target.find('?');
        req.path = target.substr(0, qm);
        if (qm != std::string::npos) {
            req.query = wServer::parse_query(target.substr(qm + 1));
        }
        if (!user.empty()) req.headers["x-user-id"] = user;
        req.body = body;
        return req;
    }
}

TEST(wServer, ParsesQueryStrings) {
    auto q = wServer::parse_query("query=rust+async&limit=5&empty=&flag&x=%2Fa%20b&&=skip");
    EXPECT_EQ(q["query"], "rust async");
    EXPECT_EQ(q["limit"], "5");
    EXPECT_EQ(q["empty"], "");
    EXPECT_EQ(q.count("flag"), 1u);
    EXPECT_EQ(q["x"], "/a b");
    EXPECT_EQ(q.count(""), 0u);
    EXPECT_EQ(wServer::url_decode("100%"), "100%");
}

TEST(wServer, MapsErrorsToStatusCodes) {
    wServer server;
    auto thrower = [](auto error) {
        return [error](const http::Request&) -> http::Response { throw error; };
    };
    server.add_endpoint(endpoint(thrower(ValidationError("bad")), HttpRequest::GET, "/validation"));
    server.add_endpoint(endpoint(thrower(NotFoundError("gone")), HttpRequest::GET, "/missing"));
    server.add_endpoint(endpoint(thrower(ConflictError("dup")), HttpRequest::GET, "/conflict"));
    server.add_endpoint(endpoint(thrower(InsufficientDataError("few")), HttpRequest::GET, "/few"));
    server.add_endpoint(endpoint(thrower(ProviderTimeoutError("slow")), HttpRequest::GET, "/timeout"));
    server.add_endpoint(endpoint(thrower(ProviderError("down", 500, true)), HttpRequest::GET, "/provider"));
    server.add_endpoint(endpoint(thrower(std::runtime_error("oops")), HttpRequest::GET, "/crash"));
    server.add_endpoint(endpoint([](const http::Request&) { return http::Response::ok({{"ok", true}}); },
                                 HttpRequest::GET, "/fine"));

    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/validation")).status, 400);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/missing")).status, 404);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/conflict")).status, 409);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/few")).status, 422);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/timeout")).status, 504);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/provider")).status, 502);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/crash")).status, 500);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/fine")).status, 200);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::POST, "/fine")).status, 405);
    EXPECT_EQ(server.handle(makeRequest(HttpRequest::GET, "/nowhere")).status, 404);

    auto body = json::parse(server.handle(makeRequest(HttpRequest::GET, "/validation")).body);
    EXPECT_EQ(body["status"], "error");
    EXPECT_EQ(body["message"], "bad");
}

class ApiHandlerTest : public ::testing::Test {
protected:
    SqliteItemStore store{":memory:"};
    MockContentExtractor extractor;
    MockCompletionProvider completion;
    KeywordEmbedder embedder{{"cat", "dog", "bank"}};
    Analyzer analyzer;
    std::unique_ptr<IngestionPipeline> pipeline;
    std::unique_ptr<ClusterLabeler> labeler;
    std::unique_ptr<HybridSearch> search;
    std::unique_ptr<ApiHandler> api;
    wServer server;

    void SetUp() override {
        PipelineOptions options;
        options.workerThreads = 1;
        options.sleeper = [](std::chrono::milliseconds) {};
        pipeline = std::make_unique<IngestionPipeline>(store, extractor, completion, embedder, options);
        labeler = std::make_unique<ClusterLabeler>(completion);
        search = std::make_unique<HybridSearch>(store, embedder, nullptr);
        api = std::make_unique<ApiHandler>(store, *pipeline, analyzer, *labeler, *search);
        api->registerRoutes(server);
    }

    void TearDown() override {
        api.reset();
        search.reset();
        labeler.reset();
        pipeline.reset();
    }

    http::Response call(HttpRequest method, const std::string& target, const std::string& body = "",
                        const std::string& user = "alice") {
        return server.handle(makeRequest(method, target, body, user));
    }

    // Saves and fully ingests one article, returning its id
    std::string addArticle(const std::string& url, const std::string& text, const std::string& summary) {
        ArticleContent content;
        content.url = url;
        content.title = url;
        content.text = text;
        content.markdown = text;
        EXPECT_CALL(extractor, extract(url, _)).WillOnce(Return(content));
        EXPECT_CALL(completion, complete(_, ::testing::HasSubstr(text), _, _))
            .WillOnce(Return(json{{"summary", summary}, {"expiry_score", 0.5}}));

        auto res = call(HttpRequest::POST, "/items/add", json{{"url", url}}.dump());
        EXPECT_EQ(res.status, 201);
        pipeline->drain();
        return json::parse(res.body)["item_id"].get<std::string>();
    }
};

TEST_F(ApiHandlerTest, RequiresUserHeader) {
    auto res = call(HttpRequest::GET, "/items", "", "");
    EXPECT_EQ(res.status, 400);
}

TEST_F(ApiHandlerTest, AddListAndDeleteItems) {
    std::string id = addArticle("https://example.com/cats", "cat cat cat", "All about cats.");

    auto list = json::parse(call(HttpRequest::GET, "/items").body);
    EXPECT_EQ(list["status"], "success");
    ASSERT_EQ(list["items"].size(), 1u);
    EXPECT_EQ(list["items"][0]["id"], id);
    EXPECT_FALSE(list["items"][0].contains("priority"));

    auto ranked = json::parse(call(HttpRequest::GET, "/items?sort=priority&status=queued").body);
    ASSERT_EQ(ranked["items"].size(), 1u);
    EXPECT_TRUE(ranked["items"][0]["priority"].is_number());

    EXPECT_TRUE(json::parse(call(HttpRequest::GET, "/items", "", "bob").body)["items"].empty());

    EXPECT_EQ(call(HttpRequest::DELETE, "/items?id=" + id).status, 200);
    EXPECT_EQ(call(HttpRequest::DELETE, "/items?id=" + id).status, 404);
    EXPECT_TRUE(json::parse(call(HttpRequest::GET, "/items").body)["items"].empty());
}

TEST_F(ApiHandlerTest, AddRejectsBadInput) {
    EXPECT_EQ(call(HttpRequest::POST, "/items/add", "{not json").status, 400);
    EXPECT_EQ(call(HttpRequest::POST, "/items/add", R"({"link":"x"})").status, 400);
    EXPECT_EQ(call(HttpRequest::POST, "/items/add", R"({"url":"nodomain"})").status, 400);
    EXPECT_EQ(call(HttpRequest::GET, "/items?sort=random").status, 400);
    EXPECT_EQ(call(HttpRequest::GET, "/items?status=unknown").status, 400);
}

TEST_F(ApiHandlerTest, DuplicateAddConflicts) {
    addArticle("https://example.com/dogs", "dog dog", "Dogs.");
    EXPECT_EQ(call(HttpRequest::POST, "/items/add", R"({"url":"https://example.com/dogs/"})").status, 409);
}

TEST_F(ApiHandlerTest, RetryUnknownItemIsNotFound) {
    EXPECT_EQ(call(HttpRequest::POST, "/items/retry?id=missing").status, 404);
    EXPECT_EQ(call(HttpRequest::POST, "/items/retry").status, 400);
}

TEST_F(ApiHandlerTest, ClusteringNeedsTwoItems) {
    addArticle("https://example.com/cats", "cat cat", "Cats.");
    EXPECT_EQ(call(HttpRequest::GET, "/clusters/generate?mode=kmeans").status, 422);
    EXPECT_EQ(call(HttpRequest::GET, "/clusters/dimensional-reduction?mode=pca").status, 422);
}

TEST_F(ApiHandlerTest, AnalyzeAndLabelClusters) {
    std::string a = addArticle("https://example.com/a", "cat cat cat", "Cats one.");
    std::string b = addArticle("https://example.com/b", "cat cat kitten", "Cats two.");
    std::string c = addArticle("https://example.com/c", "bank bank", "Banking.");

    auto res = call(HttpRequest::GET, "/clusters/analyze?projection=pca&clustering=kmeans&k=2&seed=3");
    ASSERT_EQ(res.status, 200);
    auto body = json::parse(res.body);
    EXPECT_EQ(body["coordinates"].size(), 3u);
    ASSERT_EQ(body["assignments"].size(), 3u);
    std::map<std::string, int> cluster;
    for (const auto& entry : body["assignments"]) {
        cluster[entry["id"].get<std::string>()] = entry["cluster_id"].get<int>();
    }
    EXPECT_EQ(cluster[a], cluster[b]);
    EXPECT_NE(cluster[a], cluster[c]);

    EXPECT_EQ(call(HttpRequest::GET, "/clusters/analyze?projection=isomap").status, 400);
    EXPECT_EQ(call(HttpRequest::GET, "/clusters/generate?k=two").status, 400);

    EXPECT_CALL(completion, complete(_, ::testing::HasSubstr("Cats one."), _, _))
        .WillOnce(Return(json{{"label", "Cats"}}));
    json labelBody;
    labelBody["clusters"] = json::array();
    labelBody["clusters"].push_back({{"cluster_id", 0}, {"item_ids", json::array({a, b})}});
    labelBody["clusters"].push_back({{"cluster_id", -1}, {"item_ids", json::array({c})}});
    auto labeled = call(HttpRequest::POST, "/clusters/label", labelBody.dump());
    ASSERT_EQ(labeled.status, 200);
    auto labels = json::parse(labeled.body)["labels"];
    ASSERT_EQ(labels.size(), 1u);
    EXPECT_EQ(labels[0]["cluster_id"], 0);
    EXPECT_EQ(labels[0]["label"], "Cats");
    EXPECT_EQ(labels[0]["state"], "labeled");
}

TEST_F(ApiHandlerTest, SearchEndpoint) {
    std::string a = addArticle("https://example.com/cats", "cat cat cat", "Cats.");
    addArticle("https://example.com/bank", "bank bank", "Banking.");

    auto res = call(HttpRequest::GET, "/items/search?query=cat&limit=5");
    ASSERT_EQ(res.status, 200);
    auto results = json::parse(res.body)["results"];
    ASSERT_GE(results.size(), 1u);
    EXPECT_EQ(results[0]["id"], a);

    EXPECT_TRUE(json::parse(call(HttpRequest::GET, "/items/search?query=").body)["results"].empty());
    EXPECT_EQ(call(HttpRequest::GET, "/items/search?query=cat&limit=0").status, 400);
    EXPECT_EQ(call(HttpRequest::GET, "/items/search?query=cat&mode=fuzzy").status, 400);
    EXPECT_EQ(call(HttpRequest::GET, "/items/search?query=cat&rerank=maybe").status, 400);
}
