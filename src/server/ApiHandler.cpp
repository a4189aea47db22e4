#include "server/ApiHandler.hpp"
#include "core/Errors.hpp"
#include "queue/PriorityScorer.hpp"
#include <iostream>
#include <map>

namespace later {

namespace {
    int toInt(const std::string& key, const std::string& value) {
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
            return parsed;
        } catch (const std::exception&) {
            throw ValidationError("Parameter '" + key + "' must be an integer");
        }
    }

    double toDouble(const std::string& key, const std::string& value) {
        try {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
            return parsed;
        } catch (const std::exception&) {
            throw ValidationError("Parameter '" + key + "' must be a number");
        }
    }

    bool toBool(const std::string& key, const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw ValidationError("Parameter '" + key + "' must be true or false");
    }

    nlohmann::json success(nlohmann::json body = nlohmann::json::object()) {
        body["status"] = "success";
        return body;
    }
}

ApiHandler::ApiHandler(ItemStore& store,
                       IngestionPipeline& pipeline,
                       const Analyzer& analyzer,
                       ClusterLabeler& labeler,
                       HybridSearch& search)
    : store_(store), pipeline_(pipeline), analyzer_(analyzer), labeler_(labeler), search_(search) {}

std::string ApiHandler::userId(const http::Request& req) {
    std::string id = req.getHeader("x-user-id");
    if (id.empty()) {
        throw ValidationError("Missing X-User-Id header");
    }
    return id;
}

std::string ApiHandler::requireQuery(const http::Request& req, const std::string& key) {
    std::string value = req.getQuery(key);
    if (value.empty()) {
        throw ValidationError("Missing query parameter '" + key + "'");
    }
    return value;
}

nlohmann::json ApiHandler::parseBody(const http::Request& req) {
    if (req.body.empty()) {
        throw ValidationError("Request body is empty");
    }
    try {
        return nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("Invalid JSON body: ") + e.what());
    }
}

ItemFilter ApiHandler::filterFrom(const http::Request& req) {
    ItemFilter filter;
    if (req.hasQuery("status") && !req.getQuery("status").empty()) {
        filter.clientStatus = clientStatusFromString(req.getQuery("status"));
    }
    return filter;
}

AnalysisParams ApiHandler::paramsFrom(const http::Request& req) {
    AnalysisParams params;
    if (req.hasQuery("k")) params.k = toInt("k", req.getQuery("k"));
    if (req.hasQuery("eps")) params.eps = toDouble("eps", req.getQuery("eps"));
    if (req.hasQuery("min_samples")) params.minSamples = toInt("min_samples", req.getQuery("min_samples"));
    if (req.hasQuery("dim_red")) params.dimRed = toInt("dim_red", req.getQuery("dim_red"));
    if (req.hasQuery("perplexity")) params.perplexity = toDouble("perplexity", req.getQuery("perplexity"));
    if (req.hasQuery("n_neighbors")) params.nNeighbors = toInt("n_neighbors", req.getQuery("n_neighbors"));
    if (req.hasQuery("min_dist")) params.minDist = toDouble("min_dist", req.getQuery("min_dist"));
    if (req.hasQuery("seed")) {
        int seed = toInt("seed", req.getQuery("seed"));
        if (seed < 0) throw ValidationError("Parameter 'seed' must not be negative");
        params.seed = static_cast<std::uint64_t>(seed);
    }
    return params;
}

// Items

http::Response ApiHandler::addItem(const http::Request& req) {
    std::string user = userId(req);
    nlohmann::json body = parseBody(req);
    if (!body.is_object() || !body.contains("url") || !body["url"].is_string()) {
        throw ValidationError("Body must be {\"url\": \"...\"}");
    }

    Item item = pipeline_.submitAsync(user, body["url"].get<std::string>());
    return http::Response::created(success({{"item_id", item.id}}));
}

http::Response ApiHandler::retryItem(const http::Request& req) {
    std::string user = userId(req);
    std::string id = requireQuery(req, "id");
    pipeline_.retryAsync(user, id);
    return http::Response::ok(success({{"item_id", id}}));
}

http::Response ApiHandler::listItems(const http::Request& req) {
    std::string user = userId(req);
    std::string sort = req.getQuery("sort", "created");
    if (sort != "created" && sort != "priority") {
        throw ValidationError("sort must be 'created' or 'priority'");
    }

    std::vector<Item> items = store_.listItems(user, filterFrom(req));
    nlohmann::json list = nlohmann::json::array();
    if (sort == "priority") {
        for (const auto& ranked : PriorityScorer::sortByPriority(items, nowMillis())) {
            nlohmann::json j = ranked.item.to_json();
            j["priority"] = ranked.priority;
            list.push_back(std::move(j));
        }
    } else {
        for (const auto& item : items) {
            list.push_back(item.to_json());
        }
    }
    return http::Response::ok(success({{"items", list}}));
}

http::Response ApiHandler::deleteItem(const http::Request& req) {
    std::string user = userId(req);
    std::string id = requireQuery(req, "id");
    if (!store_.getItem(user, id)) {
        throw NotFoundError("Item not found: " + id);
    }
    pipeline_.cancel(id);
    store_.deleteItem(user, id);
    return http::Response::ok(success({{"item_id", id}}));
}

// Clusters

http::Response ApiHandler::dimensionalReduction(const http::Request& req) {
    std::string user = userId(req);
    ProjectionMethod method = projectionFromString(req.getQuery("mode", "pca"));
    auto vectors = store_.getItemVectors(user, filterFrom(req));
    auto coordinates = analyzer_.project(vectors, method, paramsFrom(req));
    return http::Response::ok(success({
        {"mode", to_string(method)},
        {"coordinates", coordinatesToJson(coordinates)}
    }));
}

http::Response ApiHandler::generateClusters(const http::Request& req) {
    std::string user = userId(req);
    ClusteringMethod method = clusteringFromString(req.getQuery("mode", "kmeans"));
    auto vectors = store_.getItemVectors(user, filterFrom(req));
    auto assignments = analyzer_.cluster(vectors, method, paramsFrom(req));
    return http::Response::ok(success({
        {"mode", to_string(method)},
        {"assignments", assignmentsToJson(assignments)}
    }));
}

http::Response ApiHandler::analyzeClusters(const http::Request& req) {
    std::string user = userId(req);
    ProjectionMethod projection = projectionFromString(req.getQuery("projection", "pca"));
    ClusteringMethod clustering = clusteringFromString(req.getQuery("clustering", "kmeans"));
    auto vectors = store_.getItemVectors(user, filterFrom(req));
    AnalysisResult result = analyzer_.analyze(vectors, projection, clustering, paramsFrom(req));

    nlohmann::json body = result.to_json();
    body["projection"] = to_string(projection);
    body["clustering"] = to_string(clustering);
    return http::Response::ok(success(body));
}

http::Response ApiHandler::labelClusters(const http::Request& req) {
    std::string user = userId(req);
    nlohmann::json body = parseBody(req);
    if (!body.is_object() || !body.contains("clusters") || !body["clusters"].is_array()) {
        throw ValidationError("Body must be {\"clusters\": [{\"cluster_id\", \"item_ids\"}]}");
    }

    std::vector<ClusterInput> clusters;
    for (const auto& entry : body["clusters"]) {
        if (!entry.contains("cluster_id") || !entry["cluster_id"].is_number_integer() ||
            !entry.contains("item_ids") || !entry["item_ids"].is_array()) {
            throw ValidationError("Each cluster needs an integer cluster_id and an item_ids array");
        }
        ClusterInput input;
        input.clusterId = entry["cluster_id"].get<int>();
        auto ids = entry["item_ids"].get<std::vector<std::string>>();
        for (const auto& summary : store_.getItemSummaries(user, ids)) {
            input.memberSummaries.push_back(summary.summary);
        }
        clusters.push_back(std::move(input));
    }

    nlohmann::json labels = nlohmann::json::array();
    for (const auto& label : labeler_.label(clusters)) {
        labels.push_back(label.to_json());
    }
    return http::Response::ok(success({{"labels", labels}}));
}

// Search

http::Response ApiHandler::searchItems(const http::Request& req) {
    SearchRequest request;
    request.userId = userId(req);
    request.query = req.getQuery("query");
    request.mode = searchModeFromString(req.getQuery("mode", "semantic"));
    request.scope = searchScopeFromString(req.getQuery("scope", "items"));
    if (req.hasQuery("limit")) request.limit = toInt("limit", req.getQuery("limit"));
    if (req.hasQuery("rerank")) request.rerank = toBool("rerank", req.getQuery("rerank"));

    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : search_.search(request)) {
        results.push_back(result.to_json());
    }
    return http::Response::ok(success({{"results", results}}));
}

void ApiHandler::registerRoutes(wServer& server) {
    auto bind = [this](http::Response (ApiHandler::*method)(const http::Request&)) {
        return [this, method](const http::Request& req) { return (this->*method)(req); };
    };

    server.add_endpoint(endpoint(bind(&ApiHandler::addItem), HttpRequest::POST, "/items/add"));
    server.add_endpoint(endpoint(bind(&ApiHandler::retryItem), HttpRequest::POST, "/items/retry"));
    server.add_endpoint(endpoint(bind(&ApiHandler::listItems), HttpRequest::GET, "/items"));
    server.add_endpoint(endpoint(bind(&ApiHandler::deleteItem), HttpRequest::DELETE, "/items"));
    server.add_endpoint(endpoint(bind(&ApiHandler::searchItems), HttpRequest::GET, "/items/search"));
    server.add_endpoint(endpoint(bind(&ApiHandler::dimensionalReduction), HttpRequest::GET,
                                 "/clusters/dimensional-reduction"));
    server.add_endpoint(endpoint(bind(&ApiHandler::generateClusters), HttpRequest::GET, "/clusters/generate"));
    server.add_endpoint(endpoint(bind(&ApiHandler::analyzeClusters), HttpRequest::GET, "/clusters/analyze"));
    server.add_endpoint(endpoint(bind(&ApiHandler::labelClusters), HttpRequest::POST, "/clusters/label"));
}

} // namespace later
