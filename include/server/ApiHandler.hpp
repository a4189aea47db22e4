#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "analysis/Analyzer.hpp"
#include "analysis/ClusterLabeler.hpp"
#include "core/ItemStore.hpp"
#include "http/Request.hpp"
#include "pipeline/IngestionPipeline.hpp"
#include "search/HybridSearch.hpp"
#include "server/wserver.hpp"

namespace later {

// JSON endpoints over the engine. The caller is identified by the X-User-Id header.
class ApiHandler {
public:
    ApiHandler(ItemStore& store,
               IngestionPipeline& pipeline,
               const Analyzer& analyzer,
               ClusterLabeler& labeler,
               HybridSearch& search);

    void registerRoutes(wServer& server);

    http::Response addItem(const http::Request& req);
    http::Response retryItem(const http::Request& req);
    http::Response listItems(const http::Request& req);
    http::Response deleteItem(const http::Request& req);

    http::Response dimensionalReduction(const http::Request& req);
    http::Response generateClusters(const http::Request& req);
    http::Response analyzeClusters(const http::Request& req);
    http::Response labelClusters(const http::Request& req);

    http::Response searchItems(const http::Request& req);

private:
    ItemStore& store_;
    IngestionPipeline& pipeline_;
    const Analyzer& analyzer_;
    ClusterLabeler& labeler_;
    HybridSearch& search_;

    // Throws ValidationError when the header is missing
    static std::string userId(const http::Request& req);
    static std::string requireQuery(const http::Request& req, const std::string& key);
    static ItemFilter filterFrom(const http::Request& req);
    static AnalysisParams paramsFrom(const http::Request& req);
    static nlohmann::json parseBody(const http::Request& req);
};

} // namespace later
