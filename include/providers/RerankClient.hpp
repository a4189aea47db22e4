#pragma once

#include "providers/HttpClient.hpp"
#include "providers/Providers.hpp"
#include <string>
#include <vector>

namespace later {

// Cohere /v1/rerank cross-encoder.
class RerankClient : public Reranker {
public:
    RerankClient(const std::string& apiKey,
                 const std::string& baseUrl = "https://api.cohere.com",
                 long timeoutSeconds = 30);

    std::vector<double> rerank(const std::string& query,
                               const std::vector<std::string>& candidates,
                               const CancelToken* cancel = nullptr) override;

    // Decode one /v1/rerank response for a batch of `batchSize` documents.
    // Scores land in batch order. Throws ProviderError on any malformed payload.
    static std::vector<double> parseScores(const std::string& response, size_t batchSize);

    // Set model name (default: rerank-english-v3.0)
    void setModel(const std::string& model) { model_ = model; }

    // Documents per request; the API rejects larger batches
    void setBatchSize(size_t size) { batchSize_ = size == 0 ? 1 : size; }

private:
    std::string apiKey_;
    std::string baseUrl_;
    long timeoutSeconds_;
    std::string model_ = "rerank-english-v3.0";
    size_t batchSize_ = 100;
    HttpClient http_;
};

} // namespace later
