#include "providers/RerankClient.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace later {

RerankClient::RerankClient(const std::string& apiKey, const std::string& baseUrl,
                           long timeoutSeconds)
    : apiKey_(apiKey), baseUrl_(baseUrl), timeoutSeconds_(timeoutSeconds) {}

std::vector<double> RerankClient::parseScores(const std::string& response, size_t batchSize) {
    nlohmann::json jsonResponse;
    try {
        jsonResponse = nlohmann::json::parse(response);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProviderError(std::string("Rerank response is not JSON: ") + e.what());
    }
    if (!jsonResponse.contains("results") || !jsonResponse["results"].is_array()) {
        throw ProviderError("Rerank response has no results");
    }

    std::vector<double> scores(batchSize, 0.0);
    for (const auto& result : jsonResponse["results"]) {
        if (!result.contains("index") || !result.contains("relevance_score")) {
            throw ProviderError("Rerank result is missing index or relevance_score");
        }
        size_t index = 0;
        double score = 0.0;
        try {
            index = result["index"].get<size_t>();
            score = result["relevance_score"].get<double>();
        } catch (const nlohmann::json::exception& e) {
            throw ProviderError(std::string("Rerank result is malformed: ") + e.what());
        }
        if (index >= batchSize) {
            throw ProviderError("Rerank result index out of range");
        }
        scores[index] = score;
    }
    return scores;
}

std::vector<double> RerankClient::rerank(const std::string& query,
                                         const std::vector<std::string>& candidates,
                                         const CancelToken* cancel) {
    std::vector<double> scores(candidates.size(), 0.0);
    if (candidates.empty()) {
        return scores;
    }

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Accept: application/json",
        "Authorization: Bearer " + apiKey_
    };

    for (size_t offset = 0; offset < candidates.size(); offset += batchSize_) {
        size_t end = std::min(candidates.size(), offset + batchSize_);
        std::vector<std::string> batch(candidates.begin() + offset, candidates.begin() + end);

        nlohmann::json requestBody = {
            {"model", model_},
            {"query", query},
            {"documents", batch},
            {"top_n", batch.size()},
            {"return_documents", false}
        };

        HttpResponse response = http_.post(baseUrl_ + "/v1/rerank", requestBody.dump(), headers,
                                           timeoutSeconds_, cancel);
        HttpClient::checkStatus(response, "Rerank request");

        std::vector<double> batchScores = parseScores(response.body, batch.size());
        std::copy(batchScores.begin(), batchScores.end(), scores.begin() + offset);
    }
    return scores;
}

} // namespace later
