#include "providers/EmbeddingClient.hpp"
#include "core/Errors.hpp"
#include <nlohmann/json.hpp>

namespace later {

EmbeddingClient::EmbeddingClient(const std::string& apiKey, const std::string& baseUrl,
                                 long timeoutSeconds)
    : apiKey_(apiKey), baseUrl_(baseUrl), timeoutSeconds_(timeoutSeconds) {}

std::vector<std::vector<float>> EmbeddingClient::parseEmbeddings(const std::string& response,
                                                                 size_t expected) {
    nlohmann::json jsonResponse;
    try {
        jsonResponse = nlohmann::json::parse(response);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProviderError(std::string("Embedding response is not JSON: ") + e.what());
    }

    if (jsonResponse.contains("error")) {
        throw ProviderError("Embedding API error: " + jsonResponse["error"].dump());
    }
    if (!jsonResponse.contains("data") || !jsonResponse["data"].is_array()) {
        throw ProviderError("Embedding response has no data array");
    }

    std::vector<std::vector<float>> results(expected);
    size_t seen = 0;
    for (const auto& item : jsonResponse["data"]) {
        if (!item.contains("embedding") || !item["embedding"].is_array()) {
            throw ProviderError("Embedding response item has no embedding");
        }
        // Providers may reorder batch results; "index" says where each belongs.
        size_t index = 0;
        std::vector<float> vec;
        try {
            index = item.value("index", seen);
            vec = item["embedding"].get<std::vector<float>>();
        } catch (const nlohmann::json::exception& e) {
            throw ProviderError(std::string("Embedding response is malformed: ") + e.what());
        }
        if (index >= expected) {
            throw ProviderError("Embedding response index out of range");
        }
        results[index] = std::move(vec);
        ++seen;
    }
    if (seen != expected) {
        throw ProviderError("Embedding response returned " + std::to_string(seen) +
                            " vectors for " + std::to_string(expected) + " inputs");
    }
    for (const auto& vec : results) {
        if (vec.empty()) {
            throw ProviderError("Embedding response contains an empty vector");
        }
    }
    return results;
}

std::vector<std::vector<float>> EmbeddingClient::embedBatch(const std::vector<std::string>& texts,
                                                            const CancelToken* cancel) {
    if (texts.empty()) {
        return {};
    }

    nlohmann::json requestBody = {
        {"model", model_},
        {"input", texts},
        {"encoding_format", "float"}
    };

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + apiKey_
    };

    HttpResponse response = http_.post(baseUrl_ + "/v1/embeddings", requestBody.dump(), headers,
                                       timeoutSeconds_, cancel);
    HttpClient::checkStatus(response, "Embedding request");
    return parseEmbeddings(response.body, texts.size());
}

std::vector<float> EmbeddingClient::embed(const std::string& text, const CancelToken* cancel) {
    if (text.empty()) {
        throw ValidationError("Cannot embed empty text");
    }
    return embedBatch({text}, cancel).front();
}

} // namespace later
