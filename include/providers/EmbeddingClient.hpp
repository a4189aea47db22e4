#pragma once

#include "providers/HttpClient.hpp"
#include "providers/Providers.hpp"
#include <string>
#include <vector>

namespace later {

// OpenAI-compatible /v1/embeddings client (Mistral by default).
class EmbeddingClient : public EmbeddingProvider {
public:
    EmbeddingClient(const std::string& apiKey,
                    const std::string& baseUrl = "https://api.mistral.ai",
                    long timeoutSeconds = 30);

    std::vector<float> embed(const std::string& text, const CancelToken* cancel = nullptr) override;

    std::vector<std::vector<float>> embedBatch(const std::vector<std::string>& texts,
                                               const CancelToken* cancel = nullptr) override;

    // Decode an /v1/embeddings response body into `expected` vectors.
    // Throws ProviderError on any malformed payload.
    static std::vector<std::vector<float>> parseEmbeddings(const std::string& response, size_t expected);

    // Set model name (default: mistral-embed)
    void setModel(const std::string& model) { model_ = model; }

private:
    std::string apiKey_;
    std::string baseUrl_;
    long timeoutSeconds_;
    std::string model_ = "mistral-embed";
    HttpClient http_;
};

} // namespace later
