#pragma once

#include "providers/HttpClient.hpp"
#include "providers/Providers.hpp"
#include <string>

namespace later {

// Chat-completions client that asks for JSON matching a schema (Mistral by default).
class CompletionClient : public CompletionProvider {
public:
    CompletionClient(const std::string& apiKey,
                     const std::string& baseUrl = "https://api.mistral.ai",
                     long timeoutSeconds = 60);

    nlohmann::json complete(const std::string& systemPrompt,
                            const std::string& userContent,
                            const nlohmann::json& schema,
                            const CancelToken* cancel = nullptr) override;

    // Set model name (default: mistral-medium-latest)
    void setModel(const std::string& model) { model_ = model; }

    void setTemperature(double temperature) { temperature_ = temperature; }

private:
    std::string apiKey_;
    std::string baseUrl_;
    long timeoutSeconds_;
    std::string model_ = "mistral-medium-latest";
    double temperature_ = 0.2;
    HttpClient http_;

    // Pull the assistant message out of the response and parse it as JSON
    nlohmann::json parseContent(const std::string& response) const;
};

} // namespace later
