#include "providers/CompletionClient.hpp"
#include "core/Errors.hpp"
#include <iostream>

namespace later {

namespace {
    // Some models wrap JSON in a markdown fence even in json mode.
    std::string stripCodeFence(const std::string& content) {
        size_t start = content.find('{');
        size_t end = content.rfind('}');
        if (start == std::string::npos || end == std::string::npos || end <= start) {
            return content;
        }
        return content.substr(start, end - start + 1);
    }
}

CompletionClient::CompletionClient(const std::string& apiKey, const std::string& baseUrl,
                                   long timeoutSeconds)
    : apiKey_(apiKey), baseUrl_(baseUrl), timeoutSeconds_(timeoutSeconds) {}

nlohmann::json CompletionClient::parseContent(const std::string& response) const {
    nlohmann::json jsonResponse;
    try {
        jsonResponse = nlohmann::json::parse(response);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProviderError(std::string("Completion response is not JSON: ") + e.what());
    }

    if (jsonResponse.contains("error")) {
        throw ProviderError("Completion API error: " + jsonResponse["error"].dump());
    }

    if (!jsonResponse.contains("choices") || !jsonResponse["choices"].is_array() ||
        jsonResponse["choices"].empty()) {
        throw ProviderError("Completion response has no choices");
    }
    const auto& choice = jsonResponse["choices"][0];
    if (!choice.contains("message") || !choice["message"].contains("content") ||
        !choice["message"]["content"].is_string()) {
        throw ProviderError("Completion response has no message content");
    }

    std::string content = choice["message"]["content"].get<std::string>();
    try {
        nlohmann::json parsed = nlohmann::json::parse(stripCodeFence(content));
        if (!parsed.is_object()) {
            throw ValidationError("Completion output is not a JSON object");
        }
        return parsed;
    } catch (const nlohmann::json::parse_error&) {
        std::cerr << "[completion] unparseable output: " << content.substr(0, 200) << std::endl;
        throw ValidationError("Completion output is not valid JSON");
    }
}

nlohmann::json CompletionClient::complete(const std::string& systemPrompt,
                                          const std::string& userContent,
                                          const nlohmann::json& schema,
                                          const CancelToken* cancel) {
    nlohmann::json requestBody = {
        {"model", model_},
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", systemPrompt}},
            {{"role", "user"}, {"content", userContent}}
        })},
        {"temperature", temperature_},
        {"response_format", {
            {"type", "json_schema"},
            {"json_schema", {
                {"name", schema.value("title", std::string("response"))},
                {"schema", schema},
                {"strict", true}
            }}
        }}
    };

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + apiKey_
    };

    HttpResponse response = http_.post(baseUrl_ + "/v1/chat/completions", requestBody.dump(),
                                       headers, timeoutSeconds_, cancel);
    HttpClient::checkStatus(response, "Completion request");
    return parseContent(response.body);
}

} // namespace later
