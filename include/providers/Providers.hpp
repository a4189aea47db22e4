#pragma once

#include "providers/CancelToken.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace later {

struct ArticleContent {
    std::string url;
    std::optional<std::string> canonicalUrl;
    std::optional<std::string> title;
    std::optional<std::string> sourceSite;
    std::optional<std::string> publicationDate;
    std::optional<std::string> faviconUrl;
    std::string markdown;
    std::string text;
};

// Given a URL, returns the article. Throws ExtractionError when there is nothing to read.
class ContentExtractor {
public:
    virtual ~ContentExtractor() = default;
    virtual ArticleContent extract(const std::string& url, const CancelToken* cancel = nullptr) = 0;
};

// Structured LLM completion: the response is a JSON object matching `schema`.
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;
    virtual nlohmann::json complete(const std::string& systemPrompt,
                                    const std::string& userContent,
                                    const nlohmann::json& schema,
                                    const CancelToken* cancel = nullptr) = 0;
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<float> embed(const std::string& text, const CancelToken* cancel = nullptr) = 0;

    // One vector per input, same order.
    virtual std::vector<std::vector<float>> embedBatch(const std::vector<std::string>& texts,
                                                       const CancelToken* cancel = nullptr) {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            out.push_back(embed(text, cancel));
        }
        return out;
    }
};

// Cross-encoder: one relevance score per candidate, same order, higher is better.
class Reranker {
public:
    virtual ~Reranker() = default;
    virtual std::vector<double> rerank(const std::string& query,
                                       const std::vector<std::string>& candidates,
                                       const CancelToken* cancel = nullptr) = 0;
};

} // namespace later
