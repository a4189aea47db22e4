#pragma once

#include "providers/HttpClient.hpp"
#include "providers/Providers.hpp"
#include <string>

namespace later {

// Downloads a page and reduces it to readable text plus a light markdown rendition.
class WebExtractor : public ContentExtractor {
public:
    explicit WebExtractor(long timeoutSeconds = 30);

    ArticleContent extract(const std::string& url, const CancelToken* cancel = nullptr) override;

    // Parse an already downloaded HTML document. `url` is the address it came from
    // and is used to resolve relative links. Throws ExtractionError on too little text.
    static ArticleContent parseHtml(const std::string& html, const std::string& url);

    // Minimum characters of text an article must have
    static constexpr size_t kMinTextLength = 10;

private:
    long timeoutSeconds_;
    HttpClient http_;
};

} // namespace later
