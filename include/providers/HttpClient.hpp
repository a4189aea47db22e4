#pragma once

#include "providers/CancelToken.hpp"
#include <string>
#include <vector>

namespace later {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string contentType;
    std::string effectiveUrl;   // after redirects
};

// Thin libcurl wrapper shared by every provider client.
class HttpClient {
public:
    HttpClient();

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers,
                      long timeoutSeconds, const CancelToken* cancel = nullptr) const;

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers,
                     long timeoutSeconds, const CancelToken* cancel = nullptr) const;

    // Throws ProviderError for non-2xx responses; 408, 429 and 5xx are transient.
    static void checkStatus(const HttpResponse& response, const std::string& what);

    void setUserAgent(const std::string& agent) { userAgent_ = agent; }
    void setMaxBodyBytes(size_t bytes) { maxBodyBytes_ = bytes; }

private:
    std::string userAgent_ = "later/1.0";
    size_t maxBodyBytes_ = 16 * 1024 * 1024;

    HttpResponse perform(const std::string& url, const std::string* body,
                         const std::vector<std::string>& headers,
                         long timeoutSeconds, const CancelToken* cancel) const;
};

} // namespace later
