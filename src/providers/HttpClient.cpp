#include "providers/HttpClient.hpp"
#include "core/Errors.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace later {

namespace {
    struct WriteTarget {
        std::string* body;
        size_t limit;
    };

    size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t totalSize = size * nmemb;
        auto* target = static_cast<WriteTarget*>(userp);
        if (target->body->size() + totalSize > target->limit) {
            return 0;   // makes curl fail with CURLE_WRITE_ERROR
        }
        target->body->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* cancel = static_cast<const CancelToken*>(clientp);
        return (cancel && cancel->cancelled()) ? 1 : 0;
    }

    bool isTransientCurlError(CURLcode code) {
        switch (code) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
                return true;
            default:
                return false;
        }
    }

    std::once_flag curlInitFlag;
}

HttpClient::HttpClient() {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse HttpClient::perform(const std::string& url, const std::string* body,
                                 const std::vector<std::string>& headers,
                                 long timeoutSeconds, const CancelToken* cancel) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw ProviderError("Failed to initialize CURL");
    }

    HttpResponse response;
    WriteTarget target{&response.body, maxBodyBytes_};

    struct curl_slist* headerList = nullptr;
    for (const auto& header : headers) {
        headerList = curl_slist_append(headerList, header.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerGuard(headerList, curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &target);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<CancelToken*>(cancel));

    CURLcode res = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* contentType = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType) {
        response.contentType = contentType;
    }
    char* effective = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effectiveUrl = effective;
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw ProviderTimeoutError("Request to " + url + " timed out after " +
                                   std::to_string(timeoutSeconds) + "s");
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw ProviderError("Request to " + url + " cancelled");
    }
    if (res != CURLE_OK) {
        throw ProviderError(std::string("CURL error: ") + curl_easy_strerror(res), 0,
                            isTransientCurlError(res));
    }
    return response;
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers,
                              long timeoutSeconds, const CancelToken* cancel) const {
    return perform(url, &body, headers, timeoutSeconds, cancel);
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers,
                             long timeoutSeconds, const CancelToken* cancel) const {
    return perform(url, nullptr, headers, timeoutSeconds, cancel);
}

void HttpClient::checkStatus(const HttpResponse& response, const std::string& what) {
    if (response.status >= 200 && response.status < 300) {
        return;
    }
    bool transient = response.status == 408 || response.status == 429 || response.status >= 500;
    std::string detail = response.body.substr(0, 300);
    throw ProviderError(what + " failed with HTTP " + std::to_string(response.status) +
                        (detail.empty() ? "" : ": " + detail),
                        response.status, transient);
}

} // namespace later
