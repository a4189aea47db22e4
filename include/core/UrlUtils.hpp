#pragma once

#include <optional>
#include <string>

namespace later {

struct ParsedUrl {
    std::string scheme;   // lowercase
    std::string host;     // lowercase, without port
    std::string port;     // empty when absent
    std::string path;     // starts with '/' or is empty
    std::string query;    // without '?'
    std::string fragment; // without '#'
};

std::optional<ParsedUrl> parseUrl(const std::string& url);

// Trims, adds https:// when no scheme is given and checks the host.
// Throws ValidationError for anything that is not a usable http(s) URL.
std::string prepareUrl(const std::string& rawUrl);

// Dedup key: lowercase scheme and host, default port, fragment, utm_* parameters
// and a trailing slash removed.
std::string canonicalizeUrl(const std::string& url);

// Resolves a possibly relative href against a base URL. Empty if unusable.
std::string resolveUrl(const std::string& base, const std::string& href);

std::string faviconUrl(const std::string& url);

std::string hostOf(const std::string& url);

} // namespace later
