#include "core/UrlUtils.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace later {

namespace {
    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(const std::string& s) {
        size_t a = 0, b = s.size();
        while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }

    bool isIpv4(const std::string& host) {
        int parts = 0;
        size_t start = 0;
        while (start <= host.size()) {
            size_t dot = host.find('.', start);
            std::string part = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (part.empty() || part.size() > 3 ||
                !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return false;
            }
            ++parts;
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        return parts == 4;
    }

    // Letters, digits and inner hyphens per label; at most 63 chars per label.
    bool isValidDomain(const std::string& host) {
        if (host.empty()) return false;
        size_t start = 0;
        while (true) {
            size_t dot = host.find('.', start);
            std::string label = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (label.empty() || label.size() > 63) return false;
            if (label.front() == '-' || label.back() == '-') return false;
            for (char c : label) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
            }
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        return true;
    }

    std::string defaultPort(const std::string& scheme) {
        if (scheme == "http") return "80";
        if (scheme == "https") return "443";
        return "";
    }

    std::string stripTrackingParams(const std::string& query) {
        std::vector<std::string> kept;
        std::stringstream ss(query);
        std::string param;
        while (std::getline(ss, param, '&')) {
            if (param.empty()) continue;
            std::string key = toLower(param.substr(0, param.find('=')));
            if (key.rfind("utm_", 0) == 0) continue;
            kept.push_back(param);
        }
        std::string out;
        for (size_t i = 0; i < kept.size(); ++i) {
            if (i > 0) out += '&';
            out += kept[i];
        }
        return out;
    }

    std::string joinUrl(const ParsedUrl& u) {
        std::string out = u.scheme + "://" + u.host;
        if (!u.port.empty()) out += ":" + u.port;
        out += u.path;
        if (!u.query.empty()) out += "?" + u.query;
        if (!u.fragment.empty()) out += "#" + u.fragment;
        return out;
    }
}

std::optional<ParsedUrl> parseUrl(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart,
        authorityEnd == std::string::npos ? std::string::npos : authorityEnd - authorityStart);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (!std::all_of(parsed.port.begin(), parsed.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
    }
    parsed.host = toLower(authority);
    if (parsed.host.empty()) {
        return std::nullopt;
    }

    if (authorityEnd == std::string::npos) {
        return parsed;
    }

    std::string rest = url.substr(authorityEnd);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        parsed.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    size_t qm = rest.find('?');
    if (qm != std::string::npos) {
        parsed.query = rest.substr(qm + 1);
        rest = rest.substr(0, qm);
    }
    parsed.path = rest;
    return parsed;
}

std::string prepareUrl(const std::string& rawUrl) {
    std::string candidate = trim(rawUrl);
    if (candidate.empty()) {
        throw ValidationError("URL is required");
    }

    std::string lower = toLower(candidate);
    if (lower.rfind("http://", 0) != 0 && lower.rfind("https://", 0) != 0) {
        if (candidate.find("://") != std::string::npos) {
            throw ValidationError("Please enter a valid URL");
        }
        candidate = "https://" + candidate;
    }

    auto parsed = parseUrl(candidate);
    if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
        throw ValidationError("Please enter a valid URL");
    }

    const std::string& host = parsed->host;
    if (host == "localhost" || isIpv4(host)) {
        return candidate;
    }
    if (!isValidDomain(host) || host.find('.') == std::string::npos) {
        throw ValidationError("Please enter a valid URL with a proper domain");
    }
    return candidate;
}

std::string canonicalizeUrl(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        return url;
    }
    if (parsed->port == defaultPort(parsed->scheme)) {
        parsed->port.clear();
    }
    parsed->fragment.clear();
    parsed->query = stripTrackingParams(parsed->query);
    while (parsed->path.size() > 1 && parsed->path.back() == '/') {
        parsed->path.pop_back();
    }
    if (parsed->path == "/") {
        parsed->path.clear();
    }
    return joinUrl(*parsed);
}

std::string resolveUrl(const std::string& base, const std::string& href) {
    std::string h = trim(href);
    if (h.empty()) return {};

    auto absolute = parseUrl(h);
    if (absolute) {
        if (absolute->scheme == "http" || absolute->scheme == "https") return h;
        return {};
    }

    auto b = parseUrl(base);
    if (!b) return {};

    if (h.rfind("//", 0) == 0) {
        return b->scheme + ":" + h;
    }

    ParsedUrl out = *b;
    out.query.clear();
    out.fragment.clear();
    if (h.front() == '/') {
        out.path = h;
    } else {
        std::string dir = b->path.substr(0, b->path.rfind('/') + 1);
        if (dir.empty()) dir = "/";
        out.path = dir + h;
    }
    std::string joined = joinUrl(out);
    return joined;
}

std::string faviconUrl(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed) return {};
    std::string out = parsed->scheme + "://" + parsed->host;
    if (!parsed->port.empty()) out += ":" + parsed->port;
    return out + "/favicon.ico";
}

std::string hostOf(const std::string& url) {
    auto parsed = parseUrl(url);
    return parsed ? parsed->host : std::string();
}

} // namespace later
