#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace later {

enum class ClientStatus {
    Adding,
    Queued,
    Paused,
    Completed,
    Bookmark,
    Error,
};

// Ordered: each stage implies all earlier ones are done.
enum class ServerStatus {
    Saved = 0,
    Extracted = 1,
    Summarised = 2,
    Embedded = 3,
    Classified = 4,
};

const char* to_string(ClientStatus status);
const char* to_string(ServerStatus status);
ClientStatus clientStatusFromString(const std::string& value);
ServerStatus serverStatusFromString(const std::string& value);

// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

Timestamp nowMillis();

// One saved article.
struct Item {
    std::string id;
    std::string userId;
    std::string url;
    std::optional<std::string> canonicalUrl;
    std::optional<std::string> title;
    std::optional<std::string> sourceSite;
    std::optional<std::string> publicationDate;
    std::optional<std::string> faviconUrl;
    std::optional<std::string> contentMarkdown;
    std::optional<std::string> contentText;
    std::optional<int> tokenCount;
    ClientStatus clientStatus = ClientStatus::Adding;
    ServerStatus serverStatus = ServerStatus::Saved;
    std::optional<std::string> summary;
    std::optional<double> expiryScore;
    std::vector<float> embedding;          // empty until the embedded stage
    std::optional<std::string> errorMessage;
    Timestamp createdAt = 0;
    Timestamp clientStatusAt = 0;
    Timestamp serverStatusAt = 0;

    bool hasEmbedding() const { return !embedding.empty(); }

    // Public view, without content bodies or vectors.
    nlohmann::json to_json() const;
};

struct Chunk {
    std::string itemId;
    int position = 0;
    std::string text;
    int tokenCount = 0;
    std::vector<float> embedding;
};

// Partial update; unset fields are left untouched.
struct ItemUpdate {
    std::optional<std::string> canonicalUrl;
    std::optional<std::string> title;
    std::optional<std::string> sourceSite;
    std::optional<std::string> publicationDate;
    std::optional<std::string> faviconUrl;
    std::optional<std::string> contentMarkdown;
    std::optional<std::string> contentText;
    std::optional<int> tokenCount;
    std::optional<ClientStatus> clientStatus;
    std::optional<ServerStatus> serverStatus;
    std::optional<std::string> summary;
    std::optional<double> expiryScore;
    std::optional<std::string> errorMessage;
    bool clearError = false;

    bool empty() const;
};

} // namespace later
