#include "core/Item.hpp"
#include "core/Errors.hpp"
#include <chrono>

namespace later {

const char* to_string(ClientStatus status) {
    switch (status) {
        case ClientStatus::Adding: return "adding";
        case ClientStatus::Queued: return "queued";
        case ClientStatus::Paused: return "paused";
        case ClientStatus::Completed: return "completed";
        case ClientStatus::Bookmark: return "bookmark";
        case ClientStatus::Error: return "error";
    }
    return "error";
}

const char* to_string(ServerStatus status) {
    switch (status) {
        case ServerStatus::Saved: return "saved";
        case ServerStatus::Extracted: return "extracted";
        case ServerStatus::Summarised: return "summarised";
        case ServerStatus::Embedded: return "embedded";
        case ServerStatus::Classified: return "classified";
    }
    return "saved";
}

ClientStatus clientStatusFromString(const std::string& value) {
    if (value == "adding") return ClientStatus::Adding;
    else if (value == "queued") return ClientStatus::Queued;
    else if (value == "paused") return ClientStatus::Paused;
    else if (value == "completed") return ClientStatus::Completed;
    else if (value == "bookmark") return ClientStatus::Bookmark;
    else if (value == "error") return ClientStatus::Error;
    else throw ValidationError("Invalid client status: " + value);
}

ServerStatus serverStatusFromString(const std::string& value) {
    if (value == "saved") return ServerStatus::Saved;
    else if (value == "extracted") return ServerStatus::Extracted;
    else if (value == "summarised") return ServerStatus::Summarised;
    else if (value == "embedded") return ServerStatus::Embedded;
    else if (value == "classified") return ServerStatus::Classified;
    else throw ValidationError("Invalid server status: " + value);
}

Timestamp nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace {
    template <typename T>
    nlohmann::json optionalToJson(const std::optional<T>& value) {
        if (!value) return nullptr;
        return *value;
    }
}

nlohmann::json Item::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["url"] = url;
    j["canonical_url"] = optionalToJson(canonicalUrl);
    j["title"] = optionalToJson(title);
    j["source_site"] = optionalToJson(sourceSite);
    j["publication_date"] = optionalToJson(publicationDate);
    j["favicon_url"] = optionalToJson(faviconUrl);
    j["content_token_count"] = optionalToJson(tokenCount);
    j["client_status"] = to_string(clientStatus);
    j["server_status"] = to_string(serverStatus);
    j["summary"] = optionalToJson(summary);
    j["expiry_score"] = optionalToJson(expiryScore);
    j["error"] = optionalToJson(errorMessage);
    j["has_embedding"] = hasEmbedding();
    j["created_at"] = createdAt;
    j["client_status_at"] = clientStatusAt;
    j["server_status_at"] = serverStatusAt;
    return j;
}

bool ItemUpdate::empty() const {
    return !canonicalUrl && !title && !sourceSite && !publicationDate && !faviconUrl &&
           !contentMarkdown && !contentText && !tokenCount && !clientStatus &&
           !serverStatus && !summary && !expiryScore && !errorMessage && !clearError;
}

} // namespace later
