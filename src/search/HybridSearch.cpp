#include "search/HybridSearch.hpp"
#include "core/Errors.hpp"
#include "core/JsonUtils.hpp"
#include "embedding/VectorMath.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace later {

namespace {
    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    // Cuts at `limit` bytes without splitting a UTF-8 sequence.
    std::string truncateUtf8(const std::string& s, size_t limit) {
        if (s.size() <= limit) return s;
        size_t cut = limit;
        while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
        return s.substr(0, cut);
    }

    bool byScoreDesc(const SearchResult& a, const SearchResult& b) {
        return a.score.value_or(0.0) > b.score.value_or(0.0);
    }
}

SearchMode searchModeFromString(const std::string& value) {
    if (value == "lexical") return SearchMode::Lexical;
    else if (value == "semantic") return SearchMode::Semantic;
    else throw ValidationError("Unknown search mode: " + value);
}

SearchScope searchScopeFromString(const std::string& value) {
    if (value == "items") return SearchScope::Items;
    else if (value == "chunks") return SearchScope::Chunks;
    else throw ValidationError("Unknown search scope: " + value);
}

nlohmann::json SearchResult::to_json() const {
    nlohmann::json j;
    j["id"] = itemId;
    j["title"] = title;
    j["url"] = url;
    j["summary"] = summary ? nlohmann::json(*summary) : nlohmann::json(nullptr);
    j["score"] = finiteOrNull(score);
    j["distance"] = finiteOrNull(distance);
    j["preview"] = preview;
    j["position"] = position ? nlohmann::json(*position) : nlohmann::json(nullptr);
    return j;
}

HybridSearch::HybridSearch(ItemStore& store, EmbeddingProvider& embedder, Reranker* reranker,
                           const SearchConfig& config)
    : store_(store), embedder_(embedder), reranker_(reranker), config_(config) {}

bool HybridSearch::attachItem(const std::string& userId, SearchResult& result,
                              const std::optional<std::string>& fallbackPreview) {
    auto item = store_.getItem(userId, result.itemId);
    if (!item) {
        return false;
    }
    result.title = item->title.value_or("");
    result.url = item->canonicalUrl.value_or(item->url);
    result.summary = item->summary;
    if (result.preview.empty()) {
        if (fallbackPreview) {
            result.preview = *fallbackPreview;
        } else if (item->summary) {
            result.preview = *item->summary;
        } else if (item->contentText) {
            result.preview = truncateUtf8(*item->contentText, kPreviewLength);
        }
    }
    return true;
}

std::vector<SearchResult> HybridSearch::lexical(const SearchRequest& request, int limit) {
    std::vector<LexicalHit> hits;
    if (request.scope == SearchScope::Items) {
        hits = store_.lexicalSearchItems(request.userId, request.query, limit);
    } else {
        // Extra chunk hits so the roll-up still yields `limit` distinct items
        hits = store_.lexicalSearchChunks(request.userId, request.query, limit * 5);
    }

    std::vector<SearchResult> results;
    std::unordered_set<std::string> seen;
    for (const auto& hit : hits) {
        if (hit.score <= config_.lexicalThreshold) continue;
        if (!seen.insert(hit.itemId).second) continue;   // best chunk per item

        SearchResult result;
        result.itemId = hit.itemId;
        result.score = hit.score;
        result.position = hit.position;
        result.preview = truncateUtf8(hit.preview, kPreviewLength);
        if (!attachItem(request.userId, result)) continue;

        results.push_back(std::move(result));
        if (static_cast<int>(results.size()) >= limit) break;
    }
    return results;
}

std::vector<SearchResult> HybridSearch::semanticItems(const SearchRequest& request,
                                                      const std::vector<float>& queryVector,
                                                      int limit) {
    std::vector<std::pair<double, std::string>> scored;
    for (const auto& item : store_.getItemVectors(request.userId, ItemFilter{})) {
        double similarity = VectorMath::cosineSimilarity(queryVector, item.vector);
        if (similarity >= config_.semanticThreshold) {
            scored.emplace_back(similarity, item.id);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<SearchResult> results;
    for (const auto& [similarity, id] : scored) {
        SearchResult result;
        result.itemId = id;
        result.score = similarity;
        result.distance = 1.0 - similarity;
        if (!attachItem(request.userId, result)) continue;
        results.push_back(std::move(result));
        if (static_cast<int>(results.size()) >= limit) break;
    }
    return results;
}

std::vector<SearchResult> HybridSearch::semanticChunks(const SearchRequest& request,
                                                       const std::vector<float>& queryVector,
                                                       int limit) {
    // Best chunk per item
    std::unordered_map<std::string, std::pair<double, const ChunkRecord*>> best;
    std::vector<ChunkRecord> chunks = store_.getUserChunkVectors(request.userId);
    for (const auto& chunk : chunks) {
        double similarity = VectorMath::cosineSimilarity(queryVector, chunk.vector);
        if (similarity < config_.semanticThreshold) continue;
        auto it = best.find(chunk.itemId);
        if (it == best.end() || similarity > it->second.first) {
            best[chunk.itemId] = {similarity, &chunk};
        }
    }

    std::vector<std::pair<double, const ChunkRecord*>> ranked;
    ranked.reserve(best.size());
    for (const auto& entry : best) ranked.push_back(entry.second);
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        if (a.second->itemId != b.second->itemId) return a.second->itemId < b.second->itemId;
        return a.second->position < b.second->position;
    });

    std::vector<SearchResult> results;
    for (const auto& [similarity, chunk] : ranked) {
        SearchResult result;
        result.itemId = chunk->itemId;
        result.score = similarity;
        result.distance = 1.0 - similarity;
        result.position = chunk->position;
        result.preview = truncateUtf8(chunk->text, kPreviewLength);
        if (!attachItem(request.userId, result)) continue;
        results.push_back(std::move(result));
        if (static_cast<int>(results.size()) >= limit) break;
    }
    return results;
}

std::vector<SearchResult> HybridSearch::rerank(const std::string& query,
                                               std::vector<SearchResult> candidates,
                                               const CancelToken* cancel) {
    if (candidates.empty()) {
        return candidates;
    }

    std::vector<std::string> documents;
    documents.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        std::string text = candidate.title;
        if (candidate.summary && !candidate.summary->empty()) {
            text += "\n" + *candidate.summary;
        }
        if (!candidate.preview.empty() && candidate.preview != candidate.summary.value_or("")) {
            text += "\n" + candidate.preview;
        }
        documents.push_back(truncateUtf8(trim(text), kRerankTextLimit));
    }

    std::vector<double> scores = reranker_->rerank(query, documents, cancel);
    if (scores.size() != candidates.size()) {
        throw ProviderError("Reranker returned " + std::to_string(scores.size()) +
                            " scores for " + std::to_string(candidates.size()) + " candidates");
    }

    std::vector<SearchResult> kept;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (scores[i] >= config_.rerankThreshold) {
            candidates[i].score = scores[i];
            kept.push_back(std::move(candidates[i]));
        }
    }
    std::stable_sort(kept.begin(), kept.end(), byScoreDesc);
    return kept;
}

std::vector<SearchResult> HybridSearch::search(const SearchRequest& request, const CancelToken* cancel) {
    if (request.limit < 1 || request.limit > SearchRequest::kMaxLimit) {
        throw ValidationError("limit must be between 1 and 100");
    }

    SearchRequest normalized = request;
    normalized.query = trim(request.query);
    if (normalized.query.empty()) {
        return {};
    }
    const int limit = request.limit;

    if (normalized.mode == SearchMode::Lexical) {
        return lexical(normalized, limit);
    }

    const bool useRerank = request.rerank.value_or(config_.rerank) && reranker_ != nullptr;
    const int fetchLimit = useRerank ? limit * config_.fetchMultiplier : limit;

    std::vector<float> queryVector = embedder_.embed(normalized.query, cancel);

    std::vector<SearchResult> results = normalized.scope == SearchScope::Items
        ? semanticItems(normalized, queryVector, fetchLimit)
        : semanticChunks(normalized, queryVector, fetchLimit);

    if (useRerank) {
        results = rerank(normalized.query, std::move(results), cancel);
    }
    if (static_cast<int>(results.size()) > limit) {
        results.resize(static_cast<size_t>(limit));
    }

    if (config_.lexicalFallback && static_cast<int>(results.size()) < limit) {
        std::unordered_set<std::string> seen;
        for (const auto& result : results) seen.insert(result.itemId);

        for (auto& extra : lexical(normalized, limit)) {
            if (!seen.insert(extra.itemId).second) continue;
            results.push_back(std::move(extra));
            if (static_cast<int>(results.size()) >= limit) break;
        }
    }
    return results;
}

} // namespace later
