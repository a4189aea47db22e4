#pragma once

#include "core/Config.hpp"
#include "core/ItemStore.hpp"
#include "providers/Providers.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace later {

enum class SearchMode { Lexical, Semantic };
enum class SearchScope { Items, Chunks };

SearchMode searchModeFromString(const std::string& value);
SearchScope searchScopeFromString(const std::string& value);

struct SearchRequest {
    std::string userId;
    std::string query;
    SearchMode mode = SearchMode::Semantic;
    SearchScope scope = SearchScope::Items;
    int limit = 10;
    std::optional<bool> rerank;   // unset = configured default

    static constexpr int kMaxLimit = 100;
};

struct SearchResult {
    std::string itemId;
    std::string title;
    std::string url;
    std::optional<std::string> summary;
    std::optional<double> score;      // higher is better
    std::optional<double> distance;   // 1 - cosine, semantic matches only
    std::string preview;
    std::optional<int> position;      // chunk the match came from

    nlohmann::json to_json() const;
};

// Lexical (FTS5) or semantic (cosine) retrieval over items or chunks, with optional
// cross-encoder reranking and lexical fill-up of a short semantic result.
class HybridSearch {
public:
    HybridSearch(ItemStore& store, EmbeddingProvider& embedder, Reranker* reranker,
                 const SearchConfig& config = {});

    // Embedding and reranker failures propagate.
    std::vector<SearchResult> search(const SearchRequest& request, const CancelToken* cancel = nullptr);

    static constexpr size_t kRerankTextLimit = 1000;
    static constexpr size_t kPreviewLength = 300;

private:
    ItemStore& store_;
    EmbeddingProvider& embedder_;
    Reranker* reranker_;
    SearchConfig config_;

    std::vector<SearchResult> lexical(const SearchRequest& request, int limit);
    std::vector<SearchResult> semanticItems(const SearchRequest& request,
                                            const std::vector<float>& queryVector, int limit);
    std::vector<SearchResult> semanticChunks(const SearchRequest& request,
                                             const std::vector<float>& queryVector, int limit);
    std::vector<SearchResult> rerank(const std::string& query, std::vector<SearchResult> candidates,
                                     const CancelToken* cancel);

    // Fills title, url and summary from the item row; false if the item is gone.
    bool attachItem(const std::string& userId, SearchResult& result,
                    const std::optional<std::string>& fallbackPreview = std::nullopt);
};

} // namespace later
