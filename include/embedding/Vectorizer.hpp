#pragma once

#include "core/Config.hpp"
#include "core/Item.hpp"
#include "providers/Providers.hpp"
#include <string>
#include <vector>

namespace later {

struct VectorizedText {
    std::vector<float> fullEmbedding;
    std::vector<Chunk> chunks;     // itemId left empty; positions contiguous from 0
    int tokenCount = 0;
    bool pooled = false;           // fullEmbedding is the mean of chunk vectors
};

// Turns a document into one full embedding plus overlapping chunk embeddings.
class Vectorizer {
public:
    Vectorizer(EmbeddingProvider& provider, const VectorizerConfig& config = {}, int batchSize = 16);

    // Provider errors propagate unchanged; no retries here.
    VectorizedText vectorize(const std::string& text, int maxInputTokens,
                             const CancelToken* cancel = nullptr) const;

    // Word windows of `chunkTokens` words advancing by chunkTokens minus the overlap.
    // The last window always ends on the last word. Embeddings are left empty.
    static std::vector<Chunk> splitChunks(const std::string& text, int chunkTokens,
                                          double overlapFraction);

private:
    EmbeddingProvider& provider_;
    VectorizerConfig config_;
    int batchSize_;
};

} // namespace later
