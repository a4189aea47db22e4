#include "embedding/Vectorizer.hpp"
#include "core/Errors.hpp"
#include "embedding/Tokenizer.hpp"
#include "embedding/VectorMath.hpp"
#include <algorithm>
#include <cmath>

namespace later {

Vectorizer::Vectorizer(EmbeddingProvider& provider, const VectorizerConfig& config, int batchSize)
    : provider_(provider), config_(config), batchSize_(std::max(1, batchSize)) {}

std::vector<Chunk> Vectorizer::splitChunks(const std::string& text, int chunkTokens,
                                           double overlapFraction) {
    if (chunkTokens < 1) {
        throw ValidationError("Chunk size must be at least one token");
    }
    if (!(overlapFraction >= 0.0 && overlapFraction <= 0.5)) {
        throw ValidationError("Chunk overlap must be between 0 and 0.5");
    }

    std::vector<TokenSpan> spans = Tokenizer::tokenize(text);
    std::vector<Chunk> chunks;
    if (spans.empty()) {
        return chunks;
    }

    const size_t window = static_cast<size_t>(chunkTokens);
    const size_t overlap = static_cast<size_t>(std::floor(chunkTokens * overlapFraction));
    const size_t stride = std::max<size_t>(1, window - overlap);

    for (size_t start = 0;; start += stride) {
        size_t end = std::min(start + window, spans.size());
        Chunk chunk;
        chunk.position = static_cast<int>(chunks.size());
        size_t byteBegin = spans[start].begin;
        size_t byteEnd = spans[end - 1].end;
        chunk.text = text.substr(byteBegin, byteEnd - byteBegin);
        chunk.tokenCount = static_cast<int>(end - start);
        chunks.push_back(std::move(chunk));
        if (end == spans.size()) {
            break;
        }
    }
    return chunks;
}

VectorizedText Vectorizer::vectorize(const std::string& text, int maxInputTokens,
                                     const CancelToken* cancel) const {
    if (maxInputTokens < 1) {
        throw ValidationError("maxInputTokens must be positive");
    }

    VectorizedText result;
    result.tokenCount = Tokenizer::countTokens(text);
    if (result.tokenCount == 0) {
        throw ValidationError("Cannot vectorize empty text");
    }

    int chunkTokens = std::min(config_.chunkTokens, maxInputTokens);
    result.chunks = splitChunks(text, chunkTokens, config_.overlapFraction);

    std::vector<std::string> texts;
    texts.reserve(result.chunks.size());
    for (const auto& chunk : result.chunks) {
        texts.push_back(chunk.text);
    }

    for (size_t offset = 0; offset < texts.size(); offset += static_cast<size_t>(batchSize_)) {
        size_t end = std::min(texts.size(), offset + static_cast<size_t>(batchSize_));
        std::vector<std::string> batch(texts.begin() + offset, texts.begin() + end);
        auto vectors = provider_.embedBatch(batch, cancel);
        if (vectors.size() != batch.size()) {
            throw ProviderError("Embedding provider returned " + std::to_string(vectors.size()) +
                                " vectors for " + std::to_string(batch.size()) + " chunks");
        }
        for (size_t i = 0; i < vectors.size(); ++i) {
            result.chunks[offset + i].embedding = std::move(vectors[i]);
        }
    }

    if (result.tokenCount <= maxInputTokens) {
        result.fullEmbedding = provider_.embed(text, cancel);
    } else {
        std::vector<std::vector<float>> chunkVectors;
        chunkVectors.reserve(result.chunks.size());
        for (const auto& chunk : result.chunks) {
            chunkVectors.push_back(chunk.embedding);
        }
        result.fullEmbedding = VectorMath::mean(chunkVectors);
        result.pooled = true;
    }

    if (result.fullEmbedding.empty()) {
        throw ProviderError("Embedding provider returned an empty vector");
    }
    return result;
}

} // namespace later
