#include "embedding/VectorMath.hpp"
#include "core/Errors.hpp"
#include <cmath>

namespace later {

float VectorMath::cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }

    // Accumulate in double; 1024-dim float sums drift noticeably otherwise.
    double dotProduct = 0.0;
    double normA = 0.0;
    double normB = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dotProduct += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }

    if (normA == 0.0 || normB == 0.0) {
        return 0.0f;
    }

    return static_cast<float>(dotProduct / (std::sqrt(normA) * std::sqrt(normB)));
}

std::vector<float> VectorMath::l2Normalize(const std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    if (norm == 0.0) return v;
    norm = std::sqrt(norm);

    std::vector<float> out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = static_cast<float>(v[i] / norm);
    }
    return out;
}

std::vector<float> VectorMath::mean(const std::vector<std::vector<float>>& vectors) {
    if (vectors.empty()) {
        return {};
    }
    const size_t dim = vectors.front().size();
    std::vector<double> sum(dim, 0.0);
    for (const auto& v : vectors) {
        if (v.size() != dim) {
            throw ValidationError("Cannot average vectors of different dimensionality");
        }
        for (size_t i = 0; i < dim; ++i) sum[i] += v[i];
    }

    std::vector<float> out(dim);
    for (size_t i = 0; i < dim; ++i) {
        out[i] = static_cast<float>(sum[i] / static_cast<double>(vectors.size()));
    }
    return out;
}

} // namespace later
