#pragma once

#include <vector>

namespace later {

class VectorMath {
public:
    // Cosine similarity between two vectors; 0 for empty, mismatched or zero vectors
    static float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

    // 1 - cosine
    static float cosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
        return 1.0f - cosineSimilarity(a, b);
    }

    // Unit-length copy; zero vectors come back unchanged
    static std::vector<float> l2Normalize(const std::vector<float>& v);

    // Component-wise arithmetic mean. All vectors must share one dimension.
    static std::vector<float> mean(const std::vector<std::vector<float>>& vectors);
};

} // namespace later
