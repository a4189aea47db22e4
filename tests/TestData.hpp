#pragma once

#include <random>
#include <string>
#include <vector>
#include "core/ItemStore.hpp"

namespace later {
namespace testing {

// `groups` tight bundles of `perGroup` vectors, bundle g pointing along axis g.
inline std::vector<ItemVector> separatedGroups(int groups, int perGroup, int dim, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, 0.02f);
    std::vector<ItemVector> items;
    for (int g = 0; g < groups; ++g) {
        for (int i = 0; i < perGroup; ++i) {
            ItemVector item;
            item.id = "g" + std::to_string(g) + "-" + std::to_string(i);
            item.vector.assign(static_cast<size_t>(dim), 0.0f);
            for (auto& x : item.vector) x = noise(rng);
            item.vector[static_cast<size_t>(g)] += 1.0f;
            items.push_back(std::move(item));
        }
    }
    return items;
}

} // namespace testing
} // namespace later
