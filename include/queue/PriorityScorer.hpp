#pragma once

#include "core/Item.hpp"
#include <vector>

namespace later {

struct PrioritizedItem {
    Item item;
    double priority = 0.0;
};

// Reading-queue order: logistic in age scaled by how fast the item goes stale.
class PriorityScorer {
public:
    static constexpr double kSteepness = 5.0;
    static constexpr double kBasePeriodDays = 3.0;

    // 1 / (1 + exp(-k * (days * expiry / basePeriod - 0.5))). Negative days count as 0,
    // expiry is clamped to [0, 1].
    static double priority(double daysSinceAdded, double expiryScore);

    static double daysSince(Timestamp createdAt, Timestamp now);

    // Highest priority first; ties go to the older item. Items without an expiry
    // score are treated as evergreen (0).
    static std::vector<PrioritizedItem> sortByPriority(const std::vector<Item>& items, Timestamp now);
};

} // namespace later
