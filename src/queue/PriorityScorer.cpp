#include "queue/PriorityScorer.hpp"
#include <algorithm>
#include <cmath>

namespace later {

double PriorityScorer::priority(double daysSinceAdded, double expiryScore) {
    double days = std::isfinite(daysSinceAdded) ? std::max(0.0, daysSinceAdded) : 0.0;
    double expiry = std::isfinite(expiryScore) ? std::max(0.0, std::min(1.0, expiryScore)) : 0.0;
    double x = days * expiry / kBasePeriodDays - 0.5;
    return 1.0 / (1.0 + std::exp(-kSteepness * x));
}

double PriorityScorer::daysSince(Timestamp createdAt, Timestamp now) {
    constexpr double kMillisPerDay = 24.0 * 60.0 * 60.0 * 1000.0;
    return static_cast<double>(now - createdAt) / kMillisPerDay;
}

std::vector<PrioritizedItem> PriorityScorer::sortByPriority(const std::vector<Item>& items, Timestamp now) {
    std::vector<PrioritizedItem> ranked;
    ranked.reserve(items.size());
    for (const auto& item : items) {
        double p = priority(daysSince(item.createdAt, now), item.expiryScore.value_or(0.0));
        ranked.push_back({item, p});
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const PrioritizedItem& a, const PrioritizedItem& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.item.createdAt < b.item.createdAt;
    });
    return ranked;
}

} // namespace later
