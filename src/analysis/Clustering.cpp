#include "analysis/Clustering.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <deque>
#include <limits>
#include <map>
#include <random>

namespace later {

namespace {
    // k-means++: each new center is drawn with probability proportional to the
    // squared distance to the closest center chosen so far.
    Eigen::MatrixXd seedCenters(const Eigen::MatrixXd& points, int k, std::mt19937_64& rng) {
        const Eigen::Index n = points.rows();
        Eigen::MatrixXd centers(k, points.cols());
        std::uniform_int_distribution<Eigen::Index> first(0, n - 1);
        centers.row(0) = points.row(first(rng));

        std::vector<double> closest(static_cast<size_t>(n));
        for (Eigen::Index i = 0; i < n; ++i) {
            closest[i] = (points.row(i) - centers.row(0)).squaredNorm();
        }

        for (int c = 1; c < k; ++c) {
            double total = 0.0;
            for (double d : closest) total += d;

            Eigen::Index chosen = 0;
            if (total <= 0.0) {
                chosen = first(rng);
            } else {
                std::uniform_real_distribution<double> draw(0.0, total);
                double target = draw(rng);
                double running = 0.0;
                chosen = n - 1;
                for (Eigen::Index i = 0; i < n; ++i) {
                    running += closest[i];
                    if (running >= target && closest[i] > 0.0) {
                        chosen = i;
                        break;
                    }
                }
            }
            centers.row(c) = points.row(chosen);
            for (Eigen::Index i = 0; i < n; ++i) {
                closest[i] = std::min(closest[i], (points.row(i) - centers.row(c)).squaredNorm());
            }
        }
        return centers;
    }

    std::vector<int> compactIds(const std::vector<int>& labels) {
        std::map<int, int> remap;
        for (int label : labels) {
            if (label >= 0) remap.emplace(label, 0);
        }
        int next = 0;
        for (auto& entry : remap) entry.second = next++;

        std::vector<int> out(labels.size());
        for (size_t i = 0; i < labels.size(); ++i) {
            out[i] = labels[i] >= 0 ? remap[labels[i]] : labels[i];
        }
        return out;
    }
}

double Clustering::inertia(const Eigen::MatrixXd& points, const Eigen::MatrixXd& centers,
                           const std::vector<int>& labels) {
    double sum = 0.0;
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        sum += (points.row(i) - centers.row(labels[i])).squaredNorm();
    }
    return sum;
}

std::vector<int> Clustering::kmeans(const Eigen::MatrixXd& points, int k, std::uint64_t seed,
                                    int restarts, int maxIterations) {
    const Eigen::Index n = points.rows();
    if (k < 1 || k > n) {
        throw InsufficientDataError("k-means needs at least k points");
    }

    std::mt19937_64 rng(seed);
    std::vector<int> best;
    double bestInertia = std::numeric_limits<double>::infinity();

    for (int run = 0; run < std::max(1, restarts); ++run) {
        Eigen::MatrixXd centers = seedCenters(points, k, rng);
        std::vector<int> labels(static_cast<size_t>(n), -1);

        for (int iter = 0; iter < maxIterations; ++iter) {
            bool changed = false;
            for (Eigen::Index i = 0; i < n; ++i) {
                int nearest = 0;
                double nearestDist = std::numeric_limits<double>::infinity();
                for (int c = 0; c < k; ++c) {
                    double d = (points.row(i) - centers.row(c)).squaredNorm();
                    if (d < nearestDist) {
                        nearestDist = d;
                        nearest = c;
                    }
                }
                if (labels[i] != nearest) {
                    labels[i] = nearest;
                    changed = true;
                }
            }
            if (!changed) break;

            Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(k, points.cols());
            std::vector<int> counts(static_cast<size_t>(k), 0);
            for (Eigen::Index i = 0; i < n; ++i) {
                sums.row(labels[i]) += points.row(i);
                ++counts[labels[i]];
            }
            // An emptied cluster keeps its previous center
            for (int c = 0; c < k; ++c) {
                if (counts[c] > 0) centers.row(c) = sums.row(c) / counts[c];
            }
        }

        double runInertia = inertia(points, centers, labels);
        if (runInertia < bestInertia) {
            bestInertia = runInertia;
            best = labels;
        }
    }
    return compactIds(best);
}

std::vector<int> Clustering::hierarchical(const Eigen::MatrixXd& distances, int k) {
    const int n = static_cast<int>(distances.rows());
    if (k < 1 || k > n) {
        throw InsufficientDataError("Hierarchical clustering needs at least k points");
    }

    // Each cluster lives in the slot of its smallest member index, so scanning
    // slots in ascending order gives the lowest-index pair among equal distances.
    Eigen::MatrixXd linkage = distances;
    std::vector<std::vector<int>> members(static_cast<size_t>(n));
    std::vector<bool> active(static_cast<size_t>(n), true);
    for (int i = 0; i < n; ++i) members[i] = {i};

    for (int remaining = n; remaining > k; --remaining) {
        int bestA = -1;
        int bestB = -1;
        double bestDist = std::numeric_limits<double>::infinity();
        for (int a = 0; a < n; ++a) {
            if (!active[a]) continue;
            for (int b = a + 1; b < n; ++b) {
                if (!active[b]) continue;
                if (linkage(a, b) < bestDist) {
                    bestDist = linkage(a, b);
                    bestA = a;
                    bestB = b;
                }
            }
        }

        // Average linkage update (Lance-Williams)
        const double sizeA = static_cast<double>(members[bestA].size());
        const double sizeB = static_cast<double>(members[bestB].size());
        for (int o = 0; o < n; ++o) {
            if (!active[o] || o == bestA || o == bestB) continue;
            double d = (sizeA * linkage(bestA, o) + sizeB * linkage(bestB, o)) / (sizeA + sizeB);
            linkage(bestA, o) = d;
            linkage(o, bestA) = d;
        }
        members[bestA].insert(members[bestA].end(), members[bestB].begin(), members[bestB].end());
        members[bestB].clear();
        active[bestB] = false;
    }

    std::vector<int> labels(static_cast<size_t>(n), Clustering::kUnclustered);
    int clusterId = 0;
    for (int slot = 0; slot < n; ++slot) {
        if (!active[slot]) continue;
        for (int member : members[slot]) labels[member] = clusterId;
        ++clusterId;
    }
    return labels;
}

std::unordered_map<int, std::vector<int>> Clustering::buildAdjacencyList(
    const Eigen::MatrixXd& distances, double eps) {
    std::unordered_map<int, std::vector<int>> adj;
    const int n = static_cast<int>(distances.rows());
    for (int i = 0; i < n; ++i) {
        adj[i];
        for (int j = i + 1; j < n; ++j) {
            if (distances(i, j) <= eps) {
                adj[i].push_back(j);
                adj[j].push_back(i);
            }
        }
    }
    return adj;
}

void Clustering::expand(int seed,
                        const std::unordered_map<int, std::vector<int>>& adj,
                        const std::vector<bool>& core,
                        int clusterId,
                        std::vector<int>& labels) {
    std::deque<int> frontier{seed};
    labels[seed] = clusterId;

    while (!frontier.empty()) {
        int node = frontier.front();
        frontier.pop_front();
        if (!core[node]) continue;   // border points do not extend the cluster

        auto it = adj.find(node);
        if (it == adj.end()) continue;
        for (int neighbor : it->second) {
            if (labels[neighbor] == kUnclustered) {
                labels[neighbor] = clusterId;
                frontier.push_back(neighbor);
            }
        }
    }
}

std::vector<int> Clustering::dbscan(const Eigen::MatrixXd& distances, double eps, int minSamples) {
    const int n = static_cast<int>(distances.rows());
    auto adj = buildAdjacencyList(distances, eps);

    // A point counts itself towards min_samples
    std::vector<bool> core(static_cast<size_t>(n), false);
    for (int i = 0; i < n; ++i) {
        core[i] = static_cast<int>(adj[i].size()) + 1 >= minSamples;
    }

    std::vector<int> labels(static_cast<size_t>(n), kUnclustered);
    int clusterId = 0;
    for (int i = 0; i < n; ++i) {
        if (core[i] && labels[i] == kUnclustered) {
            expand(i, adj, core, clusterId, labels);
            ++clusterId;
        }
    }
    return labels;
}

double Clustering::pickEps(const Eigen::MatrixXd& distances) {
    const Eigen::Index n = distances.rows();
    if (n < 2) {
        return 0.0;
    }

    std::vector<double> nearest;
    nearest.reserve(static_cast<size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i) {
        double d = std::numeric_limits<double>::infinity();
        for (Eigen::Index j = 0; j < n; ++j) {
            if (j != i) d = std::min(d, distances(i, j));
        }
        nearest.push_back(d);
    }
    std::sort(nearest.begin(), nearest.end());

    // Linear interpolation between closest ranks
    double rank = 0.8 * static_cast<double>(nearest.size() - 1);
    size_t lower = static_cast<size_t>(rank);
    size_t upper = std::min(lower + 1, nearest.size() - 1);
    double fraction = rank - static_cast<double>(lower);
    return nearest[lower] + fraction * (nearest[upper] - nearest[lower]);
}

} // namespace later
