#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>
#include <Eigen/Dense>

namespace later {

class Clustering {
public:
    static constexpr int kUnclustered = -1;

    // Lloyd's k-means with k-means++ seeding; best inertia over `restarts` runs.
    // Empty clusters are dropped and the remaining ids compacted to 0..m-1.
    static std::vector<int> kmeans(const Eigen::MatrixXd& points, int k, std::uint64_t seed,
                                   int restarts = 10, int maxIterations = 300);

    // Average-linkage agglomerative clustering over a distance matrix, cut at k groups.
    // Equal linkage distances merge the pair with the lowest smaller member index first.
    static std::vector<int> hierarchical(const Eigen::MatrixXd& distances, int k);

    // Density clustering over a distance matrix; noise gets kUnclustered.
    static std::vector<int> dbscan(const Eigen::MatrixXd& distances, double eps, int minSamples);

    // 80th percentile of nearest-neighbour distances
    static double pickEps(const Eigen::MatrixXd& distances);

private:
    static std::unordered_map<int, std::vector<int>> buildAdjacencyList(
        const Eigen::MatrixXd& distances, double eps);

    // Grows one density-connected component from a core point
    static void expand(int seed,
                       const std::unordered_map<int, std::vector<int>>& adj,
                       const std::vector<bool>& core,
                       int clusterId,
                       std::vector<int>& labels);

    static double inertia(const Eigen::MatrixXd& points, const Eigen::MatrixXd& centers,
                          const std::vector<int>& labels);
};

} // namespace later
