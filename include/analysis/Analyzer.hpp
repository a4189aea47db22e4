#pragma once

#include "core/ItemStore.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace later {

enum class ProjectionMethod { PCA, TSNE, UMAP };
enum class ClusteringMethod { KMeans, Hierarchical, DBSCAN };

const char* to_string(ProjectionMethod method);
const char* to_string(ClusteringMethod method);
ProjectionMethod projectionFromString(const std::string& value);
ClusteringMethod clusteringFromString(const std::string& value);

struct AnalysisParams {
    std::optional<int> k;                 // k-means / hierarchical, [2, 24]; default min(5, n)
    std::optional<double> eps;            // DBSCAN, [0.01, 1.0]; default picked from the data
    std::optional<int> minSamples;        // DBSCAN; default min(3, n)
    std::optional<int> dimRed;            // DBSCAN; PCA to this many dimensions first
    std::optional<double> perplexity;     // t-SNE
    std::optional<int> nNeighbors;        // UMAP
    double minDist = 0.1;                 // UMAP
    std::uint64_t seed = 42;

    static constexpr int kMinClusters = 2;
    static constexpr int kMaxClusters = 24;
};

struct PointCoordinate {
    std::string id;
    double x = 0.0;
    double y = 0.0;
};

struct ClusterAssignment {
    std::string id;
    int clusterId = -1;
};

struct AnalysisResult {
    std::vector<PointCoordinate> coordinates;
    std::vector<ClusterAssignment> assignments;

    nlohmann::json to_json() const;
};

nlohmann::json coordinatesToJson(const std::vector<PointCoordinate>& coordinates);
nlohmann::json assignmentsToJson(const std::vector<ClusterAssignment>& assignments);

// Projection and partition of a user's item vectors. Stateless; every call
// recomputes from the vectors it is given.
class Analyzer {
public:
    AnalysisResult analyze(const std::vector<ItemVector>& items,
                           ProjectionMethod projection,
                           ClusteringMethod clustering,
                           const AnalysisParams& params = {}) const;

    std::vector<PointCoordinate> project(const std::vector<ItemVector>& items,
                                         ProjectionMethod method,
                                         const AnalysisParams& params = {}) const;

    std::vector<ClusterAssignment> cluster(const std::vector<ItemVector>& items,
                                           ClusteringMethod method,
                                           const AnalysisParams& params = {}) const;
};

} // namespace later
