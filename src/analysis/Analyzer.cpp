#include "analysis/Analyzer.hpp"
#include "analysis/Clustering.hpp"
#include "analysis/Projection.hpp"
#include "core/Errors.hpp"
#include "core/JsonUtils.hpp"
#include <algorithm>
#include <cmath>
#include <Eigen/Dense>

namespace later {

const char* to_string(ProjectionMethod method) {
    switch (method) {
        case ProjectionMethod::PCA: return "pca";
        case ProjectionMethod::TSNE: return "tsne";
        case ProjectionMethod::UMAP: return "umap";
    }
    return "pca";
}

const char* to_string(ClusteringMethod method) {
    switch (method) {
        case ClusteringMethod::KMeans: return "kmeans";
        case ClusteringMethod::Hierarchical: return "hca";
        case ClusteringMethod::DBSCAN: return "dbscan";
    }
    return "kmeans";
}

ProjectionMethod projectionFromString(const std::string& value) {
    if (value == "pca") return ProjectionMethod::PCA;
    else if (value == "tsne") return ProjectionMethod::TSNE;
    else if (value == "umap") return ProjectionMethod::UMAP;
    else throw ValidationError("Unknown projection mode: " + value);
}

ClusteringMethod clusteringFromString(const std::string& value) {
    if (value == "kmeans") return ClusteringMethod::KMeans;
    else if (value == "hca" || value == "hierarchical") return ClusteringMethod::Hierarchical;
    else if (value == "dbscan") return ClusteringMethod::DBSCAN;
    else throw ValidationError("Unknown clustering mode: " + value);
}

nlohmann::json coordinatesToJson(const std::vector<PointCoordinate>& coordinates) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& point : coordinates) {
        arr.push_back({{"id", point.id}, {"x", finiteOrNull(point.x)}, {"y", finiteOrNull(point.y)}});
    }
    return arr;
}

nlohmann::json assignmentsToJson(const std::vector<ClusterAssignment>& assignments) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& assignment : assignments) {
        arr.push_back({{"id", assignment.id}, {"cluster_id", assignment.clusterId}});
    }
    return arr;
}

nlohmann::json AnalysisResult::to_json() const {
    return {
        {"coordinates", coordinatesToJson(coordinates)},
        {"assignments", assignmentsToJson(assignments)}
    };
}

namespace {
    // Row-per-item matrix, L2-normalized. Throws on fewer than two items or mixed dimensions.
    Eigen::MatrixXd normalizedMatrix(const std::vector<ItemVector>& items) {
        if (items.size() < 2) {
            throw InsufficientDataError("At least 2 items with embeddings are required, got " +
                                        std::to_string(items.size()));
        }
        const size_t dim = items.front().vector.size();
        if (dim == 0) {
            throw ValidationError("Item " + items.front().id + " has an empty embedding");
        }

        Eigen::MatrixXd m(static_cast<Eigen::Index>(items.size()), static_cast<Eigen::Index>(dim));
        for (size_t i = 0; i < items.size(); ++i) {
            const auto& v = items[i].vector;
            if (v.size() != dim) {
                throw ValidationError("Embedding dimension mismatch: item " + items[i].id + " has " +
                                      std::to_string(v.size()) + ", expected " + std::to_string(dim));
            }
            for (size_t d = 0; d < dim; ++d) {
                m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(d)) = v[d];
            }
            double norm = m.row(static_cast<Eigen::Index>(i)).norm();
            if (norm > 0.0) m.row(static_cast<Eigen::Index>(i)) /= norm;
        }
        return m;
    }

    void validateParams(const AnalysisParams& params) {
        if (params.k && (*params.k < AnalysisParams::kMinClusters || *params.k > AnalysisParams::kMaxClusters)) {
            throw ValidationError("k must be between 2 and 24");
        }
        if (params.eps && !(*params.eps >= 0.01 && *params.eps <= 1.0)) {
            throw ValidationError("eps must be between 0.01 and 1.0");
        }
        if (params.minSamples && *params.minSamples < 1) {
            throw ValidationError("min_samples must be at least 1");
        }
        if (params.dimRed && *params.dimRed < 1) {
            throw ValidationError("dim_red must be at least 1");
        }
        if (params.perplexity && !(*params.perplexity > 0.0 && std::isfinite(*params.perplexity))) {
            throw ValidationError("perplexity must be positive");
        }
        if (params.nNeighbors && *params.nNeighbors < 2) {
            throw ValidationError("n_neighbors must be at least 2");
        }
        if (!(params.minDist >= 0.0 && params.minDist <= 1.0)) {
            throw ValidationError("min_dist must be between 0 and 1");
        }
    }

    double defaultPerplexity(size_t n, const AnalysisParams& params) {
        double perplexity = params.perplexity
            ? *params.perplexity
            : std::min(30.0, std::max(1.0, static_cast<double>(n / 4)));
        return std::max(1.0, std::min(perplexity, static_cast<double>(n - 1)));
    }
}

std::vector<PointCoordinate> Analyzer::project(const std::vector<ItemVector>& items,
                                               ProjectionMethod method,
                                               const AnalysisParams& params) const {
    validateParams(params);
    Eigen::MatrixXd m = normalizedMatrix(items);
    const size_t n = items.size();

    Eigen::MatrixXd layout;
    switch (method) {
        case ProjectionMethod::PCA:
            layout = Projection::pca(m, 2);
            break;
        case ProjectionMethod::TSNE:
            layout = Projection::tsne(m, defaultPerplexity(n, params), params.seed);
            break;
        case ProjectionMethod::UMAP:
            if (n < 3) {
                layout = Projection::tsne(m, defaultPerplexity(n, params), params.seed);
            } else {
                int neighbours = params.nNeighbors.value_or(std::min(15, static_cast<int>(n) - 1));
                neighbours = std::max(2, std::min(neighbours, static_cast<int>(n) - 1));
                layout = Projection::umap(m, neighbours, params.minDist, params.seed);
            }
            break;
    }

    std::vector<PointCoordinate> coordinates;
    coordinates.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        coordinates.push_back({items[i].id, layout(static_cast<Eigen::Index>(i), 0),
                               layout(static_cast<Eigen::Index>(i), 1)});
    }
    return coordinates;
}

std::vector<ClusterAssignment> Analyzer::cluster(const std::vector<ItemVector>& items,
                                                 ClusteringMethod method,
                                                 const AnalysisParams& params) const {
    validateParams(params);
    Eigen::MatrixXd m = normalizedMatrix(items);
    const int n = static_cast<int>(items.size());

    std::vector<int> labels;
    if (method == ClusteringMethod::DBSCAN) {
        Eigen::MatrixXd space = m;
        if (params.dimRed) {
            int dims = std::min(*params.dimRed, n - 1);
            space = Projection::pca(m, dims);
        }
        Eigen::MatrixXd distances = Projection::cosineDistances(space);
        double eps = params.eps
            ? *params.eps
            : std::max(0.01, std::min(1.0, Clustering::pickEps(distances)));
        int minSamples = params.minSamples.value_or(std::min(3, n));
        labels = Clustering::dbscan(distances, eps, minSamples);
    } else {
        int k = params.k.value_or(std::min(5, n));
        if (k > n) {
            throw InsufficientDataError("Requested " + std::to_string(k) + " clusters but only " +
                                        std::to_string(n) + " items have embeddings");
        }
        if (method == ClusteringMethod::KMeans) {
            labels = Clustering::kmeans(m, k, params.seed);
        } else {
            labels = Clustering::hierarchical(Projection::cosineDistances(m), k);
        }
    }

    std::vector<ClusterAssignment> assignments;
    assignments.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        assignments.push_back({items[i].id, labels[i]});
    }
    return assignments;
}

AnalysisResult Analyzer::analyze(const std::vector<ItemVector>& items,
                                 ProjectionMethod projection,
                                 ClusteringMethod clustering,
                                 const AnalysisParams& params) const {
    AnalysisResult result;
    result.assignments = cluster(items, clustering, params);
    result.coordinates = project(items, projection, params);
    return result;
}

} // namespace later
