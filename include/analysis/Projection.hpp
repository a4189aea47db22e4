#pragma once

#include <cstdint>
#include <Eigen/Dense>

namespace later {

// 2D layouts of a point set. Rows of the input are points.
class Projection {
public:
    // Mean-centered PCA via SVD. Each component is sign-fixed so its largest-magnitude
    // loading is positive, which makes the result deterministic.
    static Eigen::MatrixXd pca(const Eigen::MatrixXd& points, int components = 2);

    // Exact t-SNE on cosine distances.
    static Eigen::MatrixXd tsne(const Eigen::MatrixXd& points, double perplexity,
                                std::uint64_t seed, int iterations = 1000);

    // UMAP on a cosine kNN graph: fuzzy simplicial set, spectral init, SGD with
    // negative sampling. Needs at least 3 points.
    static Eigen::MatrixXd umap(const Eigen::MatrixXd& points, int nNeighbors, double minDist,
                                std::uint64_t seed, int epochs = 0);

    // Pairwise 1 - cosine, clamped to [0, 2], zero diagonal.
    static Eigen::MatrixXd cosineDistances(const Eigen::MatrixXd& points);

    // Curve parameters (a, b) of 1 / (1 + a d^2b) for the given min_dist, spread 1.
    static std::pair<double, double> fitAB(double minDist, double spread = 1.0);
};

} // namespace later
