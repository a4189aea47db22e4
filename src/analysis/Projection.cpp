#include "analysis/Projection.hpp"
#include "core/Errors.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

namespace later {

namespace {
    constexpr double kInf = std::numeric_limits<double>::infinity();

    // Largest-magnitude entry of every column becomes positive.
    void fixColumnSigns(Eigen::MatrixXd& m) {
        for (Eigen::Index c = 0; c < m.cols(); ++c) {
            Eigen::Index row = 0;
            m.col(c).cwiseAbs().maxCoeff(&row);
            if (m(row, c) < 0) m.col(c) *= -1.0;
        }
    }

    // Row i of the conditional affinity matrix, with beta searched so that the
    // row entropy matches log(perplexity).
    void conditionalRow(const Eigen::MatrixXd& distances, Eigen::Index i, double logPerplexity,
                        Eigen::MatrixXd& P) {
        const Eigen::Index n = distances.rows();
        double beta = 1.0;
        double betaMin = -kInf;
        double betaMax = kInf;

        for (int iter = 0; iter < 100; ++iter) {
            double sumP = 0.0;
            for (Eigen::Index j = 0; j < n; ++j) {
                double p = (j == i) ? 0.0 : std::exp(-distances(i, j) * beta);
                P(i, j) = p;
                sumP += p;
            }
            if (sumP <= 0.0) sumP = 1e-8;

            double sumDP = 0.0;
            for (Eigen::Index j = 0; j < n; ++j) {
                P(i, j) /= sumP;
                sumDP += distances(i, j) * P(i, j);
            }
            double entropy = std::log(sumP) + beta * sumDP;
            double diff = entropy - logPerplexity;
            if (std::abs(diff) < 1e-5) break;

            if (diff > 0) {
                betaMin = beta;
                beta = (betaMax == kInf) ? beta * 2.0 : (beta + betaMax) / 2.0;
            } else {
                betaMax = beta;
                beta = (betaMin == -kInf) ? beta / 2.0 : (beta + betaMin) / 2.0;
            }
        }
    }

    Eigen::MatrixXd randomLayout(Eigen::Index n, double low, double high, std::mt19937_64& rng) {
        std::uniform_real_distribution<double> dist(low, high);
        Eigen::MatrixXd y(n, 2);
        for (Eigen::Index i = 0; i < n; ++i) {
            y(i, 0) = dist(rng);
            y(i, 1) = dist(rng);
        }
        return y;
    }

    // Two smallest non-trivial eigenvectors of the normalized graph Laplacian.
    Eigen::MatrixXd spectralLayout(const Eigen::MatrixXd& graph, std::mt19937_64& rng) {
        const Eigen::Index n = graph.rows();
        Eigen::VectorXd degree = graph.rowwise().sum();
        if (n < 3 || degree.minCoeff() <= 0.0) {
            return randomLayout(n, -10.0, 10.0, rng);
        }

        Eigen::VectorXd invSqrt = degree.cwiseSqrt().cwiseInverse();
        Eigen::MatrixXd laplacian = Eigen::MatrixXd::Identity(n, n) -
            invSqrt.asDiagonal() * graph * invSqrt.asDiagonal();

        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(laplacian);
        if (solver.info() != Eigen::Success) {
            return randomLayout(n, -10.0, 10.0, rng);
        }

        // Eigenvalues come sorted ascending; column 0 is the trivial one.
        Eigen::MatrixXd layout = solver.eigenvectors().middleCols(1, 2);
        fixColumnSigns(layout);

        double maxAbs = layout.cwiseAbs().maxCoeff();
        if (!(maxAbs > 0.0) || !std::isfinite(maxAbs)) {
            return randomLayout(n, -10.0, 10.0, rng);
        }
        layout *= 10.0 / maxAbs;

        std::normal_distribution<double> noise(0.0, 1e-4);
        for (Eigen::Index i = 0; i < n; ++i) {
            layout(i, 0) += noise(rng);
            layout(i, 1) += noise(rng);
        }
        return layout;
    }

    double clip(double value) {
        return std::max(-4.0, std::min(4.0, value));
    }

    struct Edge {
        Eigen::Index head;
        Eigen::Index tail;
        double epochsPerSample;
    };
}

Eigen::MatrixXd Projection::cosineDistances(const Eigen::MatrixXd& points) {
    Eigen::MatrixXd normalized = points;
    for (Eigen::Index i = 0; i < normalized.rows(); ++i) {
        double norm = normalized.row(i).norm();
        if (norm > 0.0) normalized.row(i) /= norm;
    }
    const Eigen::Index n = points.rows();
    Eigen::MatrixXd distances = Eigen::MatrixXd::Ones(n, n) - normalized * normalized.transpose();
    distances = distances.cwiseMax(0.0).cwiseMin(2.0);
    distances.diagonal().setZero();
    return distances;
}

Eigen::MatrixXd Projection::pca(const Eigen::MatrixXd& points, int components) {
    const Eigen::Index n = points.rows();
    Eigen::MatrixXd out = Eigen::MatrixXd::Zero(n, components);
    if (n == 0 || points.cols() == 0) {
        return out;
    }

    Eigen::RowVectorXd mean = points.colwise().mean();
    Eigen::MatrixXd centered = points.rowwise() - mean;

    Eigen::BDCSVD<Eigen::MatrixXd> svd(centered, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::Index available =
        std::min<Eigen::Index>(components, svd.singularValues().size());

    for (Eigen::Index c = 0; c < available; ++c) {
        Eigen::Index row = 0;
        svd.matrixV().col(c).cwiseAbs().maxCoeff(&row);
        double sign = svd.matrixV()(row, c) < 0 ? -1.0 : 1.0;
        out.col(c) = sign * svd.singularValues()(c) * svd.matrixU().col(c);
    }
    return out;
}

Eigen::MatrixXd Projection::tsne(const Eigen::MatrixXd& points, double perplexity,
                                 std::uint64_t seed, int iterations) {
    const Eigen::Index n = points.rows();
    if (n < 2) {
        return Eigen::MatrixXd::Zero(n, 2);
    }

    Eigen::MatrixXd distances = cosineDistances(points);

    // Joint probabilities
    Eigen::MatrixXd P = Eigen::MatrixXd::Zero(n, n);
    const double logPerplexity = std::log(perplexity);
    for (Eigen::Index i = 0; i < n; ++i) {
        conditionalRow(distances, i, logPerplexity, P);
    }
    P = (P + P.transpose()) / (2.0 * static_cast<double>(n));
    P = P.cwiseMax(1e-12);
    P.diagonal().setZero();

    std::mt19937_64 rng(seed);
    std::normal_distribution<double> init(0.0, 1e-4);
    Eigen::MatrixXd Y(n, 2);
    for (Eigen::Index i = 0; i < n; ++i) {
        Y(i, 0) = init(rng);
        Y(i, 1) = init(rng);
    }

    const double earlyExaggeration = 12.0;
    const int exaggerationIterations = std::min(250, iterations);
    const double learningRate = std::max(static_cast<double>(n) / earlyExaggeration / 4.0, 50.0);

    Eigen::MatrixXd update = Eigen::MatrixXd::Zero(n, 2);
    Eigen::MatrixXd gains = Eigen::MatrixXd::Ones(n, 2);
    Eigen::MatrixXd num(n, n);
    Eigen::MatrixXd grad(n, 2);

    for (int iter = 0; iter < iterations; ++iter) {
        const bool early = iter < exaggerationIterations;
        const double exaggeration = early ? earlyExaggeration : 1.0;
        const double momentum = early ? 0.5 : 0.8;

        double sumQ = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            num(i, i) = 0.0;
            for (Eigen::Index j = i + 1; j < n; ++j) {
                double q = 1.0 / (1.0 + (Y.row(i) - Y.row(j)).squaredNorm());
                num(i, j) = q;
                num(j, i) = q;
                sumQ += 2.0 * q;
            }
        }
        sumQ = std::max(sumQ, 1e-12);

        grad.setZero();
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index j = 0; j < n; ++j) {
                if (i == j) continue;
                double mult = (exaggeration * P(i, j) - num(i, j) / sumQ) * num(i, j);
                grad.row(i) += 4.0 * mult * (Y.row(i) - Y.row(j));
            }
        }

        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index d = 0; d < 2; ++d) {
                if (update(i, d) * grad(i, d) < 0.0) {
                    gains(i, d) += 0.2;
                } else {
                    gains(i, d) = std::max(gains(i, d) * 0.8, 0.01);
                }
            }
        }
        update = momentum * update - learningRate * gains.cwiseProduct(grad);
        Y += update;
        Y.rowwise() -= Y.colwise().mean();
    }
    return Y;
}

std::pair<double, double> Projection::fitAB(double minDist, double spread) {
    const int samples = 300;
    std::vector<double> xs(samples);
    std::vector<double> ys(samples);
    for (int k = 0; k < samples; ++k) {
        xs[k] = 3.0 * spread * k / (samples - 1);
        ys[k] = xs[k] < minDist ? 1.0 : std::exp(-(xs[k] - minDist) / spread);
    }

    auto curve = [](double x, double a, double b) {
        return x <= 0.0 ? 1.0 : 1.0 / (1.0 + a * std::pow(x, 2.0 * b));
    };
    auto cost = [&](double a, double b) {
        double sum = 0.0;
        for (int k = 0; k < samples; ++k) {
            double r = curve(xs[k], a, b) - ys[k];
            sum += r * r;
        }
        return sum;
    };

    // Levenberg-Marquardt on (a, b)
    double a = 1.0;
    double b = 1.0;
    double lambda = 1e-3;
    double current = cost(a, b);
    for (int iter = 0; iter < 200; ++iter) {
        Eigen::MatrixXd J(samples, 2);
        Eigen::VectorXd r(samples);
        for (int k = 0; k < samples; ++k) {
            double x = xs[k];
            if (x <= 0.0) {
                J(k, 0) = 0.0;
                J(k, 1) = 0.0;
                r(k) = 1.0 - ys[k];
                continue;
            }
            double g = std::pow(x, 2.0 * b);
            double den = 1.0 + a * g;
            r(k) = 1.0 / den - ys[k];
            J(k, 0) = -g / (den * den);
            J(k, 1) = -a * g * 2.0 * std::log(x) / (den * den);
        }
        Eigen::Matrix2d JtJ = J.transpose() * J;
        Eigen::Vector2d Jtr = J.transpose() * r;

        bool accepted = false;
        Eigen::Vector2d delta = Eigen::Vector2d::Zero();
        for (int attempt = 0; attempt < 20 && !accepted; ++attempt) {
            Eigen::Matrix2d H = JtJ;
            H.diagonal() += lambda * JtJ.diagonal().cwiseMax(1e-12);
            delta = H.ldlt().solve(-Jtr);
            double na = a + delta(0);
            double nb = b + delta(1);
            if (na > 0.0 && nb > 0.0) {
                double candidate = cost(na, nb);
                if (candidate < current) {
                    a = na;
                    b = nb;
                    current = candidate;
                    lambda = std::max(lambda / 10.0, 1e-12);
                    accepted = true;
                    break;
                }
            }
            lambda *= 10.0;
        }
        if (!accepted || delta.norm() < 1e-10) break;
    }
    return {a, b};
}

Eigen::MatrixXd Projection::umap(const Eigen::MatrixXd& points, int nNeighbors, double minDist,
                                 std::uint64_t seed, int epochs) {
    const Eigen::Index n = points.rows();
    if (n < 3) {
        throw InsufficientDataError("UMAP needs at least 3 points");
    }
    const Eigen::Index k = std::max<Eigen::Index>(2, std::min<Eigen::Index>(nNeighbors, n - 1));
    if (epochs <= 0) {
        epochs = n <= 10000 ? 500 : 200;
    }

    Eigen::MatrixXd distances = cosineDistances(points);
    const double meanDistance = distances.sum() / static_cast<double>(n * (n - 1));

    // Fuzzy simplicial set from the k nearest neighbours of every point
    Eigen::MatrixXd membership = Eigen::MatrixXd::Zero(n, n);
    const double target = std::log2(static_cast<double>(k));
    for (Eigen::Index i = 0; i < n; ++i) {
        std::vector<std::pair<double, Eigen::Index>> neighbours;
        neighbours.reserve(static_cast<size_t>(n - 1));
        for (Eigen::Index j = 0; j < n; ++j) {
            if (j != i) neighbours.emplace_back(distances(i, j), j);
        }
        std::partial_sort(neighbours.begin(), neighbours.begin() + k, neighbours.end());
        neighbours.resize(static_cast<size_t>(k));

        double rho = 0.0;
        double localMean = 0.0;
        for (const auto& [d, j] : neighbours) {
            if (rho == 0.0 && d > 0.0) rho = d;
            localMean += d;
        }
        localMean /= static_cast<double>(k);

        double lo = 0.0;
        double hi = kInf;
        double sigma = 1.0;
        for (int iter = 0; iter < 64; ++iter) {
            double psum = 0.0;
            for (const auto& [d, j] : neighbours) {
                double gap = d - rho;
                psum += gap > 0.0 ? std::exp(-gap / sigma) : 1.0;
            }
            if (std::abs(psum - target) < 1e-5) break;
            if (psum > target) {
                hi = sigma;
                sigma = (lo + hi) / 2.0;
            } else {
                lo = sigma;
                sigma = (hi == kInf) ? sigma * 2.0 : (lo + hi) / 2.0;
            }
        }
        sigma = std::max(sigma, 1e-3 * (rho > 0.0 ? localMean : meanDistance));
        if (!(sigma > 0.0)) sigma = 1e-3;

        for (const auto& [d, j] : neighbours) {
            double gap = d - rho;
            membership(i, j) = gap > 0.0 ? std::exp(-gap / sigma) : 1.0;
        }
    }
    Eigen::MatrixXd graph = membership + membership.transpose() -
                            membership.cwiseProduct(membership.transpose());

    // Edges too weak to be sampled even once are dropped
    const double maxWeight = graph.maxCoeff();
    std::vector<Edge> edges;
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            double w = graph(i, j);
            if (i != j && w > 0.0 && w >= maxWeight / epochs) {
                edges.push_back({i, j, maxWeight / w});
            }
        }
    }

    const auto [a, b] = fitAB(minDist);

    std::mt19937_64 rng(seed);
    Eigen::MatrixXd Y = spectralLayout(graph, rng);
    for (Eigen::Index d = 0; d < 2; ++d) {
        double lo = Y.col(d).minCoeff();
        double hi = Y.col(d).maxCoeff();
        double range = hi - lo;
        if (range > 0.0) {
            Y.col(d) = ((Y.col(d).array() - lo) * (10.0 / range)).matrix();
        }
    }

    const double negativeSampleRate = 5.0;
    std::vector<double> nextSample(edges.size());
    std::vector<double> negativeEvery(edges.size());
    std::vector<double> nextNegative(edges.size());
    for (size_t e = 0; e < edges.size(); ++e) {
        nextSample[e] = edges[e].epochsPerSample;
        negativeEvery[e] = edges[e].epochsPerSample / negativeSampleRate;
        nextNegative[e] = negativeEvery[e];
    }
    std::uniform_int_distribution<Eigen::Index> pick(0, n - 1);

    for (int epoch = 0; epoch < epochs; ++epoch) {
        const double alpha = 1.0 - static_cast<double>(epoch) / epochs;
        for (size_t e = 0; e < edges.size(); ++e) {
            if (nextSample[e] > epoch) continue;
            const Eigen::Index i = edges[e].head;
            const Eigen::Index j = edges[e].tail;

            Eigen::RowVector2d diff = Y.row(i) - Y.row(j);
            double dist2 = diff.squaredNorm();
            if (dist2 > 0.0) {
                double coeff = -2.0 * a * b * std::pow(dist2, b - 1.0) /
                               (a * std::pow(dist2, b) + 1.0);
                for (Eigen::Index d = 0; d < 2; ++d) {
                    double g = clip(coeff * diff(d));
                    Y(i, d) += g * alpha;
                    Y(j, d) -= g * alpha;
                }
            }
            nextSample[e] += edges[e].epochsPerSample;

            int negatives = std::max(0, static_cast<int>((epoch - nextNegative[e]) / negativeEvery[e]));
            for (int s = 0; s < negatives; ++s) {
                Eigen::Index other = pick(rng);
                if (other == i) continue;
                Eigen::RowVector2d away = Y.row(i) - Y.row(other);
                double d2 = away.squaredNorm();
                double coeff = d2 > 0.0
                    ? 2.0 * b / ((0.001 + d2) * (a * std::pow(d2, b) + 1.0))
                    : 0.0;
                for (Eigen::Index d = 0; d < 2; ++d) {
                    double g = coeff > 0.0 ? clip(coeff * away(d)) : 4.0;
                    Y(i, d) += g * alpha;
                }
            }
            nextNegative[e] += negatives * negativeEvery[e];
        }
    }

    Y.rowwise() -= Y.colwise().mean();
    return Y;
}

} // namespace later
