#include <gtest/gtest.h>
#include <cmath>
#include <set>
#include "TestData.hpp"
#include "analysis/Analyzer.hpp"
#include "analysis/Projection.hpp"
#include "core/Errors.hpp"

using namespace later;
using namespace later::testing;

TEST(Analyzer, SingleItemIsInsufficient) {
    Analyzer analyzer;
    std::vector<ItemVector> one = {{"only", {1.0f, 0.0f, 0.0f}}};
    EXPECT_THROW(analyzer.project(one, ProjectionMethod::PCA), InsufficientDataError);
    EXPECT_THROW(analyzer.cluster(one, ClusteringMethod::KMeans), InsufficientDataError);
    EXPECT_THROW(analyzer.project({}, ProjectionMethod::TSNE), InsufficientDataError);
}

TEST(Analyzer, RejectsOutOfRangeParameters) {
    Analyzer analyzer;
    auto items = separatedGroups(2, 5, 4);

    AnalysisParams params;
    params.k = 25;
    EXPECT_THROW(analyzer.cluster(items, ClusteringMethod::KMeans, params), ValidationError);

    params = {};
    params.k = 1;
    EXPECT_THROW(analyzer.cluster(items, ClusteringMethod::Hierarchical, params), ValidationError);

    params = {};
    params.eps = 1.5;
    EXPECT_THROW(analyzer.cluster(items, ClusteringMethod::DBSCAN, params), ValidationError);

    params = {};
    params.minDist = -0.1;
    EXPECT_THROW(analyzer.project(items, ProjectionMethod::UMAP, params), ValidationError);

    EXPECT_THROW(projectionFromString("isomap"), ValidationError);
    EXPECT_THROW(clusteringFromString("spectral"), ValidationError);
}

TEST(Analyzer, MoreClustersThanItemsIsInsufficient) {
    Analyzer analyzer;
    auto items = separatedGroups(3, 1, 4);
    AnalysisParams params;
    params.k = 4;
    EXPECT_THROW(analyzer.cluster(items, ClusteringMethod::KMeans, params), InsufficientDataError);
}

TEST(Analyzer, DimensionMismatchIsRejected) {
    Analyzer analyzer;
    std::vector<ItemVector> items = {{"a", {1.0f, 0.0f}}, {"b", {0.0f, 1.0f, 0.0f}}};
    EXPECT_THROW(analyzer.project(items, ProjectionMethod::PCA), ValidationError);
}

TEST(Analyzer, DefaultKIsAtMostFive) {
    Analyzer analyzer;
    auto items = separatedGroups(3, 1, 4);
    auto assignments = analyzer.cluster(items, ClusteringMethod::KMeans);
    std::set<int> ids;
    for (const auto& a : assignments) ids.insert(a.clusterId);
    EXPECT_EQ(ids.size(), 3u);
}

TEST(Analyzer, PcaKeepsIdsAndIsFinite) {
    Analyzer analyzer;
    auto items = separatedGroups(3, 4, 8);
    auto coords = analyzer.project(items, ProjectionMethod::PCA);
    ASSERT_EQ(coords.size(), items.size());
    for (size_t i = 0; i < coords.size(); ++i) {
        EXPECT_EQ(coords[i].id, items[i].id);
        EXPECT_TRUE(std::isfinite(coords[i].x));
        EXPECT_TRUE(std::isfinite(coords[i].y));
    }
}

TEST(Analyzer, TsneIsReproducibleForSeed) {
    Analyzer analyzer;
    auto items = separatedGroups(3, 5, 6);
    AnalysisParams params;
    params.seed = 11;

    auto first = analyzer.project(items, ProjectionMethod::TSNE, params);
    auto second = analyzer.project(items, ProjectionMethod::TSNE, params);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_DOUBLE_EQ(first[i].x, second[i].x);
        EXPECT_DOUBLE_EQ(first[i].y, second[i].y);
    }
}

TEST(Analyzer, UmapFallsBackForTwoItemsAndRunsForMore) {
    Analyzer analyzer;
    auto two = separatedGroups(2, 1, 4);
    EXPECT_EQ(analyzer.project(two, ProjectionMethod::UMAP).size(), 2u);

    auto many = separatedGroups(3, 6, 6);
    auto coords = analyzer.project(many, ProjectionMethod::UMAP);
    ASSERT_EQ(coords.size(), many.size());
    for (const auto& c : coords) {
        EXPECT_TRUE(std::isfinite(c.x));
        EXPECT_TRUE(std::isfinite(c.y));
    }
}

TEST(Analyzer, DbscanWithDimensionReduction) {
    Analyzer analyzer;
    auto items = separatedGroups(2, 6, 8);
    AnalysisParams params;
    params.dimRed = 3;
    params.eps = 0.2;
    params.minSamples = 3;
    auto assignments = analyzer.cluster(items, ClusteringMethod::DBSCAN, params);
    ASSERT_EQ(assignments.size(), items.size());
    EXPECT_NE(assignments.front().clusterId, assignments.back().clusterId);
}

TEST(Analyzer, AnalyzeProducesMatchingJson) {
    Analyzer analyzer;
    auto items = separatedGroups(2, 3, 4);
    auto result = analyzer.analyze(items, ProjectionMethod::PCA, ClusteringMethod::Hierarchical);
    auto j = result.to_json();
    ASSERT_EQ(j["coordinates"].size(), items.size());
    ASSERT_EQ(j["assignments"].size(), items.size());
    EXPECT_EQ(j["assignments"][0]["id"], items[0].id);
    EXPECT_TRUE(j["assignments"][0].contains("cluster_id"));
    EXPECT_TRUE(j["coordinates"][0]["x"].is_number());
}

TEST(Projection, FitAbMatchesReferenceCurve) {
    auto [a, b] = Projection::fitAB(0.1);
    EXPECT_NEAR(a, 1.577, 0.05);
    EXPECT_NEAR(b, 0.895, 0.03);
}

TEST(Projection, CosineDistancesAreSymmetricWithZeroDiagonal) {
    Eigen::MatrixXd m(3, 2);
    m << 1, 0,
         0, 1,
         -1, 0;
    auto d = Projection::cosineDistances(m);
    EXPECT_NEAR(d(0, 1), 1.0, 1e-9);
    EXPECT_NEAR(d(0, 2), 2.0, 1e-9);
    EXPECT_DOUBLE_EQ(d(1, 0), d(0, 1));
    EXPECT_DOUBLE_EQ(d(2, 2), 0.0);
}
