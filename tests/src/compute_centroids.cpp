#include "TestCore.h"

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any birch imports.
#include "custom_parallel.h"
#endif

#include "birch/compute_centroids.hpp"
#include "birch/WeightedData.hpp"

class ComputeCentroidsTest : public TestCore, public ::testing::TestWithParam<std::tuple<std::tuple<int, int>, int> > {
protected:
    void SetUp() {
        assemble(std::get<0>(GetParam()));
    }
};

TEST_P(ComputeCentroidsTest, Basic) {
    auto ncenters = std::get<1>(GetParam());
    auto sim = create_weighted(data, ncenters);
    birch::WeightedData<int, double> wdata(nr, nc, sim.linear_sums, sim.weights, sim.sums_of_squares);

    std::vector<int> clusters(nc);
    for (int c = 0; c < nc; ++c) {
        clusters[c] = c % ncenters;
    }

    std::vector<double> centers(ncenters * nr);
    birch::internal::compute_centroids(wdata, ncenters, centers.data(), clusters.data());

    // Computing the weighted mean by row for comparison.
    std::vector<double> ref(ncenters * nr);
    std::vector<double> total_weight(ncenters);
    for (int c = 0; c < nc; ++c) {
        total_weight[clusters[c]] += sim.weights[c];
    }
    for (int r = 0; r < nr; ++r) {
        for (int c = 0; c < nc; ++c) {
            ref[clusters[c] * nr + r] += data[c * nr + r] * sim.weights[c];
        }
        for (int c = 0; c < ncenters; ++c) {
            ref[c * nr + r] /= total_weight[c];
        }
    }

    for (int i = 0; i < ncenters * nr; ++i) {
        EXPECT_FLOAT_EQ(ref[i], centers[i]);
    }
}

INSTANTIATE_TEST_SUITE_P(
    ComputeCentroids,
    ComputeCentroidsTest,
    ::testing::Combine(
        ::testing::Combine(
            ::testing::Values(5, 10, 20),
            ::testing::Values(50, 100)
        ),
        ::testing::Values(3, 7, 11) // number of clusters
    )
);

TEST(ComputeCentroids, Empty) {
    // Two points of weights 1 and 3 at 0 and 4.
    birch::WeightedData<int, double> wdata(1, 2, std::vector<double>{ 0, 12 }, std::vector<double>{ 1, 3 }, std::vector<double>{ 0, 48 });
    std::vector<int> clusters { 1, 1 };
    std::vector<double> centers { -5, 10 };
    birch::internal::compute_centroids(wdata, 2, centers.data(), clusters.data());
    EXPECT_EQ(centers[0], -5); // untouched, as the cluster is empty.
    EXPECT_EQ(centers[1], 3);
}
