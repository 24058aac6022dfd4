#include "TestCore.h"

#include <random>
#include <vector>

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any birch imports.
#include "custom_parallel.h"
#endif

#include "birch/InitializeRandom.hpp"
#include "birch/SimpleMatrix.hpp"

class RandomInitializationTest : public TestCore, public ::testing::TestWithParam<std::tuple<std::tuple<int, int>, int> > {
protected:
    void SetUp() {
        assemble(std::get<0>(GetParam()));
    }
};

TEST_P(RandomInitializationTest, Basic) {
    auto ncenters = std::get<1>(GetParam());

    birch::InitializeRandomOptions opt;
    opt.seed = ncenters * 10;
    birch::InitializeRandom<int, double, int, double> init(opt);

    std::vector<double> centers(nr * ncenters);
    auto nfilled = init.run(birch::SimpleMatrix(nr, nc, data.data()), ncenters, centers.data());
    EXPECT_EQ(nfilled, ncenters);

    auto matched = match_to_data(ncenters, centers);
    for (auto m : matched) {
        EXPECT_TRUE(m >= 0);
        EXPECT_TRUE(m < nc);
    }

    std::sort(matched.begin(), matched.end());
    for (size_t i = 1; i < matched.size(); ++i) {
        EXPECT_TRUE(matched[i] > matched[i-1]);
    }

    // Same results with the same generator state.
    birch::InitializeRng rng(opt.seed);
    std::vector<double> centers2(nr * ncenters);
    init.run(birch::SimpleMatrix(nr, nc, data.data()), ncenters, centers2.data(), rng);
    EXPECT_EQ(centers, centers2);
}

INSTANTIATE_TEST_SUITE_P(
    RandomInitialization,
    RandomInitializationTest,
    ::testing::Combine(
        ::testing::Combine(
            ::testing::Values(10, 20), // number of dimensions
            ::testing::Values(20, 200, 2000) // number of observations
        ),
        ::testing::Values(2, 5, 10) // number of clusters
    )
);

class RandomInitializationEdgeTest : public TestCore, public ::testing::Test {
protected:
    void SetUp() {
        assemble({ 12, 40 });
    }
};

TEST_F(RandomInitializationEdgeTest, TooManyClusters) {
    birch::InitializeRandomOptions opt;
    opt.seed = nc * 10;
    birch::InitializeRandom<int, double, int, double> init(opt);

    std::vector<double> centers(nc * nr);
    auto nfilled = init.run(birch::SimpleMatrix(nr, nc, data.data()), nc, centers.data());
    EXPECT_EQ(nfilled, nc);
    EXPECT_EQ(centers, data);

    std::vector<double> centers2((nc + 10) * nr);
    nfilled = init.run(birch::SimpleMatrix(nr, nc, data.data()), nc + 10, centers2.data());
    EXPECT_EQ(nfilled, nc);
    centers2.resize(nc * nr);
    EXPECT_EQ(centers2, data);
}
