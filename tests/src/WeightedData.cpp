#include "TestCore.h"

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any birch imports.
#include "custom_parallel.h"
#endif

#include "birch/WeightedData.hpp"

class WeightedDataTest : public TestCore, public ::testing::Test {
protected:
    void SetUp() {
        assemble({ 5, 40 });
    }
};

TEST_F(WeightedDataTest, Basic) {
    auto sim = create_weighted(data, 42);
    birch::WeightedData<int, double> wdata(nr, nc, sim.linear_sums, sim.weights, sim.sums_of_squares);
    EXPECT_EQ(wdata.num_dimensions(), nr);
    EXPECT_EQ(wdata.num_points(), nc);

    // Positions are the centroids of each pseudo-point.
    for (int c = 0; c < nc; ++c) {
        EXPECT_EQ(wdata.weights()[c], sim.weights[c]);
        EXPECT_EQ(wdata.sums_of_squares()[c], sim.sums_of_squares[c]);
        for (int r = 0; r < nr; ++r) {
            EXPECT_FLOAT_EQ(wdata.positions()[c * nr + r], data[c * nr + r]);
            EXPECT_EQ(wdata.linear_sums()[c * nr + r], sim.linear_sums[c * nr + r]);
        }
    }

    auto mat = wdata.position_matrix();
    EXPECT_EQ(mat.num_observations(), nc);
    EXPECT_EQ(mat.num_dimensions(), nr);
    auto work = mat.new_extractor();
    EXPECT_EQ(work->get_observation(3), wdata.positions() + 3 * nr);
}

TEST_F(WeightedDataTest, Features) {
    std::vector<birch::ClusteringFeature<double> > features;
    for (int c = 0; c < nc; c += 4) {
        birch::ClusteringFeature<double> current(nr);
        for (int i = c; i < c + 4; ++i) {
            current.add_point(data.data() + i * nr);
        }
        features.push_back(std::move(current));
    }

    birch::WeightedData<int, double> wdata(nr, features);
    EXPECT_EQ(wdata.num_points(), features.size());
    for (size_t f = 0; f < features.size(); ++f) {
        EXPECT_EQ(wdata.weights()[f], 4);
        EXPECT_EQ(wdata.sums_of_squares()[f], features[f].sum_of_squares());
        for (int r = 0; r < nr; ++r) {
            EXPECT_FLOAT_EQ(wdata.positions()[f * nr + r], features[f].centroid(r));
        }
    }

    features.emplace_back(nr + 1);
    EXPECT_ANY_THROW(birch::WeightedData<int, double>(nr, features));
}

TEST_F(WeightedDataTest, FeaturesSmall) {
    std::vector<double> point{ 1, 2 };
    birch::ClusteringFeature<double> current(2);
    current.add_point(point.data());
    std::vector<birch::ClusteringFeature<double> > features(2, current);

    birch::WeightedData<int, double> wdata(2, features);
    EXPECT_EQ(wdata.num_points(), 2);
    for (int f = 0; f < 2; ++f) {
        EXPECT_EQ(wdata.weights()[f], 1);
        EXPECT_EQ(wdata.sums_of_squares()[f], 5);
        EXPECT_EQ(wdata.positions()[f * 2], 1);
        EXPECT_EQ(wdata.positions()[f * 2 + 1], 2);
    }

    // Same for the iterator range.
    birch::WeightedData<int, double> wdata2(2, features.begin(), features.end());
    EXPECT_EQ(wdata2.num_points(), 2);
}

TEST_F(WeightedDataTest, Leaves) {
    birch::CFTreeOptions opt;
    opt.max_leaves = 8;
    birch::CFTree<double> tree(nr, opt);
    for (int c = 0; c < nc; ++c) {
        tree.insert(data.data() + c * nr, nr);
    }

    auto wdata = birch::extract_leaves<int, double>(tree);
    EXPECT_EQ(wdata.num_points(), tree.num_leaves());

    // Same order as the leaf sequence.
    int counter = 0;
    double total = 0;
    for (const auto& leaf : tree.leaves()) {
        EXPECT_EQ(wdata.weights()[counter], leaf.size());
        total += wdata.weights()[counter];
        ++counter;
    }
    EXPECT_EQ(total, nc);
}

TEST_F(WeightedDataTest, Errors) {
    auto sim = create_weighted(data, 42);
    EXPECT_ANY_THROW(birch::WeightedData<int, double>(nr, nc + 1, sim.linear_sums, sim.weights, sim.sums_of_squares));

    auto ss = sim.sums_of_squares;
    ss.pop_back();
    EXPECT_ANY_THROW(birch::WeightedData<int, double>(nr, nc, sim.linear_sums, sim.weights, ss));

    auto weights = sim.weights;
    weights[0] = 0;
    EXPECT_ANY_THROW(birch::WeightedData<int, double>(nr, nc, sim.linear_sums, weights, sim.sums_of_squares));
}
