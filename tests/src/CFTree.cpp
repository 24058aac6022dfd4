#include "TestCore.h"

#ifdef CUSTOM_PARALLEL_TEST
// Must be before any birch imports.
#include "custom_parallel.h"
#endif

#include "birch/CFTree.hpp"

#include <iterator>

class CFTreeTestCore : public TestCore {
protected:
    typedef birch::CFTree<double> Tree;

    static void check_feature(const Tree::Feature& observed, const Tree::Feature& expected) {
        EXPECT_EQ(observed.size(), expected.size());
        EXPECT_NEAR(observed.sum_of_squares(), expected.sum_of_squares(), 1e-8 * std::max(1.0, expected.sum_of_squares()));
        const auto& ols = observed.linear_sum();
        const auto& els = expected.linear_sum();
        ASSERT_EQ(ols.size(), els.size());
        for (size_t d = 0; d < ols.size(); ++d) {
            EXPECT_NEAR(ols[d], els[d], 1e-8 * std::max(1.0, std::abs(els[d])));
        }
    }

    // Checks the structural invariants below 'current', and returns the number of leaf entries.
    static size_t check_node(const Tree& tree, Tree::NodeIndex current, size_t depth) {
        const auto& node = tree.node(current);
        const auto& opt = tree.get_options();
        const bool is_root = (current == tree.root());
        Tree::Feature expected(tree.num_dimensions());

        if (node.leaf) {
            EXPECT_EQ(depth, tree.height()); // all leaves are at the same depth.
            EXPECT_LE(node.entries.size(), opt.leaf_capacity);
            if (!is_root) {
                EXPECT_GE(node.entries.size(), 1);
            }
            for (const auto& entry : node.entries) {
                EXPECT_FALSE(entry.empty());
                expected.add(entry);
            }
            check_feature(node.feature, expected);
            return node.entries.size();
        }

        EXPECT_TRUE(node.entries.empty());
        EXPECT_LE(node.children.size(), opt.branching_factor);
        EXPECT_GE(node.children.size(), (is_root ? 2 : 1));

        size_t total = 0;
        for (auto child : node.children) {
            total += check_node(tree, child, depth + 1);
            expected.add(tree.node(child).feature);
        }
        check_feature(node.feature, expected);
        return total;
    }

    static void check_tree(const Tree& tree, size_t num_points) {
        EXPECT_EQ(check_node(tree, tree.root(), 1), tree.num_leaves());
        EXPECT_EQ(tree.num_points(), num_points);
        EXPECT_LE(tree.num_leaves(), tree.get_options().max_leaves);

        // Leaf sequence covers every leaf entry and all observations.
        auto seq = tree.leaves();
        EXPECT_EQ(static_cast<size_t>(std::distance(seq.begin(), seq.end())), tree.num_leaves());
        size_t total = 0;
        for (const auto& leaf : seq) {
            total += leaf.size();
        }
        EXPECT_EQ(total, num_points);
    }

    static Tree build(int start, int end, birch::CFTreeOptions options) {
        Tree tree(nr, std::move(options));
        for (int c = start; c < end; ++c) {
            tree.insert(data.data() + c * nr, nr);
        }
        return tree;
    }
};

class CFTreeBasicTest : public CFTreeTestCore, public ::testing::TestWithParam<std::tuple<std::tuple<int, int>, int> > {
protected:
    void SetUp() {
        assemble(std::get<0>(GetParam()));
    }
};

TEST_P(CFTreeBasicTest, Structure) {
    auto capacity = std::get<1>(GetParam());

    for (auto absorption : { birch::Absorption::RADIUS, birch::Absorption::DIAMETER }) {
        for (auto distance : { birch::Distance::CENTROID, birch::Distance::VARIANCE_INCREASE }) {
            birch::CFTreeOptions opt;
            opt.branching_factor = capacity;
            opt.leaf_capacity = capacity;
            opt.max_leaves = nc * 2; // no rebuilds.
            opt.absorption = absorption;
            opt.distance = distance;

            auto tree = build(0, nc, opt);
            check_tree(tree, nc);
            EXPECT_EQ(tree.num_rebuilds(), 0);
            EXPECT_EQ(tree.num_leaves(), nc); // zero threshold, so nothing is absorbed.
            EXPECT_EQ(tree.threshold(), 0);

            if (nc > capacity) {
                EXPECT_GT(tree.height(), 1);
            }
        }
    }
}

TEST_P(CFTreeBasicTest, Rebuild) {
    auto capacity = std::get<1>(GetParam());

    birch::CFTreeOptions opt;
    opt.branching_factor = capacity;
    opt.leaf_capacity = capacity;
    opt.max_leaves = 10;

    auto tree = build(0, nc, opt);
    check_tree(tree, nc);
    EXPECT_GT(tree.num_rebuilds(), 0);
    EXPECT_GT(tree.threshold(), 0);

    // Continuing to insert after a rebuild respects all invariants.
    auto tree2 = build(0, nc, opt);
    for (int c = 0; c < nc; ++c) {
        tree2.insert(data.data() + c * nr, nr);
    }
    check_tree(tree2, nc * 2);
}

TEST_P(CFTreeBasicTest, FindLeaf) {
    auto capacity = std::get<1>(GetParam());

    birch::CFTreeOptions opt;
    opt.branching_factor = capacity;
    opt.leaf_capacity = capacity;
    opt.max_leaves = 20;
    auto tree = build(0, nc, opt);

    std::vector<const Tree::Feature*> all_leaves;
    for (const auto& leaf : tree.leaves()) {
        all_leaves.push_back(&leaf);
    }

    for (int c = 0; c < nc; ++c) {
        const auto& found = tree.find_leaf(data.data() + c * nr);
        EXPECT_TRUE(std::find(all_leaves.begin(), all_leaves.end(), &found) != all_leaves.end());
    }

    // Searching does not modify the tree.
    check_tree(tree, nc);
}

INSTANTIATE_TEST_SUITE_P(
    CFTree,
    CFTreeBasicTest,
    ::testing::Combine(
        ::testing::Combine(
            ::testing::Values(2, 5), // number of dimensions
            ::testing::Values(20, 200, 1000) // number of observations
        ),
        ::testing::Values(2, 3, 10) // node capacity
    )
);

class CFTreeEdgeTest : public CFTreeTestCore, public ::testing::Test {
protected:
    void SetUp() {
        assemble({ 3, 200 });
    }
};

TEST_F(CFTreeEdgeTest, Empty) {
    Tree tree(nr);
    EXPECT_EQ(tree.num_leaves(), 0);
    EXPECT_EQ(tree.num_points(), 0);
    EXPECT_EQ(tree.height(), 1);
    auto seq = tree.leaves();
    EXPECT_TRUE(seq.begin() == seq.end());
    EXPECT_ANY_THROW(tree.find_leaf(data.data()));

    // Empty CFs are ignored.
    tree.insert(Tree::Feature(nr));
    EXPECT_EQ(tree.num_leaves(), 0);
}

TEST_F(CFTreeEdgeTest, Threshold) {
    birch::CFTreeOptions opt;
    opt.threshold = 100; // everything is absorbed into one entry.
    auto tree = build(0, nc, opt);
    EXPECT_EQ(tree.num_leaves(), 1);
    EXPECT_EQ(tree.threshold(), 100);
    EXPECT_EQ(tree.leaves().begin()->size(), nc);
    check_tree(tree, nc);
}

TEST_F(CFTreeEdgeTest, Duplicates) {
    birch::CFTreeOptions opt;
    opt.max_leaves = 5;
    Tree tree(nr, opt);
    for (int i = 0; i < 100; ++i) {
        tree.insert(data.data(), nr);
    }
    check_tree(tree, 100);

    // All entries share the same centroid, regardless of rounding in the absorption criterion.
    for (const auto& leaf : tree.leaves()) {
        for (int r = 0; r < nr; ++r) {
            EXPECT_NEAR(leaf.centroid(r), data[r], 1e-8);
        }
    }
}

TEST_F(CFTreeEdgeTest, Coarsening) {
    birch::CFTreeOptions opt;
    opt.max_leaves = 7;
    opt.leaf_capacity = 3;
    opt.branching_factor = 2;
    opt.max_rebuilds = 0; // always coarsen immediately.

    auto tree = build(0, nc, opt);
    check_tree(tree, nc);
    EXPECT_GT(tree.num_rebuilds(), 0);
    EXPECT_GT(tree.threshold(), 0);
}

TEST_F(CFTreeEdgeTest, InsertFeatures) {
    // Inserting pre-summarized CFs gives the same totals as inserting the observations.
    Tree tree(nr);
    Tree::Feature expected(nr);
    for (int c = 0; c < nc; c += 10) {
        Tree::Feature chunk(nr);
        for (int i = c; i < c + 10; ++i) {
            chunk.add_point(data.data() + i * nr);
        }
        expected.add(chunk);
        tree.insert(chunk);
    }
    EXPECT_EQ(tree.num_leaves(), nc / 10);
    check_tree(tree, nc);
    check_feature(tree.node(tree.root()).feature, expected);
}

TEST_F(CFTreeEdgeTest, Restartable) {
    birch::CFTreeOptions opt;
    opt.max_leaves = 50;
    auto tree = build(0, nc, opt);

    // Each sequence is an independent traversal.
    auto seq = tree.leaves();
    std::vector<const Tree::Feature*> first, second;
    for (const auto& leaf : seq) {
        first.push_back(&leaf);
    }
    for (auto it = seq.begin(); it != seq.end(); it++) {
        second.push_back(&(*it));
    }
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), tree.num_leaves());
}

TEST_F(CFTreeEdgeTest, Errors) {
    birch::CFTreeOptions opt;
    opt.branching_factor = 1;
    EXPECT_ANY_THROW(Tree(nr, opt));

    opt = birch::CFTreeOptions();
    opt.leaf_capacity = 0;
    EXPECT_ANY_THROW(Tree(nr, opt));

    opt = birch::CFTreeOptions();
    opt.max_leaves = 0;
    EXPECT_ANY_THROW(Tree(nr, opt));

    opt = birch::CFTreeOptions();
    opt.threshold = -1;
    EXPECT_ANY_THROW(Tree(nr, opt));

    opt = birch::CFTreeOptions();
    opt.max_rebuilds = -1;
    EXPECT_ANY_THROW(Tree(nr, opt));

    Tree tree(nr);
    EXPECT_ANY_THROW(tree.insert(data.data(), nr + 1));
    EXPECT_ANY_THROW(tree.insert(Tree::Feature(nr + 1)));
}
