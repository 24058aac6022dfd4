#ifndef BIRCH_CFTREE_HPP
#define BIRCH_CFTREE_HPP

#include <vector>
#include <algorithm>
#include <limits>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

#include "glog/logging.h"
#include "sanisizer/sanisizer.hpp"

#include "ClusteringFeature.hpp"
#include "utils.hpp"

/**
 * @file CFTree.hpp
 * @brief Clustering feature tree.
 */

namespace birch {

/**
 * Criterion for absorbing a new observation (or CF) into an existing leaf entry.
 * The criterion is computed on the CF that would result from the merge, and compared to the threshold.
 *
 * - `RADIUS`: root mean squared distance of the merged observations to their centroid.
 * - `DIAMETER`: root mean squared distance between all pairs of merged observations.
 */
enum class Absorption : char { RADIUS, DIAMETER };

/**
 * Distance between CFs, used to choose the closest child during descent, the closest leaf entry and the seeds for a node split.
 *
 * - `CENTROID`: squared Euclidean distance between centroids.
 * - `VARIANCE_INCREASE`: increase in the sum of squared deviations upon merging.
 */
enum class Distance : char { CENTROID, VARIANCE_INCREASE };

/**
 * @brief Options for `CFTree` construction.
 */
struct CFTreeOptions {
    /**
     * Maximum number of children of each internal node.
     * This should be at least 2.
     */
    std::size_t branching_factor = 64;

    /**
     * Maximum number of entries in each leaf node.
     * This should be positive.
     */
    std::size_t leaf_capacity = 64;

    /**
     * Maximum number of leaf entries across the entire tree.
     * Once exceeded, the tree is rebuilt with a larger threshold.
     * This bounds the memory usage and the number of pseudo-points for the subsequent k-means.
     */
    std::size_t max_leaves = 1000;

    /**
     * Initial absorption threshold.
     * This should be non-negative.
     */
    double threshold = 0;

    /**
     * Absorption criterion.
     */
    Absorption absorption = Absorption::RADIUS;

    /**
     * Distance between CFs.
     */
    Distance distance = Distance::CENTROID;

    /**
     * Maximum number of consecutive rebuilds when the tree exceeds `max_leaves`.
     * If the tree is still too large, the closest leaf entries are forcibly merged.
     */
    int max_rebuilds = 100;
};

/**
 * @brief Clustering feature tree.
 *
 * The CF-tree is a height-balanced tree where each leaf node contains up to `CFTreeOptions::leaf_capacity` CFs (the leaf entries)
 * and each internal node contains up to `CFTreeOptions::branching_factor` children.
 * Each node stores the sum of the CFs in its subtree.
 * Observations are inserted by greedily descending to the closest child, and are absorbed into the closest leaf entry if the absorption criterion stays within the threshold.
 * Otherwise, a new leaf entry is created, splitting nodes if their capacity is exceeded.
 *
 * When the total number of leaf entries exceeds `CFTreeOptions::max_leaves`, the threshold is increased and the tree is rebuilt from its own leaf entries.
 * This ensures that the size of the tree is bounded regardless of the number of observations.
 *
 * Nodes are stored in an arena and referenced by their index.
 * Indices are stable until the next insertion.
 *
 * @tparam Float_ Floating-point type of the CF statistics.
 */
template<typename Float_ = double>
class CFTree {
public:
    /**
     * Type of the CFs in the tree.
     */
    typedef ClusteringFeature<Float_> Feature;

    /**
     * Type of the node indices.
     */
    typedef std::size_t NodeIndex;

    /**
     * Placeholder for a non-existent node.
     */
    static constexpr NodeIndex NONE = std::numeric_limits<NodeIndex>::max();

    /**
     * @brief Node of the tree.
     */
    struct Node {
        /**
         * Sum of all CFs in the subtree.
         */
        Feature feature;

        /**
         * Whether this is a leaf node.
         */
        bool leaf = true;

        /**
         * Indices of the child nodes, for internal nodes only.
         */
        std::vector<NodeIndex> children;

        /**
         * Leaf entries, for leaf nodes only.
         */
        std::vector<Feature> entries;

        /**
         * Index of the next leaf node in the leaf chain, for leaf nodes only.
         */
        NodeIndex next_leaf = NONE;
    };

public:
    /**
     * @param num_dimensions Number of dimensions of the observations.
     * @param options Further options.
     */
    CFTree(const std::size_t num_dimensions, CFTreeOptions options) : my_num_dim(num_dimensions), my_options(std::move(options)) {
        if (my_options.branching_factor < 2) {
            throw std::runtime_error("branching factor should be at least 2");
        }
        if (my_options.leaf_capacity < 1) {
            throw std::runtime_error("leaf capacity should be positive");
        }
        if (my_options.max_leaves < 1) {
            throw std::runtime_error("maximum number of leaf entries should be positive");
        }
        if (!std::isfinite(my_options.threshold) || my_options.threshold < 0) {
            throw std::runtime_error("threshold should be non-negative and finite");
        }
        if (my_options.max_rebuilds < 0) {
            throw std::runtime_error("maximum number of rebuilds should be non-negative");
        }

        my_threshold = my_options.threshold;
        reset();
    }

    /**
     * @param num_dimensions Number of dimensions of the observations.
     */
    CFTree(const std::size_t num_dimensions) : CFTree(num_dimensions, CFTreeOptions()) {}

private:
    std::size_t my_num_dim;
    CFTreeOptions my_options;

    std::vector<Node> my_nodes;
    NodeIndex my_root = 0;
    NodeIndex my_first_leaf = 0;

    std::size_t my_num_leaves = 0;
    std::size_t my_num_leaf_nodes = 0;
    std::size_t my_height = 0;

    Float_ my_threshold = 0;
    int my_num_rebuilds = 0;

public:
    /**
     * @return Number of dimensions.
     */
    std::size_t num_dimensions() const {
        return my_num_dim;
    }

    /**
     * @return Options used to construct the tree.
     */
    const CFTreeOptions& get_options() const {
        return my_options;
    }

    /**
     * @return Total number of leaf entries.
     */
    std::size_t num_leaves() const {
        return my_num_leaves;
    }

    /**
     * @return Number of leaf nodes.
     */
    std::size_t num_leaf_nodes() const {
        return my_num_leaf_nodes;
    }

    /**
     * @return Number of nodes.
     */
    std::size_t num_nodes() const {
        return my_nodes.size();
    }

    /**
     * @return Number of levels in the tree, including the leaf level.
     */
    std::size_t height() const {
        return my_height;
    }

    /**
     * @return Current absorption threshold.
     */
    Float_ threshold() const {
        return my_threshold;
    }

    /**
     * @return Number of times the tree was rebuilt.
     */
    int num_rebuilds() const {
        return my_num_rebuilds;
    }

    /**
     * @return Total number of observations that were inserted.
     */
    std::size_t num_points() const {
        return my_nodes[my_root].feature.size();
    }

    /**
     * @return Index of the root node.
     */
    NodeIndex root() const {
        return my_root;
    }

    /**
     * @param i Index of a node.
     * @return The node at index `i`.
     */
    const Node& node(const NodeIndex i) const {
        return my_nodes[i];
    }

private:
    void reset() {
        my_nodes.clear();
        my_root = allocate_node(true);
        my_first_leaf = my_root;
        my_num_leaves = 0;
        my_num_leaf_nodes = 1;
        my_height = 1;
    }

    NodeIndex allocate_node(const bool leaf) {
        const NodeIndex output = my_nodes.size();
        my_nodes.emplace_back();
        auto& current = my_nodes.back();
        current.feature = Feature(my_num_dim);
        current.leaf = leaf;
        return output;
    }

    Float_ distance(const Feature& left, const Feature& right) const {
        if (my_options.distance == Distance::VARIANCE_INCREASE) {
            return variance_increase(left, right);
        } else {
            return squared_centroid_distance(left, right);
        }
    }

    Float_ merged_measure(const Feature& left, const Feature& right) const {
        if (my_options.absorption == Absorption::DIAMETER) {
            return merged_squared_diameter(left, right);
        } else {
            return merged_squared_radius(left, right);
        }
    }

    Float_ measure(const Feature& feature) const {
        if (my_options.absorption == Absorption::DIAMETER) {
            return feature.squared_diameter();
        } else {
            return feature.squared_radius();
        }
    }

    bool absorbs(const Feature& entry, const Feature& incoming) const {
        return merged_measure(entry, incoming) <= my_threshold * my_threshold;
    }

    template<class Items_, class Feature_>
    std::size_t closest(const Items_& items, const Feature& target, Feature_ get_feature) const {
        std::size_t best = 0;
        Float_ best_dist = std::numeric_limits<Float_>::infinity();
        const auto nitems = items.size();
        for (I<decltype(nitems)> i = 0; i < nitems; ++i) {
            const Float_ dist = distance(get_feature(items[i]), target);
            if (dist < best_dist) {
                best_dist = dist;
                best = i;
            }
        }
        return best;
    }

    std::size_t closest_child(const Node& current, const Feature& target) const {
        return closest(current.children, target, [&](NodeIndex child) -> const Feature& { return my_nodes[child].feature; });
    }

    std::size_t closest_entry(const Node& current, const Feature& target) const {
        return closest(current.entries, target, [](const Feature& entry) -> const Feature& { return entry; });
    }

private:
    /*
     * Classic BIRCH split: the farthest pair of items are used as seeds,
     * and every other item goes to the group of the closer seed.
     * The relative order of items is preserved within each group.
     */
    template<typename Item_, class Feature_>
    std::pair<std::vector<Item_>, std::vector<Item_> > partition(std::vector<Item_> items, Feature_ get_feature) const {
        const auto nitems = items.size();
        I<decltype(nitems)> seed1 = 0, seed2 = 1;
        Float_ farthest = -1;
        for (I<decltype(nitems)> i = 0; i < nitems; ++i) {
            const auto& ifeat = get_feature(items[i]);
            for (I<decltype(nitems)> j = i + 1; j < nitems; ++j) {
                const Float_ dist = distance(ifeat, get_feature(items[j]));
                if (dist > farthest) {
                    farthest = dist;
                    seed1 = i;
                    seed2 = j;
                }
            }
        }

        // Deciding membership before moving anything, as the seed features may live inside 'items'.
        std::vector<unsigned char> to_second(nitems);
        {
            const auto& feat1 = get_feature(items[seed1]);
            const auto& feat2 = get_feature(items[seed2]);
            for (I<decltype(nitems)> i = 0; i < nitems; ++i) {
                if (i == seed1) {
                    to_second[i] = 0;
                } else if (i == seed2) {
                    to_second[i] = 1;
                } else {
                    const auto& current = get_feature(items[i]);
                    to_second[i] = distance(current, feat1) > distance(current, feat2);
                }
            }
        }

        std::pair<std::vector<Item_>, std::vector<Item_> > output;
        for (I<decltype(nitems)> i = 0; i < nitems; ++i) {
            if (to_second[i]) {
                output.second.push_back(std::move(items[i]));
            } else {
                output.first.push_back(std::move(items[i]));
            }
        }

        return output;
    }

    NodeIndex split_leaf(const NodeIndex current) {
        auto groups = partition(std::move(my_nodes[current].entries), [](const Feature& entry) -> const Feature& { return entry; });

        const auto sibling = allocate_node(true); // invalidates all references into my_nodes.
        auto& left = my_nodes[current];
        auto& right = my_nodes[sibling];
        left.entries = std::move(groups.first);
        right.entries = std::move(groups.second);

        left.feature.clear();
        for (const auto& entry : left.entries) {
            left.feature.add(entry);
        }
        for (const auto& entry : right.entries) {
            right.feature.add(entry);
        }

        right.next_leaf = left.next_leaf;
        left.next_leaf = sibling;
        ++my_num_leaf_nodes;
        return sibling;
    }

    NodeIndex split_internal(const NodeIndex current) {
        auto groups = partition(std::move(my_nodes[current].children), [&](NodeIndex child) -> const Feature& { return my_nodes[child].feature; });

        const auto sibling = allocate_node(false);
        auto& left = my_nodes[current];
        auto& right = my_nodes[sibling];
        left.children = std::move(groups.first);
        right.children = std::move(groups.second);

        left.feature.clear();
        for (auto child : left.children) {
            left.feature.add(my_nodes[child].feature);
        }
        for (auto child : right.children) {
            right.feature.add(my_nodes[child].feature);
        }

        return sibling;
    }

    // Returns the index of the new sibling if 'current' was split, otherwise NONE.
    NodeIndex insert_into_leaf(const NodeIndex current, const Feature& incoming) {
        auto& node = my_nodes[current];
        node.feature.add(incoming);

        if (!node.entries.empty()) {
            auto& best = node.entries[closest_entry(node, incoming)];
            if (absorbs(best, incoming)) {
                best.add(incoming);
                return NONE;
            }
        }

        node.entries.push_back(incoming);
        ++my_num_leaves;
        if (node.entries.size() <= my_options.leaf_capacity) {
            return NONE;
        }
        return split_leaf(current);
    }

    NodeIndex insert_into(const NodeIndex current, const Feature& incoming) {
        if (my_nodes[current].leaf) {
            return insert_into_leaf(current, incoming);
        }

        const auto chosen = closest_child(my_nodes[current], incoming);
        const auto child = my_nodes[current].children[chosen];
        const auto sibling = insert_into(child, incoming);

        auto& node = my_nodes[current];
        node.feature.add(incoming);
        if (sibling == NONE) {
            return NONE;
        }

        node.children.insert(node.children.begin() + chosen + 1, sibling);
        if (node.children.size() <= my_options.branching_factor) {
            return NONE;
        }
        return split_internal(current);
    }

    void insert_without_rebuild(const Feature& incoming) {
        const auto sibling = insert_into(my_root, incoming);
        if (sibling == NONE) {
            return;
        }

        const auto old_root = my_root;
        const auto new_root = allocate_node(false);
        auto& top = my_nodes[new_root];
        top.children.push_back(old_root);
        top.children.push_back(sibling);
        top.feature.add(my_nodes[old_root].feature);
        top.feature.add(my_nodes[sibling].feature);
        my_root = new_root;
        ++my_height;
    }

private:
    std::vector<Feature> collect_entries() {
        std::vector<Feature> output;
        output.reserve(my_num_leaves);
        for (auto current = my_first_leaf; current != NONE; current = my_nodes[current].next_leaf) {
            for (auto& entry : my_nodes[current].entries) {
                output.push_back(std::move(entry));
            }
        }
        return output;
    }

    void nearest_merge_measures(const std::vector<Feature>& group, std::vector<Float_>& output) const {
        const auto ngroup = group.size();
        if (ngroup < 2) {
            return;
        }
        for (I<decltype(ngroup)> i = 0; i < ngroup; ++i) {
            Float_ best = std::numeric_limits<Float_>::infinity();
            for (I<decltype(ngroup)> j = 0; j < ngroup; ++j) {
                if (i != j) {
                    best = std::min(best, merged_measure(group[i], group[j]));
                }
            }
            output.push_back(best);
        }
    }

    /*
     * The new threshold is the median, across all leaf entries, of the
     * absorption criterion for merging each entry with its closest
     * neighbor in the same leaf node. This guarantees that roughly half of
     * the entries would have been absorbed at the new threshold.
     */
    Float_ estimate_threshold() const {
        std::vector<Float_> candidates;
        candidates.reserve(my_num_leaves);
        for (auto current = my_first_leaf; current != NONE; current = my_nodes[current].next_leaf) {
            nearest_merge_measures(my_nodes[current].entries, candidates);
        }

        if (candidates.empty()) { // e.g., leaf nodes with a single entry each.
            std::vector<Feature> everything;
            everything.reserve(my_num_leaves);
            for (auto current = my_first_leaf; current != NONE; current = my_nodes[current].next_leaf) {
                const auto& entries = my_nodes[current].entries;
                everything.insert(everything.end(), entries.begin(), entries.end());
            }
            nearest_merge_measures(everything, candidates);
        }

        Float_ proposed = 0;
        if (!candidates.empty()) {
            const auto mid = candidates.begin() + candidates.size() / 2;
            std::nth_element(candidates.begin(), mid, candidates.end());
            proposed = std::sqrt(*mid);
        }

        if (proposed > my_threshold) {
            return proposed;
        }
        if (my_threshold > 0) {
            return my_threshold * 2;
        }

        Float_ smallest = std::numeric_limits<Float_>::infinity();
        for (auto c : candidates) {
            if (c > 0) {
                smallest = std::min(smallest, c);
            }
        }
        return std::isfinite(smallest) ? std::sqrt(smallest) : my_threshold;
    }

    void reinsert(const std::vector<Feature>& entries) {
        reset();
        for (const auto& entry : entries) {
            insert_without_rebuild(entry);
        }
        ++my_num_rebuilds;
    }

    /*
     * Fallback when the threshold fails to reduce the tree: greedily merge
     * the closest pair of leaf entries until the capacity is respected. As
     * re-insertion can never increase the number of entries, the tree ends
     * up within capacity.
     */
    void coarsen() {
        auto entries = collect_entries();
        const auto original = entries.size();

        while (entries.size() > my_options.max_leaves) {
            const auto nentries = entries.size();
            I<decltype(nentries)> keep = 0, drop = 1;
            Float_ nearest = std::numeric_limits<Float_>::infinity();
            for (I<decltype(nentries)> i = 0; i < nentries; ++i) {
                for (I<decltype(nentries)> j = i + 1; j < nentries; ++j) {
                    const Float_ dist = distance(entries[i], entries[j]);
                    if (dist < nearest) {
                        nearest = dist;
                        keep = i;
                        drop = j;
                    }
                }
            }
            entries[keep].add(entries[drop]);
            entries.erase(entries.begin() + drop);
        }

        for (const auto& entry : entries) {
            my_threshold = std::max(my_threshold, std::sqrt(measure(entry)));
        }

        LOG(WARNING) << "forced coarsening of the CF-tree from " << original << " to " << entries.size() << " leaf entries, threshold is now " << my_threshold;
        reinsert(entries);
    }

    void rebuild() {
        int cycles = 0;
        while (my_num_leaves > my_options.max_leaves) {
            if (cycles >= my_options.max_rebuilds) {
                coarsen();
                break;
            }

            const auto new_threshold = estimate_threshold();
            VLOG(1) << "rebuilding CF-tree with " << my_num_leaves << " leaf entries, threshold " << my_threshold << " -> " << new_threshold;
            my_threshold = new_threshold;
            reinsert(collect_entries());
            ++cycles;
        }
    }

public:
    /**
     * Insert a CF into the tree, e.g., a summary of observations from another source.
     * This may trigger a rebuild of the tree if the total number of leaf entries exceeds `CFTreeOptions::max_leaves`.
     * Empty CFs are ignored.
     *
     * @param feature CF to insert, with dimensionality equal to `num_dimensions()`.
     */
    void insert(const Feature& feature) {
        if (feature.num_dimensions() != my_num_dim) {
            throw std::runtime_error("dimensionality of the CF (" + std::to_string(feature.num_dimensions()) + ") is not consistent with the tree (" + std::to_string(my_num_dim) + ")");
        }
        if (feature.empty()) {
            return;
        }

        insert_without_rebuild(feature);
        if (my_num_leaves > my_options.max_leaves) {
            rebuild();
        }
    }

    /**
     * Insert a single observation into the tree.
     *
     * @tparam Data_ Numeric type of the coordinates.
     * @param[in] point Pointer to an array of length `num_dims`, containing the coordinates of the observation.
     * @param num_dims Number of dimensions of the observation.
     * An error is raised if this is not equal to `num_dimensions()`.
     */
    template<typename Data_>
    void insert(const Data_* const point, const std::size_t num_dims) {
        if (num_dims != my_num_dim) {
            throw std::runtime_error("dimensionality of the observation (" + std::to_string(num_dims) + ") is not consistent with the tree (" + std::to_string(my_num_dim) + ")");
        }
        insert(Feature(my_num_dim, point));
    }

    /**
     * Find the leaf entry that is closest to a query observation, using the same greedy descent as insertion.
     * The tree is not modified.
     *
     * @tparam Data_ Numeric type of the coordinates.
     * @param[in] query Pointer to an array of length equal to `num_dimensions()`, containing the coordinates of the query.
     *
     * @return Reference to the closest leaf entry.
     * This is valid until the next insertion.
     */
    template<typename Data_>
    const Feature& find_leaf(const Data_* const query) const {
        if (my_num_leaves == 0) {
            throw std::runtime_error("cannot search an empty CF-tree");
        }

        const Feature target(my_num_dim, query);
        auto current = my_root;
        while (!my_nodes[current].leaf) {
            const auto& node = my_nodes[current];
            current = node.children[closest_child(node, target)];
        }

        const auto& node = my_nodes[current];
        return node.entries[closest_entry(node, target)];
    }

public:
    /**
     * @brief Forward iterator over the leaf entries.
     */
    class LeafIterator {
    public:
        /**
         * @cond
         */
        typedef std::forward_iterator_tag iterator_category;
        typedef Feature value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const Feature* pointer;
        typedef const Feature& reference;

        LeafIterator() = default;

        LeafIterator(const CFTree* tree, const NodeIndex start) : my_tree(tree), my_node(start) {
            skip_empty();
        }

        reference operator*() const {
            return my_tree->my_nodes[my_node].entries[my_entry];
        }

        pointer operator->() const {
            return &(**this);
        }

        LeafIterator& operator++() {
            ++my_entry;
            skip_empty();
            return *this;
        }

        LeafIterator operator++(int) {
            auto copy = *this;
            ++(*this);
            return copy;
        }

        bool operator==(const LeafIterator& other) const {
            return my_node == other.my_node && my_entry == other.my_entry;
        }

        bool operator!=(const LeafIterator& other) const {
            return !(*this == other);
        }
        /**
         * @endcond
         */

    private:
        const CFTree* my_tree = NULL;
        NodeIndex my_node = NONE;
        std::size_t my_entry = 0;

        void skip_empty() {
            while (my_node != NONE && my_entry >= my_tree->my_nodes[my_node].entries.size()) {
                my_node = my_tree->my_nodes[my_node].next_leaf;
                my_entry = 0;
            }
        }
    };

    /**
     * @brief Finite sequence of leaf entries in the order of the leaf chain.
     */
    class LeafSequence {
    public:
        /**
         * @cond
         */
        LeafSequence(const CFTree* tree) : my_tree(tree) {}
        /**
         * @endcond
         */

        /**
         * @return Iterator to the first leaf entry.
         */
        LeafIterator begin() const {
            return LeafIterator(my_tree, my_tree->my_first_leaf);
        }

        /**
         * @return Iterator past the last leaf entry.
         */
        LeafIterator end() const {
            return LeafIterator(my_tree, NONE);
        }

    private:
        const CFTree* my_tree;
    };

    /**
     * @return A new sequence over all leaf entries.
     * Each call creates a fresh traversal, which is invalidated by the next insertion.
     */
    LeafSequence leaves() const {
        return LeafSequence(this);
    }
};

}

#endif
