#ifndef BIRCH_BIRCH_HPP
#define BIRCH_BIRCH_HPP

#include <vector>
#include <unordered_map>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "glog/logging.h"
#include "sanisizer/sanisizer.hpp"

#include "Matrix.hpp"
#include "SimpleMatrix.hpp"
#include "ClusteringFeature.hpp"
#include "CFTree.hpp"
#include "WeightedData.hpp"
#include "Details.hpp"
#include "Initialize.hpp"
#include "Refine.hpp"
#include "WCluster.hpp"

#include "InitializeKmeanspp.hpp"
#include "InitializeRandom.hpp"
#include "RefineLloyd.hpp"

#include "compute_variances.hpp"
#include "compute_wcss.hpp"

/**
 * @file birch.hpp
 * @brief Perform BIRCH clustering with weighted k-means.
 */

/**
 * @namespace birch
 * @brief Perform BIRCH clustering with weighted k-means.
 */
namespace birch {

/**
 * @brief Results of BIRCH clustering.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the statistics.
 */
template<typename Index_, typename Cluster_, typename Float_>
struct Results {
    /**
     * Final clusters, one per requested center.
     * Members are the indices of the original observations.
     * Clusters may be empty if no observation has its nearest leaf entry in that cluster.
     */
    std::vector<WCluster<Index_, Float_> > clusters;

    /**
     * Cluster assignment for each original observation.
     */
    std::vector<Cluster_> assignments;

    /**
     * Clusters of the leaf entries from weighted k-means.
     * Members are the indices of the leaf entries in the order of `CFTree::leaves()`.
     */
    std::vector<WCluster<Index_, Float_> > leaf_clusters;

    /**
     * Further details from the weighted k-means refinement.
     */
    Details<Index_, Float_> details;

    /**
     * Number of leaf entries in the CF-tree, i.e., the number of weighted pseudo-points.
     */
    std::size_t num_leaves = 0;

    /**
     * Number of times that the CF-tree was rebuilt.
     */
    int num_rebuilds = 0;

    /**
     * Final absorption threshold of the CF-tree.
     */
    Float_ threshold = 0;
};

/**
 * Build a `CFTree` from a matrix of observations, by inserting each observation in order.
 *
 * @tparam Float_ Floating-point type of the CF statistics.
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 *
 * @param data A matrix containing data for each observation.
 * @param options Options for the tree.
 *
 * @return The CF-tree summarizing all observations.
 */
template<typename Float_, class Matrix_>
CFTree<Float_> build_tree(const Matrix_& data, const CFTreeOptions& options) {
    const auto nobs = data.num_observations();
    const auto ndim = data.num_dimensions();
    CFTree<Float_> tree(ndim, options);

    auto work = data.new_extractor(static_cast<I<decltype(nobs)> >(0), nobs);
    for (I<decltype(nobs)> obs = 0; obs < nobs; ++obs) {
        tree.insert(work->get_observation(), ndim);
    }
    return tree;
}

/**
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 * @tparam Index_ Integer type of the observation indices.
 * This should be the same as the index type of `Matrix_`.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the statistics and centroids.
 *
 * @param data A matrix containing data for each observation.
 * @param tree_options Options for the CF-tree.
 * @param initialize Initialization method, applied to the positions of the leaf entries.
 * @param refine Weighted refinement method, applied to the leaf entries.
 * @param num_centers Number of clusters, should be positive.
 * @param rng Random number generator for the initialization.
 *
 * @return Results of the clustering.
 * An error is raised for invalid parameters, or if an observation's nearest leaf entry is not assigned to any cluster.
 */
template<class Matrix_, typename Index_, typename Cluster_, typename Float_>
Results<Index_, Cluster_, Float_> compute(
    const Matrix_& data,
    const CFTreeOptions& tree_options,
    const Initialize<Index_, Float_, Cluster_, Float_>& initialize,
    const Refine<Index_, Cluster_, Float_>& refine,
    const Cluster_ num_centers,
    InitializeRng& rng)
{
    static_assert(std::is_same<Index<Matrix_>, Index_>::value);
    if (num_centers < 1) {
        throw std::runtime_error("number of clusters should be positive");
    }

    const auto nobs = data.num_observations();
    const auto ndim = data.num_dimensions();
    const auto tree = build_tree<Float_>(data, tree_options);

    Results<Index_, Cluster_, Float_> output;
    output.num_leaves = tree.num_leaves();
    output.num_rebuilds = tree.num_rebuilds();
    output.threshold = tree.threshold();
    if (nobs == 0) {
        return output;
    }

    // Clustering the leaf entries as weighted pseudo-points.
    const auto leaves = extract_leaves<Index_, Float_>(tree);
    const auto nleaves = leaves.num_points();
    auto centers = sanisizer::create<std::vector<Float_> >(sanisizer::product<std::size_t>(ndim, num_centers));
    auto leaf_assignments = sanisizer::create<std::vector<Cluster_> >(nleaves);

    const auto positions = leaves.position_matrix();
    const auto actual_centers = initialize.run(positions, num_centers, centers.data(), rng);
    output.details = refine.run(leaves, actual_centers, centers.data(), leaf_assignments.data());
    sanisizer::resize(output.details.sizes, num_centers); // restoring the full size.
    sanisizer::resize(output.details.weights, num_centers);

    auto variances = sanisizer::create<std::vector<Float_> >(num_centers);
    compute_variances(leaves, num_centers, leaf_assignments.data(), variances.data());

    output.leaf_clusters.reserve(num_centers);
    for (Cluster_ c = 0; c < num_centers; ++c) {
        ClusterModel<Float_> model;
        const auto start = centers.begin() + sanisizer::product_unsafe<std::size_t>(c, ndim);
        model.mean.insert(model.mean.end(), start, start + ndim);
        model.variance = variances[c];
        output.leaf_clusters.emplace_back(std::nullopt, std::vector<Index_>(), std::move(model));
    }
    for (Index_ l = 0; l < nleaves; ++l) {
        output.leaf_clusters[leaf_assignments[l]].members.push_back(l);
    }

    // The tree does not store the observations, so each observation is
    // re-assigned to the cluster owning its nearest leaf entry.
    std::unordered_map<const ClusteringFeature<Float_>*, Index_> leaf_ids;
    {
        Index_ counter = 0;
        for (const auto& leaf : tree.leaves()) {
            leaf_ids[&leaf] = counter;
            ++counter;
        }
    }

    output.clusters.reserve(num_centers);
    for (const auto& lc : output.leaf_clusters) {
        output.clusters.emplace_back(std::nullopt, std::vector<Index_>(), lc.model);
    }

    sanisizer::resize(output.assignments, nobs);
    auto work = data.new_extractor(static_cast<Index_>(0), nobs);
    for (Index_ obs = 0; obs < nobs; ++obs) {
        const auto& leaf = tree.find_leaf(work->get_observation());
        const auto found = leaf_ids.find(&leaf);
        if (found == leaf_ids.end()) {
            throw std::runtime_error("nearest leaf entry of observation " + std::to_string(obs) + " is not part of the leaf sequence");
        }

        const auto chosen = leaf_assignments[found->second];
        if (chosen < 0 || chosen >= num_centers) {
            throw std::runtime_error("nearest leaf entry of observation " + std::to_string(obs) + " is not owned by any cluster");
        }
        output.assignments[obs] = chosen;
        output.clusters[chosen].members.push_back(obs);
    }

    LOG(INFO) << "BIRCH assigned " << nobs << " observations to " << num_centers << " clusters from "
        << nleaves << " leaf entries (" << output.num_rebuilds << " rebuilds, threshold " << output.threshold << "), "
        << "k-means finished after " << output.details.iterations << " iterations with status " << output.details.status;
    return output;
}

/**
 * Overload of `compute()` that creates the random number generator from a seed.
 *
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the statistics and centroids.
 *
 * @param data A matrix containing data for each observation.
 * @param tree_options Options for the CF-tree.
 * @param initialize Initialization method, applied to the positions of the leaf entries.
 * @param refine Weighted refinement method, applied to the leaf entries.
 * @param num_centers Number of clusters, should be positive.
 * @param seed Seed for the random number generator.
 *
 * @return Results of the clustering.
 */
template<class Matrix_, typename Index_, typename Cluster_, typename Float_>
Results<Index_, Cluster_, Float_> compute(
    const Matrix_& data,
    const CFTreeOptions& tree_options,
    const Initialize<Index_, Float_, Cluster_, Float_>& initialize,
    const Refine<Index_, Cluster_, Float_>& refine,
    const Cluster_ num_centers,
    const typename InitializeRng::result_type seed)
{
    InitializeRng rng(seed);
    return compute(data, tree_options, initialize, refine, num_centers, rng);
}

}

#endif
