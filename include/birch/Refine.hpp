#ifndef BIRCH_REFINE_HPP
#define BIRCH_REFINE_HPP

#include "Details.hpp"
#include "WeightedData.hpp"

/**
 * @file Refine.hpp
 * @brief Interface for weighted k-means refinement.
 */

namespace birch {

/**
 * @brief Interface for weighted k-means refinement algorithms.
 *
 * Refinement operates on weighted pseudo-points, see `WeightedData`.
 * Each pseudo-point is assigned to a cluster based on its position,
 * while the cluster centers are computed from the aggregate statistics so that each pseudo-point contributes in proportion to its weight.
 *
 * @tparam Index_ Integer type of the pseudo-point indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the statistics and centroids.
 */
template<typename Index_, typename Cluster_, typename Float_>
class Refine {
public:
    /**
     * @cond
     */
    Refine() = default;
    Refine(Refine&&) = default;
    Refine(const Refine&) = default;
    Refine& operator=(Refine&&) = default;
    Refine& operator=(const Refine&) = default;
    virtual ~Refine() = default;
    /**
     * @endcond
     */

    /**
     * @param data Weighted pseudo-points.
     * @param num_centers Number of cluster centers.
     * @param[in, out] centers Pointer to an array of length equal to the product of `num_centers` and `data.num_dimensions()`.
     * This contains a column-major matrix where rows correspond to dimensions and columns correspond to cluster centers.
     * On input, column `j` should contain the initial centroid location for cluster `j`.
     * On output, each column will contain the final weighted centroid of its cluster.
     * @param[out] clusters Pointer to an array of length equal to the number of pseudo-points.
     * On output, this will contain the 0-based cluster assignment for each pseudo-point.
     *
     * @return `centers` and `clusters` are filled, and an object is returned containing clustering statistics.
     */
    virtual Details<Index_, Float_> run(const WeightedData<Index_, Float_>& data, Cluster_ num_centers, Float_* centers, Cluster_* clusters) const = 0;
};

}

#endif
