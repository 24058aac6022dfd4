#ifndef BIRCH_COMPUTE_WCSS_HPP
#define BIRCH_COMPUTE_WCSS_HPP

#include <algorithm>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "WeightedData.hpp"
#include "utils.hpp"

/**
 * @file compute_wcss.hpp
 * @brief Compute the weighted within-cluster sum of squares.
 */

namespace birch {

/**
 * Compute the weighted within-cluster sum of squares for each cluster,
 * i.e., the sum of the squared distances from the position of each pseudo-point to its cluster center, weighted by the pseudo-point's weight.
 * This is the objective that is minimized by `RefineLloyd`.
 *
 * @tparam Index_ Integer type of the pseudo-point indices.
 * @tparam Float_ Floating-point type of the statistics.
 * @tparam Cluster_ Integer type of the cluster assignments.
 *
 * @param data Weighted pseudo-points.
 * @param num_centers Number of cluster centers.
 * @param[in] centers Pointer to an array of length equal to the product of `num_centers` and `data.num_dimensions()`.
 * This contains a column-major matrix where rows correspond to dimensions and columns correspond to cluster centers.
 * @param[in] clusters Pointer to an array of length equal to the number of pseudo-points, containing the cluster assignment for each pseudo-point.
 * @param[out] wcss Pointer to an array of length equal to `num_centers`.
 * On output, this will contain the weighted within-cluster sum of squares.
 */
template<typename Index_, typename Float_, typename Cluster_>
void compute_wcss(const WeightedData<Index_, Float_>& data, const Cluster_ num_centers, const Float_* const centers, const Cluster_* const clusters, Float_* const wcss) {
    const auto npts = data.num_points();
    const auto ndim = data.num_dimensions();
    const auto positions = data.positions();
    const auto weights = data.weights();
    std::fill_n(wcss, num_centers, 0);

    for (Index_ p = 0; p < npts; ++p) {
        const auto cen = clusters[p];
        const auto curpos = positions + sanisizer::product_unsafe<std::size_t>(p, ndim);
        const auto curcenter = centers + sanisizer::product_unsafe<std::size_t>(cen, ndim);
        wcss[cen] += weights[p] * internal::squared_distance<Float_>(curpos, curcenter, ndim);
    }
}

}

#endif
