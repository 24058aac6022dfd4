#ifndef BIRCH_COMPUTE_VARIANCES_HPP
#define BIRCH_COMPUTE_VARIANCES_HPP

#include <algorithm>
#include <cstddef>
#include <vector>

#include "sanisizer/sanisizer.hpp"

#include "WeightedData.hpp"
#include "utils.hpp"

/**
 * @file compute_variances.hpp
 * @brief Compute within-cluster variances from aggregate statistics.
 */

namespace birch {

/**
 * Variance of a group of observations from its aggregate statistics,
 * defined as the mean squared Euclidean distance of the observations to their centroid.
 *
 * @tparam Float_ Floating-point type of the statistics.
 *
 * @param num_dimensions Number of dimensions.
 * @param[in] linear_sum Pointer to an array of length `num_dimensions`, containing the linear sum of the observations.
 * @param sum_of_squares Sum of the squared norms of the observations.
 * @param weight Total weight, i.e., number of observations.
 *
 * @return The variance, or zero if `weight` is not positive.
 */
template<typename Float_>
Float_ compute_variance(const std::size_t num_dimensions, const Float_* const linear_sum, const Float_ sum_of_squares, const Float_ weight) {
    if (!(weight > 0)) {
        return 0;
    }

    Float_ ls2 = 0;
    for (std::size_t d = 0; d < num_dimensions; ++d) {
        ls2 += linear_sum[d] * linear_sum[d];
    }

    const Float_ out = (sum_of_squares * weight - ls2) / (weight * weight);
    return std::max(out, static_cast<Float_>(0)); // protect against rounding for near-identical observations.
}

/**
 * Compute the variance of each cluster of pseudo-points from their aggregate statistics,
 * without any access to the original observations.
 *
 * @tparam Index_ Integer type of the pseudo-point indices.
 * @tparam Float_ Floating-point type of the statistics.
 * @tparam Cluster_ Integer type of the cluster assignments.
 *
 * @param data Weighted pseudo-points.
 * @param num_centers Number of clusters.
 * @param[in] clusters Pointer to an array of length equal to the number of pseudo-points, containing the cluster assignment for each pseudo-point.
 * @param[out] variances Pointer to an array of length equal to `num_centers`.
 * On output, this contains the variance of each cluster.
 * Empty clusters are assigned a variance of zero.
 */
template<typename Index_, typename Float_, typename Cluster_>
void compute_variances(const WeightedData<Index_, Float_>& data, const Cluster_ num_centers, const Cluster_* const clusters, Float_* const variances) {
    const auto npts = data.num_points();
    const auto ndim = data.num_dimensions();
    const auto linsum = data.linear_sums();
    const auto weights = data.weights();
    const auto sumsq = data.sums_of_squares();

    auto totals = sanisizer::create<std::vector<Float_> >(sanisizer::product<std::size_t>(ndim, num_centers));
    auto total_ss = sanisizer::create<std::vector<Float_> >(num_centers);
    auto total_weights = sanisizer::create<std::vector<Float_> >(num_centers);

    for (Index_ p = 0; p < npts; ++p) {
        const auto cen = clusters[p];
        const auto src = linsum + sanisizer::product_unsafe<std::size_t>(p, ndim);
        const auto dest = totals.data() + sanisizer::product_unsafe<std::size_t>(cen, ndim);
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            dest[d] += src[d];
        }
        total_ss[cen] += sumsq[p];
        total_weights[cen] += weights[p];
    }

    for (Cluster_ cen = 0; cen < num_centers; ++cen) {
        const auto ptr = totals.data() + sanisizer::product_unsafe<std::size_t>(cen, ndim);
        variances[cen] = compute_variance(ndim, ptr, total_ss[cen], total_weights[cen]);
    }
}

}

#endif
