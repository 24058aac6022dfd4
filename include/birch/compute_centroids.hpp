#ifndef BIRCH_COMPUTE_CENTROIDS_HPP
#define BIRCH_COMPUTE_CENTROIDS_HPP

#include <algorithm>
#include <cstddef>
#include <vector>

#include "sanisizer/sanisizer.hpp"

#include "WeightedData.hpp"
#include "utils.hpp"

namespace birch {

namespace internal {

/*
 * Each center is the sum of the member linear sums divided by the sum of the
 * member weights. Centers of empty clusters are left as-is.
 */
template<typename Index_, typename Float_, typename Cluster_>
void compute_centroids(
    const WeightedData<Index_, Float_>& data,
    const Cluster_ ncenters,
    Float_* const centers,
    const Cluster_* const clusters,
    std::vector<Float_>& totals,
    std::vector<Float_>& cluster_weights)
{
    const auto npts = data.num_points();
    const auto ndim = data.num_dimensions();
    const auto linsum = data.linear_sums();
    const auto weights = data.weights();

    totals.resize(sanisizer::product<std::size_t>(ndim, ncenters));
    std::fill(totals.begin(), totals.end(), 0);
    sanisizer::resize(cluster_weights, ncenters);
    std::fill(cluster_weights.begin(), cluster_weights.end(), 0);

    for (Index_ p = 0; p < npts; ++p) {
        const auto cen = clusters[p];
        const auto src = linsum + sanisizer::product_unsafe<std::size_t>(p, ndim);
        const auto dest = totals.data() + sanisizer::product_unsafe<std::size_t>(cen, ndim);
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            dest[d] += src[d];
        }
        cluster_weights[cen] += weights[p];
    }

    for (Cluster_ cen = 0; cen < ncenters; ++cen) {
        const auto w = cluster_weights[cen];
        if (w > 0) {
            for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
                const auto offset = sanisizer::nd_offset<std::size_t>(d, ndim, cen);
                centers[offset] = totals[offset] / w;
            }
        }
    }
}

template<typename Index_, typename Float_, typename Cluster_>
void compute_centroids(const WeightedData<Index_, Float_>& data, const Cluster_ ncenters, Float_* const centers, const Cluster_* const clusters) {
    std::vector<Float_> totals, cluster_weights;
    compute_centroids(data, ncenters, centers, clusters, totals, cluster_weights);
}

}

}

#endif
