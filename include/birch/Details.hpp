#ifndef BIRCH_DETAILS_HPP
#define BIRCH_DETAILS_HPP

#include <vector>

/**
 * @file Details.hpp
 *
 * @brief Report detailed clustering statistics.
 */

namespace birch {

/**
 * @brief Additional statistics from the weighted k-means algorithm.
 *
 * @tparam Index_ Integer type of the pseudo-point indices.
 * @tparam Float_ Floating-point type of the weights.
 */
template<typename Index_, typename Float_>
struct Details {
    /**
     * @cond
     */
    Details() = default;

    Details(std::vector<Index_> sizes, std::vector<Float_> weights, const int iterations, const int status) :
        sizes(std::move(sizes)), weights(std::move(weights)), iterations(iterations), status(status) {}
    /**
     * @endcond
     */

    /**
     * The number of pseudo-points in each cluster.
     * Some clusters may be empty, e.g., when there are more requested centers than pseudo-points.
     */
    std::vector<Index_> sizes;

    /**
     * The total weight of each cluster, i.e., the number of original observations represented by its pseudo-points.
     */
    std::vector<Float_> weights;

    /**
     * The number of iterations that were performed.
     * This can be interpreted as the number of iterations to convergence if `Details::status == 0`.
     */
    int iterations = 0;

    /**
     * The status of the algorithm on completion.
     * A value of 0 indicates that the algorithm converged, i.e., an iteration completed without any reassignments.
     * A value of 2 indicates that the maximum number of iterations was reached without convergence.
     * Both are successful completions.
     */
    int status = 0;

    /**
     * Number of reassigned pseudo-points in each iteration.
     * The last entry is zero if the algorithm converged.
     */
    std::vector<Index_> reassignments;
};

}

#endif
