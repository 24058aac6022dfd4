#ifndef BIRCH_REFINE_LLOYD_HPP
#define BIRCH_REFINE_LLOYD_HPP

#include <vector>
#include <algorithm>
#include <limits>
#include <stdexcept>

#include "glog/logging.h"
#include "sanisizer/sanisizer.hpp"

#include "Refine.hpp"
#include "Details.hpp"
#include "WeightedData.hpp"
#include "compute_centroids.hpp"
#include "parallelize.hpp"
#include "utils.hpp"

/**
 * @file RefineLloyd.hpp
 *
 * @brief Implements the weighted Lloyd algorithm for k-means clustering.
 */

namespace birch {

/**
 * @brief Options for `RefineLloyd`.
 */
struct RefineLloydOptions {
    /**
     * Maximum number of iterations.
     * More iterations increase the opportunity for convergence at the cost of more computational time.
     * A value of zero means that there is no limit.
     * The default is capped at 100 rather than unlimited, so set this to zero to iterate until convergence.
     */
    int max_iterations = 100;

    /**
     * Number of threads to use.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;
};

/**
 * @cond
 */
namespace RefineLloyd_internal {

template<typename Cluster_, typename Float_>
Cluster_ find_closest(const Float_* const position, const std::size_t ndim, const Cluster_ ncenters, const Float_* const centers) {
    Cluster_ best = 0;
    Float_ best_dist = std::numeric_limits<Float_>::infinity();
    const Float_* current = centers;
    for (Cluster_ cen = 0; cen < ncenters; ++cen, current += ndim) {
        const auto dist = internal::squared_distance<Float_>(position, current, ndim);
        if (dist < best_dist) {
            best_dist = dist;
            best = cen;
        }
    }
    return best;
}

template<typename Index_, typename Float_, typename Cluster_>
Details<Index_, Float_> summarize(const WeightedData<Index_, Float_>& data, const Cluster_ ncenters, const Cluster_* const clusters, const int iterations, const int status) {
    auto sizes = sanisizer::create<std::vector<Index_> >(ncenters);
    auto weights = sanisizer::create<std::vector<Float_> >(ncenters);
    const auto npts = data.num_points();
    const auto wptr = data.weights();
    for (Index_ p = 0; p < npts; ++p) {
        ++sizes[clusters[p]];
        weights[clusters[p]] += wptr[p];
    }
    return Details<Index_, Float_>(std::move(sizes), std::move(weights), iterations, status);
}

}
/**
 * @endcond
 */

/**
 * @brief Implements the weighted Lloyd algorithm for k-means clustering.
 *
 * Each weighted pseudo-point is assigned to the cluster with the closest center, based on the squared Euclidean distance from the pseudo-point's position.
 * Once all pseudo-points are assigned, each center is recomputed as the weighted centroid of its members,
 * i.e., the sum of the member linear sums divided by the sum of the member weights.
 * This is equivalent to computing the centroid of all original observations represented by the members.
 * The first iteration uses the supplied initial centers directly.
 * Iterations are repeated until there are no reassignments or the maximum number of iterations is reached.
 *
 * If a cluster has no members after an iteration, its center is not changed, and it may acquire members again in later iterations.
 *
 * In the `Details::status` returned by `run()`, the status code is either 0 (converged) or 2 (maximum iterations reached without convergence).
 *
 * @tparam Index_ Integer type of the pseudo-point indices.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the statistics and centroids.
 *
 * @see
 * Lloyd, S. P. (1982).
 * Least squares quantization in PCM.
 * _IEEE Transactions on Information Theory_ 28, 128-137.
 */
template<typename Index_, typename Cluster_, typename Float_>
class RefineLloyd final : public Refine<Index_, Cluster_, Float_> {
private:
    RefineLloydOptions my_options;

public:
    /**
     * @param options Further options to the Lloyd algorithm.
     */
    RefineLloyd(RefineLloydOptions options) : my_options(std::move(options)) {}

    /**
     * Default constructor.
     */
    RefineLloyd() = default;

public:
    /**
     * @return Options for Lloyd clustering.
     * This can be modified prior to calling `run()`.
     */
    RefineLloydOptions& get_options() {
        return my_options;
    }

public:
    /**
     * @cond
     */
    Details<Index_, Float_> run(const WeightedData<Index_, Float_>& data, const Cluster_ ncenters, Float_* const centers, Cluster_* const clusters) const {
        if (my_options.max_iterations < 0) {
            throw std::runtime_error("maximum number of iterations should be non-negative");
        }

        const auto npts = data.num_points();
        const auto ndim = data.num_dimensions();
        if (ncenters <= 0) {
            return Details<Index_, Float_>({}, {}, 0, 0);
        }
        if (npts == 0) {
            return RefineLloyd_internal::summarize(data, ncenters, clusters, 0, 0);
        }

        if (ncenters == 1) {
            // Single cluster containing everything, so one assignment is enough.
            std::fill_n(clusters, npts, 0);
            internal::compute_centroids(data, ncenters, centers, clusters);
            return RefineLloyd_internal::summarize(data, ncenters, clusters, 1, 0);
        }

        if (sanisizer::is_greater_than_or_equal(ncenters, npts)) {
            // Each pseudo-point is its own cluster, the remaining clusters are empty.
            for (Index_ p = 0; p < npts; ++p) {
                clusters[p] = p;
            }
            std::copy_n(data.positions(), sanisizer::product_unsafe<std::size_t>(ndim, npts), centers);
            return RefineLloyd_internal::summarize(data, ncenters, clusters, 1, 0);
        }

        const int max_iter = (my_options.max_iterations > 0 ? my_options.max_iterations : std::numeric_limits<int>::max());
        auto copy = sanisizer::create<std::vector<Cluster_> >(npts);
        std::fill_n(clusters, npts, ncenters); // out-of-range, so every pseudo-point counts as reassigned in the first iteration.
        std::vector<Float_> totals, cluster_weights;
        const auto positions = data.positions();

        std::vector<Index_> reassignments;
        int iter = 0;
        for (; iter < max_iter; ++iter) {
            parallelize(my_options.num_threads, npts, [&](const int, const Index_ start, const Index_ length) -> void {
                for (Index_ p = start, end = start + length; p < end; ++p) {
                    const auto curpos = positions + sanisizer::product_unsafe<std::size_t>(p, ndim);
                    copy[p] = RefineLloyd_internal::find_closest(curpos, ndim, ncenters, centers);
                }
            });

            Index_ changed = 0;
            for (Index_ p = 0; p < npts; ++p) {
                changed += (copy[p] != clusters[p]);
            }
            reassignments.push_back(changed);
            VLOG(2) << "weighted Lloyd iteration " << iter + 1 << ": " << changed << " reassignments";
            if (changed == 0) {
                break;
            }

            std::copy(copy.begin(), copy.end(), clusters);
            internal::compute_centroids(data, ncenters, centers, clusters, totals, cluster_weights);
        }

        int status = 0;
        if (iter == max_iter) {
            status = 2;
        } else {
            ++iter; // make it 1-based.
        }

        VLOG(1) << "weighted Lloyd finished after " << iter << " iterations with status " << status;
        auto output = RefineLloyd_internal::summarize(data, ncenters, clusters, iter, status);
        output.reassignments.swap(reassignments);
        return output;
    }
    /**
     * @endcond
     */
};

}

#endif
