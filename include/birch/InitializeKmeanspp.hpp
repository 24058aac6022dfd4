#ifndef BIRCH_INITIALIZE_KMEANSPP_HPP
#define BIRCH_INITIALIZE_KMEANSPP_HPP

#include <vector>
#include <random>
#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "glog/logging.h"
#include "sanisizer/sanisizer.hpp"
#include "aarand/aarand.hpp"

#include "Initialize.hpp"
#include "Matrix.hpp"
#include "copy_into_array.hpp"
#include "parallelize.hpp"
#include "utils.hpp"

/**
 * @file InitializeKmeanspp.hpp
 *
 * @brief Class for kmeans++ initialization.
 */

namespace birch {

/**
 * @brief Options for `InitializeKmeanspp`.
 */
struct InitializeKmeansppOptions {
    /**
     * Random seed to use to construct the PRNG, when no generator is supplied to `InitializeKmeanspp::run()`.
     */
    typename InitializeRng::result_type seed = sanisizer::cap<typename InitializeRng::result_type>(6523);

    /**
     * Number of threads to use.
     * The parallelization scheme is defined by `parallelize()`.
     */
    int num_threads = 1;
};

/**
 * @cond
 */
namespace InitializeKmeanspp_internal {

template<typename Float_, typename Index_, class Engine_>
Index_ weighted_sample(const std::vector<Float_>& cumulative, const std::vector<Float_>& mindist, const Index_ nobs, Engine_& eng) {
    const auto total = cumulative.back();
    Index_ chosen_id = 0;

    // Resampling if we land on a zero-weight observation, which can happen
    // with a sampled weight of zero or with ties due to limited precision.
    do {
        const Float_ sampled_weight = total * aarand::standard_uniform<Float_>(eng);
        chosen_id = std::lower_bound(cumulative.begin(), cumulative.end(), sampled_weight) - cumulative.begin();
    } while (chosen_id == nobs || mindist[chosen_id] == 0);

    return chosen_id;
}

template<typename Index_, typename Float_, class Matrix_, typename Cluster_>
std::vector<Index_> run_kmeanspp(const Matrix_& data, const Cluster_ ncenters, InitializeRng& eng, const int nthreads) {
    const auto nobs = data.num_observations();
    const auto ndim = data.num_dimensions();
    std::vector<Index_> sofar;
    if (nobs == 0) {
        return sofar;
    }

    // All distances start at 1 so that the first center is chosen uniformly.
    auto mindist = sanisizer::create<std::vector<Float_> >(nobs, 1);
    auto cumulative = sanisizer::create<std::vector<Float_> >(nobs);
    sanisizer::can_ptrdiff<I<decltype(cumulative.begin())> >(nobs); // for the iterator arithmetic in weighted_sample().
    sofar.reserve(ncenters);

    auto last_work = data.new_extractor();
    for (Cluster_ cen = 0; cen < ncenters; ++cen) {
        if (!sofar.empty()) {
            const auto last_ptr = last_work->get_observation(sofar.back());

            parallelize(nthreads, nobs, [&](const int, const Index_ start, const Index_ length) -> void {
                auto curwork = data.new_extractor(start, length);
                for (Index_ obs = start, end = start + length; obs < end; ++obs) {
                    const auto current = curwork->get_observation(); // must be called in every iteration for consecutive access.
                    if (mindist[obs] == 0) {
                        continue;
                    }

                    const auto r2 = internal::squared_distance<Float_>(current, last_ptr, ndim);
                    if (cen == 1 || r2 < mindist[obs]) {
                        mindist[obs] = r2;
                    }
                }
            });
        }

        cumulative[0] = mindist[0];
        for (Index_ i = 1; i < nobs; ++i) {
            cumulative[i] = cumulative[i-1] + mindist[i];
        }

        const auto total = cumulative.back();
        if (!std::isfinite(total)) {
            throw std::runtime_error("could not choose a reasonable mean, the sum of squared distances is not finite");
        }

        if (total == 0) {
            // Only duplicates of existing centers are left, so any choice is as good as another.
            LOG(WARNING) << "only " << sofar.size() << " distinct positions available for " << ncenters << " centers, filling the remainder with duplicates";
            while (sanisizer::is_greater_than_or_equal(ncenters, sofar.size() + 1)) {
                sofar.push_back(aarand::discrete_uniform(eng, nobs));
            }
            break;
        }

        const auto chosen_id = weighted_sample(cumulative, mindist, nobs, eng);
        mindist[chosen_id] = 0;
        sofar.push_back(chosen_id);
    }

    return sofar;
}

}
/**
 * @endcond
 */

/**
 * @brief **k-means++** initialization of Arthur and Vassilvitskii (2007).
 *
 * Selection of starting points is performed via iterations of weighted sampling,
 * where the sampling probability for each point is proportional to the squared distance to the closest starting point that was chosen in any of the previous iterations.
 * The first starting point is chosen uniformly.
 *
 * When applied to the weighted pseudo-points from a `CFTree`, sampling is based on the positions only.
 * If all remaining positions coincide with an existing starting point, the remaining starting points are sampled uniformly,
 * such that this class always fills all of the requested centers when there is at least one observation.
 *
 * @tparam Index_ Integer type of the observation indices.
 * This should be the same as the index type of `Matrix_`.
 * @tparam Data_ Numeric type of the input dataset.
 * This should be the same as the data type of `Matrix_`.
 * @tparam Cluster_ Integer type of the cluster assignments.
 * @tparam Float_ Floating-point type of the centroids.
 * @tparam Matrix_ Class satisfying the `Matrix` interface.
 *
 * @see
 * Arthur, D. and Vassilvitskii, S. (2007).
 * k-means++: the advantages of careful seeding.
 * _Proceedings of the eighteenth annual ACM-SIAM symposium on Discrete algorithms_, 1027-1035.
 */
template<typename Index_, typename Data_, typename Cluster_, typename Float_, class Matrix_ = Matrix<Index_, Data_> >
class InitializeKmeanspp final : public Initialize<Index_, Data_, Cluster_, Float_, Matrix_> {
private:
    InitializeKmeansppOptions my_options;

public:
    /**
     * @param options Options for kmeans++ initialization.
     */
    InitializeKmeanspp(InitializeKmeansppOptions options) : my_options(std::move(options)) {}

    /**
     * Default constructor.
     */
    InitializeKmeanspp() = default;

public:
    /**
     * @return Options for kmeans++ partitioning.
     * This can be modified prior to calling `run()`.
     */
    InitializeKmeansppOptions& get_options() {
        return my_options;
    }

public:
    /**
     * @cond
     */
    Cluster_ run(const Matrix_& matrix, const Cluster_ ncenters, Float_* const centers, InitializeRng& rng) const {
        const auto sofar = InitializeKmeanspp_internal::run_kmeanspp<Index_, Float_>(matrix, ncenters, rng, my_options.num_threads);
        internal::copy_into_array(matrix, sofar, centers);
        return sofar.size();
    }
    /**
     * @endcond
     */

    /**
     * Overload of `run()` that creates a generator from `InitializeKmeansppOptions::seed`.
     *
     * @param matrix A matrix containing data for each observation.
     * @param ncenters Number of cluster centers.
     * @param[out] centers Pointer to an array of length equal to the product of `ncenters` and `matrix.num_dimensions()`.
     *
     * @return Number of filled centers.
     */
    Cluster_ run(const Matrix_& matrix, const Cluster_ ncenters, Float_* const centers) const {
        InitializeRng rng(my_options.seed);
        return run(matrix, ncenters, centers, rng);
    }
};

}

#endif
