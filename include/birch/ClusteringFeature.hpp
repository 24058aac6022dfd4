#ifndef BIRCH_CLUSTERING_FEATURE_HPP
#define BIRCH_CLUSTERING_FEATURE_HPP

#include <vector>
#include <cstddef>
#include <algorithm>

#include "sanisizer/sanisizer.hpp"

#include "utils.hpp"

/**
 * @file ClusteringFeature.hpp
 * @brief Sufficient statistics for a set of observations.
 */

namespace birch {

/**
 * @cond
 */
namespace internal {

// Rounding can push these slightly below zero when all observations are (nearly) identical.
template<typename Float_>
Float_ squared_radius(const std::size_t n, const Float_ ss, const Float_ ls2) {
    const Float_ out = (ss - ls2 / n) / n;
    return std::max(out, static_cast<Float_>(0));
}

template<typename Float_>
Float_ squared_diameter(const std::size_t n, const Float_ ss, const Float_ ls2) {
    if (n <= 1) {
        return 0;
    }
    const Float_ nf = n;
    const Float_ out = (2 * nf * ss - 2 * ls2) / (nf * (nf - 1));
    return std::max(out, static_cast<Float_>(0));
}

}
/**
 * @endcond
 */

/**
 * @brief Clustering feature of a set of observations.
 *
 * A clustering feature (CF) summarizes a bag of observations by the number of observations,
 * the sum of their coordinates in each dimension (the linear sum) and the sum of their squared norms.
 * CFs are additive, i.e., the CF of the union of two disjoint sets is the sum of the CFs of each set.
 * This means that the centroid, radius and diameter of any union can be computed without revisiting the observations.
 *
 * @tparam Float_ Floating-point type of the statistics.
 *
 * @see
 * Zhang, T., Ramakrishnan, R. and Livny, M. (1996).
 * BIRCH: an efficient data clustering method for very large databases.
 * _Proceedings of the 1996 ACM SIGMOD International Conference on Management of Data_, 103-114.
 */
template<typename Float_ = double>
class ClusteringFeature {
public:
    /**
     * @param num_dimensions Number of dimensions.
     * This creates an empty CF.
     */
    ClusteringFeature(const std::size_t num_dimensions) : my_linear_sum(sanisizer::cast<I<decltype(my_linear_sum.size())> >(num_dimensions)) {}

    /**
     * @tparam Data_ Numeric type of the coordinates.
     * @param num_dimensions Number of dimensions.
     * @param[in] point Pointer to an array of length `num_dimensions`, containing the coordinates of a single observation.
     * This creates a CF that summarizes only this observation.
     */
    template<typename Data_>
    ClusteringFeature(const std::size_t num_dimensions, const Data_* const point) : ClusteringFeature(num_dimensions) {
        add_point(point);
    }

    /**
     * @cond
     */
    ClusteringFeature() = default;
    /**
     * @endcond
     */

private:
    std::size_t my_size = 0;
    std::vector<Float_> my_linear_sum;
    Float_ my_sum_of_squares = 0;

public:
    /**
     * @return Number of observations summarized by this CF.
     */
    std::size_t size() const {
        return my_size;
    }

    /**
     * @return Number of dimensions.
     */
    std::size_t num_dimensions() const {
        return my_linear_sum.size();
    }

    /**
     * @return Whether no observations have been added.
     */
    bool empty() const {
        return my_size == 0;
    }

    /**
     * @return Sum of the coordinates of all summarized observations, in each dimension.
     */
    const std::vector<Float_>& linear_sum() const {
        return my_linear_sum;
    }

    /**
     * @return Sum of the squared Euclidean norms of all summarized observations.
     */
    Float_ sum_of_squares() const {
        return my_sum_of_squares;
    }

    /**
     * @param d Dimension index.
     * @return Coordinate of the centroid in dimension `d`.
     * This is undefined if `empty()` is true.
     */
    Float_ centroid(const std::size_t d) const {
        return my_linear_sum[d] / my_size;
    }

    /**
     * @param[out] output Pointer to an array of length `num_dimensions()`.
     * On output, this contains the centroid of the summarized observations.
     */
    void compute_centroid(Float_* const output) const {
        const auto ndim = num_dimensions();
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            output[d] = centroid(d);
        }
    }

    /**
     * @return Vector containing the centroid.
     */
    std::vector<Float_> centroid() const {
        std::vector<Float_> output(num_dimensions());
        compute_centroid(output.data());
        return output;
    }

public:
    /**
     * Add a single observation to this CF.
     *
     * @tparam Data_ Numeric type of the coordinates.
     * @param[in] point Pointer to an array of length `num_dimensions()`.
     */
    template<typename Data_>
    void add_point(const Data_* const point) {
        const auto ndim = num_dimensions();
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            const Float_ val = point[d];
            my_linear_sum[d] += val;
            my_sum_of_squares += val * val;
        }
        ++my_size;
    }

    /**
     * Merge another CF into this one.
     * The two CFs should summarize disjoint sets of observations with the same dimensionality.
     *
     * @param other The other CF.
     */
    void add(const ClusteringFeature& other) {
        const auto ndim = num_dimensions();
        for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
            my_linear_sum[d] += other.my_linear_sum[d];
        }
        my_sum_of_squares += other.my_sum_of_squares;
        my_size += other.my_size;
    }

    /**
     * Reset to an empty CF, keeping the dimensionality.
     */
    void clear() {
        std::fill(my_linear_sum.begin(), my_linear_sum.end(), 0);
        my_sum_of_squares = 0;
        my_size = 0;
    }

public:
    /**
     * @return Squared radius, i.e., the mean squared distance of the summarized observations to their centroid.
     * This is zero for empty CFs.
     */
    Float_ squared_radius() const {
        if (my_size == 0) {
            return 0;
        }
        return internal::squared_radius<Float_>(my_size, my_sum_of_squares, squared_norm(my_linear_sum));
    }

    /**
     * @return Squared diameter, i.e., the mean squared distance between all pairs of summarized observations.
     * This is zero if fewer than two observations are present.
     */
    Float_ squared_diameter() const {
        return internal::squared_diameter<Float_>(my_size, my_sum_of_squares, squared_norm(my_linear_sum));
    }

    /**
     * @cond
     */
    static Float_ squared_norm(const std::vector<Float_>& vec) {
        Float_ output = 0;
        for (auto v : vec) {
            output += v * v;
        }
        return output;
    }
    /**
     * @endcond
     */
};

/**
 * @cond
 */
namespace internal {

template<typename Float_>
Float_ merged_squared_norm(const ClusteringFeature<Float_>& left, const ClusteringFeature<Float_>& right) {
    const auto& lls = left.linear_sum();
    const auto& rls = right.linear_sum();
    const auto ndim = lls.size();
    Float_ output = 0;
    for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
        const Float_ val = lls[d] + rls[d];
        output += val * val;
    }
    return output;
}

}
/**
 * @endcond
 */

/**
 * @tparam Float_ Floating-point type of the statistics.
 * @param left A non-empty CF.
 * @param right Another non-empty CF with the same dimensionality.
 * @return Squared Euclidean distance between the centroids of `left` and `right`.
 */
template<typename Float_>
Float_ squared_centroid_distance(const ClusteringFeature<Float_>& left, const ClusteringFeature<Float_>& right) {
    const auto& lls = left.linear_sum();
    const auto& rls = right.linear_sum();
    const auto ndim = lls.size();
    const Float_ ln = left.size(), rn = right.size();
    Float_ output = 0;
    for (I<decltype(ndim)> d = 0; d < ndim; ++d) {
        const Float_ delta = lls[d] / ln - rls[d] / rn;
        output += delta * delta;
    }
    return output;
}

/**
 * Increase in the sum of squared deviations from the centroid when `left` and `right` are merged, a.k.a. Ward's criterion.
 *
 * @tparam Float_ Floating-point type of the statistics.
 * @param left A non-empty CF.
 * @param right Another non-empty CF with the same dimensionality.
 * @return Variance increase from merging.
 */
template<typename Float_>
Float_ variance_increase(const ClusteringFeature<Float_>& left, const ClusteringFeature<Float_>& right) {
    const Float_ ln = left.size(), rn = right.size();
    return (ln * rn) / (ln + rn) * squared_centroid_distance(left, right);
}

/**
 * @tparam Float_ Floating-point type of the statistics.
 * @param left A CF.
 * @param right Another CF with the same dimensionality.
 * @return Squared radius of the CF that would be obtained by merging `left` and `right`.
 */
template<typename Float_>
Float_ merged_squared_radius(const ClusteringFeature<Float_>& left, const ClusteringFeature<Float_>& right) {
    const auto n = left.size() + right.size();
    if (n == 0) {
        return 0;
    }
    return internal::squared_radius<Float_>(n, left.sum_of_squares() + right.sum_of_squares(), internal::merged_squared_norm(left, right));
}

/**
 * @tparam Float_ Floating-point type of the statistics.
 * @param left A CF.
 * @param right Another CF with the same dimensionality.
 * @return Squared diameter of the CF that would be obtained by merging `left` and `right`.
 */
template<typename Float_>
Float_ merged_squared_diameter(const ClusteringFeature<Float_>& left, const ClusteringFeature<Float_>& right) {
    return internal::squared_diameter<Float_>(left.size() + right.size(), left.sum_of_squares() + right.sum_of_squares(), internal::merged_squared_norm(left, right));
}

}

#endif
