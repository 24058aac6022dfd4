#ifndef BIRCH_WEIGHTED_DATA_HPP
#define BIRCH_WEIGHTED_DATA_HPP

#include <vector>
#include <cstddef>
#include <stdexcept>

#include "sanisizer/sanisizer.hpp"

#include "ClusteringFeature.hpp"
#include "CFTree.hpp"
#include "SimpleMatrix.hpp"
#include "utils.hpp"

/**
 * @file WeightedData.hpp
 * @brief Weighted pseudo-points for k-means.
 */

namespace birch {

/**
 * @brief Weighted pseudo-points summarizing groups of observations.
 *
 * Each pseudo-point is defined by the aggregate statistics of the observations that it represents,
 * i.e., its weight (number of observations), the linear sum of their coordinates and the sum of their squared norms.
 * Its position is the centroid, i.e., the linear sum divided by the weight.
 * All arrays are stored in a column-major layout where each column is a pseudo-point.
 *
 * @tparam Index_ Integer type of the pseudo-point indices.
 * @tparam Float_ Floating-point type of the statistics.
 */
template<typename Index_, typename Float_>
class WeightedData {
public:
    /**
     * @param num_dimensions Number of dimensions.
     * @param num_points Number of pseudo-points.
     * @param linear_sums Vector of length equal to the product of `num_dimensions` and `num_points`, containing the linear sum for each pseudo-point.
     * @param weights Vector of length equal to `num_points`, containing the positive weight of each pseudo-point.
     * @param sums_of_squares Vector of length equal to `num_points`, containing the sum of squared norms for each pseudo-point.
     */
    WeightedData(const std::size_t num_dimensions, const Index_ num_points, std::vector<Float_> linear_sums, std::vector<Float_> weights, std::vector<Float_> sums_of_squares) :
        my_num_dim(num_dimensions),
        my_num_points(num_points),
        my_linear_sums(std::move(linear_sums)),
        my_weights(std::move(weights)),
        my_sums_of_squares(std::move(sums_of_squares))
    {
        const auto expected = sanisizer::product<std::size_t>(my_num_dim, my_num_points);
        if (my_linear_sums.size() != expected) {
            throw std::runtime_error("length of 'linear_sums' should be equal to the product of the number of dimensions and points");
        }
        const auto npoints = sanisizer::cast<std::size_t>(my_num_points);
        if (my_weights.size() != npoints || my_sums_of_squares.size() != npoints) {
            throw std::runtime_error("length of 'weights' and 'sums_of_squares' should be equal to the number of points");
        }

        my_positions.resize(expected);
        for (Index_ p = 0; p < my_num_points; ++p) {
            const auto w = my_weights[p];
            if (!(w > 0)) {
                throw std::runtime_error("weights of pseudo-points should be positive");
            }
            const auto offset = sanisizer::product_unsafe<std::size_t>(p, my_num_dim);
            for (std::size_t d = 0; d < my_num_dim; ++d) {
                my_positions[offset + d] = my_linear_sums[offset + d] / w;
            }
        }
    }

    /**
     * @param num_dimensions Number of dimensions.
     * @param features Vector of non-empty CFs, each of which is converted into a pseudo-point.
     */
    WeightedData(const std::size_t num_dimensions, const std::vector<ClusteringFeature<Float_> >& features) :
        WeightedData(num_dimensions, features.begin(), features.end()) {}

    /**
     * @tparam Iterator_ Forward iterator over `ClusteringFeature` objects.
     * @param num_dimensions Number of dimensions.
     * @param begin Start of the range of non-empty CFs.
     * @param end End of the range.
     */
    template<class Iterator_>
    WeightedData(const std::size_t num_dimensions, Iterator_ begin, Iterator_ end) :
        WeightedData(collect(num_dimensions, begin, end)) {}

private:
    std::size_t my_num_dim;
    Index_ my_num_points;
    std::vector<Float_> my_linear_sums;
    std::vector<Float_> my_weights;
    std::vector<Float_> my_sums_of_squares;
    std::vector<Float_> my_positions;

    template<class Iterator_>
    static WeightedData collect(const std::size_t num_dimensions, Iterator_ begin, Iterator_ end) {
        std::vector<Float_> linear_sums, weights, sums_of_squares;
        for (; begin != end; ++begin) {
            const ClusteringFeature<Float_>& feature = *begin;
            if (feature.num_dimensions() != num_dimensions) {
                throw std::runtime_error("inconsistent dimensionality of the clustering features");
            }
            const auto& ls = feature.linear_sum();
            linear_sums.insert(linear_sums.end(), ls.begin(), ls.end());
            weights.push_back(feature.size());
            sums_of_squares.push_back(feature.sum_of_squares());
        }
        const auto npts = sanisizer::cast<Index_>(weights.size()); // before 'weights' is moved into the argument.
        return WeightedData(num_dimensions, npts, std::move(linear_sums), std::move(weights), std::move(sums_of_squares));
    }

public:
    /**
     * @return Number of dimensions.
     */
    std::size_t num_dimensions() const {
        return my_num_dim;
    }

    /**
     * @return Number of pseudo-points.
     */
    Index_ num_points() const {
        return my_num_points;
    }

    /**
     * @return Pointer to a column-major array of the positions (centroids) of the pseudo-points.
     */
    const Float_* positions() const {
        return my_positions.data();
    }

    /**
     * @return Pointer to a column-major array of the linear sums of the pseudo-points.
     */
    const Float_* linear_sums() const {
        return my_linear_sums.data();
    }

    /**
     * @return Pointer to an array of the weights of the pseudo-points.
     */
    const Float_* weights() const {
        return my_weights.data();
    }

    /**
     * @return Pointer to an array of the sums of squared norms of the pseudo-points.
     */
    const Float_* sums_of_squares() const {
        return my_sums_of_squares.data();
    }

    /**
     * @return A matrix of the pseudo-point positions, for use in `Initialize` classes.
     * This refers to memory owned by this object and should not outlive it.
     */
    SimpleMatrix<Index_, Float_> position_matrix() const {
        return SimpleMatrix<Index_, Float_>(my_num_dim, my_num_points, my_positions.data());
    }
};

/**
 * Extract the leaf entries of a `CFTree` as weighted pseudo-points, in the order of the leaf sequence.
 *
 * @tparam Index_ Integer type of the pseudo-point indices.
 * @tparam Float_ Floating-point type of the statistics.
 *
 * @param tree A CF-tree.
 * @return The weighted pseudo-points.
 */
template<typename Index_, typename Float_>
WeightedData<Index_, Float_> extract_leaves(const CFTree<Float_>& tree) {
    const auto seq = tree.leaves();
    return WeightedData<Index_, Float_>(tree.num_dimensions(), seq.begin(), seq.end());
}

}

#endif
