#ifndef BIRCH_SIMPLE_MATRIX_HPP
#define BIRCH_SIMPLE_MATRIX_HPP

#include <cstddef>
#include <memory>

#include "sanisizer/sanisizer.hpp"

#include "Matrix.hpp"

/**
 * @file SimpleMatrix.hpp
 * @brief Wrapper for a dense array of observations.
 */

namespace birch {

/**
 * @brief A dense matrix of observations.
 *
 * Observations are stored contiguously in a column-major layout, i.e., the coordinates of observation `i` occupy the `i`-th block of `num_dimensions` values.
 * This is used both for the input relation and for the centroids of the weighted pseudo-points.
 *
 * @tparam Index_ Integer type of the observation indices.
 * @tparam Data_ Numeric type of the data.
 */
template<typename Index_, typename Data_>
class SimpleMatrix final : public Matrix<Index_, Data_> {
public:
    /**
     * @param num_dimensions Number of dimensions.
     * @param num_observations Number of observations.
     * @param[in] data Pointer to an array of length equal to the product of `num_dimensions` and `num_observations`.
     * It is expected that the array will not be deallocated during the lifetime of this `SimpleMatrix` instance.
     */
    SimpleMatrix(const std::size_t num_dimensions, const Index_ num_observations, const Data_* const data) :
        my_num_dim(num_dimensions), my_num_obs(num_observations), my_data(data) {}

private:
    std::size_t my_num_dim;
    Index_ my_num_obs;
    const Data_* my_data;

    const Data_* locate(const Index_ i) const {
        return my_data + sanisizer::product_unsafe<std::size_t>(i, my_num_dim);
    }

    class RandomAccess final : public RandomAccessExtractor<Index_, Data_> {
    public:
        RandomAccess(const SimpleMatrix& parent) : my_parent(parent) {}
        const Data_* get_observation(const Index_ i) {
            return my_parent.locate(i);
        }
    private:
        const SimpleMatrix& my_parent;
    };

    class ConsecutiveAccess final : public ConsecutiveAccessExtractor<Index_, Data_> {
    public:
        ConsecutiveAccess(const SimpleMatrix& parent, const Index_ start) : my_parent(parent), my_next(start) {}
        const Data_* get_observation() {
            return my_parent.locate(my_next++);
        }
    private:
        const SimpleMatrix& my_parent;
        Index_ my_next;
    };

    class IndexedAccess final : public IndexedAccessExtractor<Index_, Data_> {
    public:
        IndexedAccess(const SimpleMatrix& parent, const Index_* const sequence) : my_parent(parent), my_sequence(sequence) {}
        const Data_* get_observation() {
            return my_parent.locate(*(my_sequence++));
        }
    private:
        const SimpleMatrix& my_parent;
        const Index_* my_sequence;
    };

public:
    /**
     * @cond
     */
    Index_ num_observations() const {
        return my_num_obs;
    }

    std::size_t num_dimensions() const {
        return my_num_dim;
    }

    std::unique_ptr<RandomAccessExtractor<Index_, Data_> > new_extractor() const {
        return std::make_unique<RandomAccess>(*this);
    }

    std::unique_ptr<ConsecutiveAccessExtractor<Index_, Data_> > new_extractor(const Index_ start, const Index_) const {
        return std::make_unique<ConsecutiveAccess>(*this, start);
    }

    std::unique_ptr<IndexedAccessExtractor<Index_, Data_> > new_extractor(const Index_* const sequence, const std::size_t) const {
        return std::make_unique<IndexedAccess>(*this, sequence);
    }
    /**
     * @endcond
     */
};

}

#endif
