#ifndef BIRCH_COPY_INTO_ARRAY_HPP
#define BIRCH_COPY_INTO_ARRAY_HPP

#include <algorithm>
#include <vector>
#include <cstddef>

#include "sanisizer/sanisizer.hpp"

#include "Matrix.hpp"
#include "utils.hpp"

namespace birch {

namespace internal {

// 'chosen' may contain duplicates, e.g., when seeding runs out of distinct positions.
template<class Matrix_, typename Float_>
void copy_into_array(const Matrix_& matrix, const std::vector<Index<Matrix_> >& chosen, Float_* const out) {
    const auto ndim = matrix.num_dimensions();
    const auto nchosen = chosen.size();
    if (nchosen == 0) {
        return;
    }

    auto work = matrix.new_extractor(chosen.data(), nchosen);
    Float_* current = out;
    for (I<decltype(nchosen)> i = 0; i < nchosen; ++i, current += ndim) {
        const auto ptr = work->get_observation();
        std::copy_n(ptr, ndim, current);
    }
}

}

}

#endif
