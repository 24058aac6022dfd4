#ifndef BIRCH_UTILS_HPP
#define BIRCH_UTILS_HPP

#include <type_traits>
#include <cstddef>

namespace birch {

template<typename Input_>
using I = typename std::remove_cv<typename std::remove_reference<Input_>::type>::type;

/**
 * @cond
 */
namespace internal {

template<typename Float_, typename Left_, typename Right_>
Float_ squared_distance(const Left_* const left, const Right_* const right, const std::size_t ndim) {
    Float_ output = 0;
    for (std::size_t d = 0; d < ndim; ++d) {
        const Float_ delta = static_cast<Float_>(left[d]) - static_cast<Float_>(right[d]); // cast to ensure consistent precision regardless of the input types.
        output += delta * delta;
    }
    return output;
}

}
/**
 * @endcond
 */

}

#endif
