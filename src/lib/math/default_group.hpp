#pragma once
#include <type_traits>

#include <ds/errors.hpp>

namespace rscache {

template <class T>
struct DefaultGroup {
    typedef T value_type;
    T unit() const { return {}; }

    // Integer sums that leave T's range throw SumOverflow instead of wrapping.
    T add(const T& a, const T& b) const {
        if constexpr (std::is_integral<T>::value) {
            T ret;
            if (__builtin_add_overflow(a, b, &ret)) {
                throw SumOverflow{"sum does not fit the value type"};
            }
            return ret;
        } else {
            return a + b;
        }
    }
};

}  // namespace rscache
