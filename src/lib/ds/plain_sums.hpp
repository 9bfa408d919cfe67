#pragma once
#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <ds/errors.hpp>

namespace rscache {

// Mutable sequence answering range sums by direct summation.
template <typename G>
class PlainSums {
   public:
    typedef G group_type;
    typedef typename G::value_type value_type;

    template <typename I,
              std::enable_if_t<std::is_same<typename std::iterator_traits<I>::value_type,
                                            typename G::value_type>::value,
                               bool> = true>
    PlainSums(I begin, I end) : data_(begin, end) {}

    explicit PlainSums(std::vector<value_type> data) : data_(std::move(data)) {}

    // Sum over the closed interval [l, r].
    value_type RangeSum(ptrdiff_t l, ptrdiff_t r) const {
        CheckInterval(l, r);
        return QueryImpl(l, r);
    }

    void Update(ptrdiff_t index, const value_type& value) {
        CheckIndex(index);
        UpdateImpl(index, value);
    }

    value_type At(ptrdiff_t index) const {
        CheckIndex(index);
        return data_[index];
    }

    size_t Size() const { return data_.size(); }

   protected:
    G group_;

    void CheckIndex(ptrdiff_t index) const {
        if (index < 0 || static_cast<size_t>(index) >= data_.size()) {
            throw OutOfRange{"index " + std::to_string(index) + " is outside [0, " +
                             std::to_string(data_.size()) + ")"};
        }
    }

    void CheckInterval(ptrdiff_t l, ptrdiff_t r) const {
        if (l > r) {
            throw OutOfRange{"interval [" + std::to_string(l) + ", " + std::to_string(r) +
                             "] has left > right"};
        }
        CheckIndex(l);
        CheckIndex(r);
    }

    value_type QueryImpl(size_t l, size_t r) const {
        value_type sum = group_.unit();
        for (size_t i = l; i <= r; ++i) {
            sum = group_.add(sum, data_[i]);
        }
        return sum;
    }

    void UpdateImpl(size_t index, const value_type& value) { data_[index] = value; }

   private:
    std::vector<value_type> data_;
};

}  // namespace rscache
