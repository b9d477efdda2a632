#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>

namespace patchy {

// Array indexed from min to max inclusive. The Myers algorithm keeps the
// furthest reaching x of each k-diagonal (-D..D) in one. Elements start out
// zeroed.
template <typename Type>
class BipolarArray {
   public:
    BipolarArray(int64_t min, int64_t max)
        : min_(min), max_(max), capacity_(static_cast<std::size_t>(max - min + 1) /* +1 for zero */) {
        assert(max - min + 1 >= 0);
        arr_ = std::make_unique<Type[]>(capacity_);
    }

    BipolarArray(BipolarArray&& other) = default;
    BipolarArray&
    operator=(BipolarArray&& other) = default;

    Type&
    operator[](int64_t index) {
        return arr_[offset(index)];
    }

    const Type&
    operator[](int64_t index) const {
        return arr_[offset(index)];
    }

    // Copy of the elements in [min, max], which must lie inside this array.
    BipolarArray
    slice(int64_t min, int64_t max) const {
        BipolarArray result{min, max};
        if (result.capacity_ > 0) {
            std::memcpy(result.arr_.get(), arr_.get() + offset(min), result.capacity_ * sizeof(Type));
        }
        return result;
    }

    int64_t
    min() const {
        return min_;
    }

    int64_t
    max() const {
        return max_;
    }

   private:
    std::size_t
    offset(int64_t index) const {
        auto offset = index - min_;
        assert(offset >= 0);
        assert(offset < static_cast<int64_t>(capacity_));
        return static_cast<std::size_t>(offset);
    }

    int64_t min_;
    int64_t max_;
    std::size_t capacity_;
    std::unique_ptr<Type[]> arr_;
};

}  // namespace patchy
