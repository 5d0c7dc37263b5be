#pragma once
#include <cstddef>
#include <iterator>

#include "weft/tensor/indexing.h"

namespace weft {

/// @brief Forward iterator over every valid coordinate of a shape in canonical
/// (row-major) order.
///
/// The coordinate for each ordinal is produced by toIndex(), so the order is
/// independent of strides: a permuted view enumerates its own logical
/// coordinates, not its storage order.
class IndexIterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Index;
    using difference_type = std::ptrdiff_t;
    using pointer = const Index*;
    using reference = const Index&;

    IndexIterator() = default;

    /// @param shape Shape being enumerated (must outlive the iterator)
    /// @param ordinal Starting ordinal; shapeSize(shape) is the end position
    IndexIterator(const Shape* shape, size_t ordinal);

    reference operator*() const { return mIndex; }
    pointer operator->() const { return &mIndex; }

    IndexIterator& operator++();
    IndexIterator operator++(int);

    /// @brief Linear position of the current coordinate (0 to size-1)
    [[nodiscard]] size_t ordinal() const { return mOrdinal; }

    friend bool operator==(const IndexIterator& a, const IndexIterator& b) {
        return a.mOrdinal == b.mOrdinal;
    }
    friend bool operator!=(const IndexIterator& a, const IndexIterator& b) { return !(a == b); }

  private:
    void load();

    const Shape* mShape = nullptr;
    size_t mOrdinal = 0;
    size_t mSize = 0;
    Index mIndex;
};

/// @brief Lazy, restartable range of all coordinates of a shape.
///
/// Usage:
/// @code
///   for (const Index& idx : IndexRange(shape)) {
///       ...
///   }
/// @endcode
/// Each begin() starts a fresh enumeration. Holds its own copy of the shape.
class IndexRange {
  public:
    explicit IndexRange(Shape shape);

    [[nodiscard]] IndexIterator begin() const { return IndexIterator(&mShape, 0); }
    [[nodiscard]] IndexIterator end() const { return IndexIterator(&mShape, mSize); }

    [[nodiscard]] size_t size() const { return mSize; }
    [[nodiscard]] const Shape& shape() const { return mShape; }

  private:
    Shape mShape;
    size_t mSize;
};

}  // namespace weft
