#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace weft {

using Shape = std::vector<size_t>;
using Strides = std::vector<size_t>;
// Signed so negative coordinates can be detected and rejected
using Index = std::vector<int64_t>;

// Raised for invalid coordinates, mismatched ranks and incompatible broadcasts.
// The message always names the offending index and/or shapes.
class IndexingError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Formatting
// ============================================================================

// "(5, 3)" style rendering used in error messages
[[nodiscard]] std::string toString(const Shape& shape);
[[nodiscard]] std::string toString(const Index& index);

// ============================================================================
// Index <-> Position
// ============================================================================

// Number of elements described by a shape (1 for a 0-dimensional shape)
[[nodiscard]] size_t shapeSize(const Shape& shape);

// Storage position of `index`: the dot product of index and strides.
// Throws IndexingError if the lengths differ or a coordinate is negative.
[[nodiscard]] size_t indexToPosition(const Index& index, const Strides& strides);

// Canonical row-major enumeration: fills `outIndex` with the coordinate that
// ordinal `ordinal` maps to, processing dimensions last to first. Enumerating
// 0 .. shapeSize(shape)-1 visits every coordinate exactly once. This is
// independent of any strides, so it is not the inverse of indexToPosition for
// non-contiguous layouts. `outIndex` is resized to the rank of `shape`.
void toIndex(size_t ordinal, const Shape& shape, Index& outIndex);

// Row-major strides: last stride 1, each earlier stride the product of the sizes after it
[[nodiscard]] Strides stridesFromShape(const Shape& shape);

// ============================================================================
// Broadcasting
// ============================================================================

// NumPy-style broadcast of two shapes: right-align, left-pad the shorter with 1s,
// take the larger size per dimension where sizes match or one of them is 1.
[[nodiscard]] Shape shapeBroadcast(const Shape& a, const Shape& b);

// Project `bigIndex` (a coordinate in `bigShape`) onto a coordinate in the smaller
// `shape` that broadcasts to `bigShape`. Size-1 dimensions collapse to 0, the
// rest copy the aligned big coordinate. A 0-dimensional `shape` leaves
// `outIndex` untouched.
void broadcastIndex(const Index& bigIndex, const Shape& bigShape, const Shape& shape,
                    Index& outIndex);

}  // namespace weft
