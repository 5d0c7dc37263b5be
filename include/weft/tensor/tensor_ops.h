#pragma once
#include <vector>

#include "weft/tensor/tensor_data.h"

namespace weft {
namespace ops {

// ============================================================================
// Constructors - all return contiguous buffers
// ============================================================================

[[nodiscard]] TensorData full(const Shape& shape, double value);
[[nodiscard]] TensorData zeros(const Shape& shape);
[[nodiscard]] TensorData ones(const Shape& shape);
// 0-dimensional tensor holding one value
[[nodiscard]] TensorData scalar(double value);

// ============================================================================
// Element-wise Kernels
// ============================================================================

// out[i] = fn(a[i]); output has a's shape with contiguous strides
template <typename Fn>
TensorData map(const TensorData& a, Fn fn) {
    TensorData out = zeros(a.shape());
    for (const Index& idx : a.indices()) {
        out.set(idx, fn(a.get(idx)));
    }
    return out;
}

// out[i] = fn(a[i'], b[i'']) over the broadcast of both shapes, where i' and i''
// are the projections of i onto each input
template <typename Fn>
TensorData zip(const TensorData& a, const TensorData& b, Fn fn) {
    TensorData out = zeros(shapeBroadcast(a.shape(), b.shape()));
    Index a_index(a.dims());
    Index b_index(b.dims());
    for (const Index& idx : out.indices()) {
        broadcastIndex(idx, out.shape(), a.shape(), a_index);
        broadcastIndex(idx, out.shape(), b.shape(), b_index);
        out.set(idx, fn(a.get(a_index), b.get(b_index)));
    }
    return out;
}

// Fold dimension `dim` with fn, starting from `start`. The result keeps the
// rank of `a` with size 1 along `dim`. Throws IndexingError if dim is out of range.
template <typename Fn>
TensorData reduce(const TensorData& a, size_t dim, Fn fn, double start) {
    if (dim >= a.dims()) {
        throw IndexingError("Reduction dimension " + std::to_string(dim) + " out of range for " +
                            toString(a.shape()));
    }

    Shape out_shape = a.shape();
    out_shape[dim] = 1;
    TensorData out = full(out_shape, start);

    Index out_index;
    for (const Index& idx : a.indices()) {
        out_index = idx;
        out_index[dim] = 0;
        out.set(out_index, fn(out.get(out_index), a.get(idx)));
    }
    return out;
}

// ============================================================================
// Broadcast Helpers
// ============================================================================

// Undo broadcasting on a gradient: sums every coordinate of `grad` into its
// projection onto `shape`. Throws IndexingError if `shape` does not broadcast
// to grad's shape.
[[nodiscard]] TensorData sumTo(const TensorData& grad, const Shape& shape);

// Repeat `a` along its size-1 and missing leading dimensions up to `shape`
[[nodiscard]] TensorData expand(const TensorData& a, const Shape& shape);

}  // namespace ops
}  // namespace weft
