#pragma once
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "weft/tensor/index_iterator.h"
#include "weft/tensor/indexing.h"
#include "weft/tensor/storage.h"

namespace weft {

/**
 * @brief Strided view over a shared flat buffer
 *
 * A TensorData is a (storage, shape, strides) triple. Copies and permutations
 * share the storage, so a write through one view is visible through every
 * other view of the same buffer. Views are not synchronised: one writer per
 * buffer at a time.
 */
class TensorData {
  public:
    // Takes ownership of `values`. Strides default to the contiguous layout.
    // Fatal (InvariantError) if strides and shape differ in length or the buffer
    // length is not the product of the shape.
    TensorData(std::vector<double> values, Shape shape,
               std::optional<Strides> strides = std::nullopt);

    // View over an existing storage; same checks as above
    TensorData(Storage storage, Shape shape, Strides strides);

    ~TensorData() = default;
    TensorData(const TensorData& other) = default;
    TensorData& operator=(const TensorData& other) = default;
    TensorData(TensorData&& other) noexcept = default;
    TensorData& operator=(TensorData&& other) noexcept = default;

    // Basic Accessors
    [[nodiscard]] const Shape& shape() const { return mShape; }
    [[nodiscard]] const Strides& strides() const { return mStrides; }
    [[nodiscard]] size_t dims() const { return mShape.size(); }
    [[nodiscard]] size_t size() const { return mSize; }
    [[nodiscard]] const Storage& storage() const { return mStorage; }
    [[nodiscard]] bool isSameStorage(const TensorData& other) const {
        return mStorage.sharesBufferWith(other.mStorage);
    }

    // False as soon as a stride is larger than the stride before it
    [[nodiscard]] bool isContiguous() const;

    // Storage position of a coordinate. A bare integer is treated as a 1-tuple.
    // Throws IndexingError on rank mismatch, out-of-range or negative coordinates.
    [[nodiscard]] size_t index(int64_t coordinate) const;
    [[nodiscard]] size_t index(const Index& coordinate) const;

    // Every valid coordinate in canonical order
    [[nodiscard]] IndexRange indices() const { return IndexRange(mShape); }

    // A uniformly random valid coordinate drawn from `engine`
    [[nodiscard]] Index sample(std::mt19937& engine) const;

    [[nodiscard]] double get(const Index& coordinate) const;
    void set(const Index& coordinate, double value);

    // View with dimensions reordered: dimension i of the result is dimension
    // order[i] of this tensor. Never copies the buffer. Fatal (InvariantError)
    // if `order` is not a permutation of 0..dims()-1.
    [[nodiscard]] TensorData permute(const std::vector<int>& order) const;

    // Copy into a fresh contiguous buffer; returns a view of this buffer when
    // the layout already is contiguous
    [[nodiscard]] TensorData contiguous() const;

    // Nested bracketed rendering following the shape, for debugging
    [[nodiscard]] std::string toString() const;

  private:
    void validate() const;

    Storage mStorage;
    Shape mShape;
    Strides mStrides;
    size_t mSize;
};

}  // namespace weft
