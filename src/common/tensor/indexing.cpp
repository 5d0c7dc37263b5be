#include "weft/tensor/indexing.h"

#include <algorithm>
#include <sstream>

namespace weft {

namespace {

template <typename Sequence>
std::string joinParenthesized(const Sequence& values) {
    std::ostringstream ss;
    ss << "(";
    for (size_t i = 0; i < values.size(); ++i) {
        ss << values[i];
        if (i + 1 < values.size()) {
            ss << ", ";
        }
    }
    ss << ")";
    return ss.str();
}

}  // namespace

std::string toString(const Shape& shape) {
    return joinParenthesized(shape);
}

std::string toString(const Index& index) {
    return joinParenthesized(index);
}

size_t shapeSize(const Shape& shape) {
    size_t total = 1;
    for (size_t dim : shape) {
        total *= dim;
    }
    return total;
}

size_t indexToPosition(const Index& index, const Strides& strides) {
    if (index.size() != strides.size()) {
        throw IndexingError("Index " + toString(index) + " must have same length as strides " +
                            toString(strides));
    }

    size_t position = 0;
    for (size_t i = 0; i < index.size(); ++i) {
        if (index[i] < 0) {
            throw IndexingError("Negative indexing for " + toString(index) + " not supported");
        }
        position += static_cast<size_t>(index[i]) * strides[i];
    }
    return position;
}

void toIndex(size_t ordinal, const Shape& shape, Index& outIndex) {
    if (ordinal >= shapeSize(shape)) {
        throw IndexingError("Ordinal " + std::to_string(ordinal) + " out of range for shape " +
                            toString(shape));
    }

    outIndex.resize(shape.size());
    for (int dim = static_cast<int>(shape.size()) - 1; dim >= 0; --dim) {
        outIndex[dim] = static_cast<int64_t>(ordinal % shape[dim]);
        ordinal /= shape[dim];
    }
}

Strides stridesFromShape(const Shape& shape) {
    Strides strides(shape.size());
    size_t acc = 1;

    // For shape [2, 3, 4], strides are [12, 4, 1]
    for (int i = static_cast<int>(shape.size()) - 1; i >= 0; --i) {
        strides[i] = acc;
        acc *= shape[i];
    }
    return strides;
}

Shape shapeBroadcast(const Shape& a, const Shape& b) {
    const size_t ndim = std::max(a.size(), b.size());
    Shape result(ndim);

    for (size_t i = 0; i < ndim; ++i) {
        // Walk from the right; missing dimensions count as 1
        const size_t dim_a = (i < a.size()) ? a[a.size() - 1 - i] : 1;
        const size_t dim_b = (i < b.size()) ? b[b.size() - 1 - i] : 1;

        if (dim_a != dim_b && dim_a != 1 && dim_b != 1) {
            throw IndexingError("Cannot broadcast shapes " + toString(a) + " and " + toString(b));
        }
        result[ndim - 1 - i] = std::max(dim_a, dim_b);
    }
    return result;
}

void broadcastIndex(const Index& bigIndex, const Shape& bigShape, const Shape& shape,
                    Index& outIndex) {
    if (shape.empty()) {
        return;
    }

    if (bigIndex.size() != bigShape.size()) {
        throw IndexingError("Index " + toString(bigIndex) + " must be size of " +
                            toString(bigShape));
    }
    if (shape.size() > bigShape.size()) {
        throw IndexingError("Shape " + toString(shape) + " has more dimensions than " +
                            toString(bigShape));
    }

    const size_t pad = bigShape.size() - shape.size();
    Shape padded(pad, 1);
    padded.insert(padded.end(), shape.begin(), shape.end());

    for (size_t dim = 0; dim < bigShape.size(); ++dim) {
        if (padded[dim] != 1 && padded[dim] != bigShape[dim]) {
            throw IndexingError("Shapes " + toString(bigShape) + " and " + toString(shape) +
                                " are not broadcast-compatible");
        }
    }

    outIndex.resize(shape.size());
    for (size_t dim = 0; dim < shape.size(); ++dim) {
        const size_t big_dim = dim + pad;
        outIndex[dim] = (padded[big_dim] == 1) ? 0 : bigIndex[big_dim];
    }
}

}  // namespace weft
