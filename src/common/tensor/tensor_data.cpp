#include "weft/tensor/tensor_data.h"

#include <format>
#include <limits>

#include "weft/check.h"
#include "weft/logger.h"

namespace weft {

TensorData::TensorData(std::vector<double> values, Shape shape, std::optional<Strides> strides)
    : mStorage(std::move(values)), mShape(std::move(shape)), mSize(shapeSize(mShape)) {
    mStrides = strides ? std::move(*strides) : stridesFromShape(mShape);
    validate();
}

TensorData::TensorData(Storage storage, Shape shape, Strides strides)
    : mStorage(std::move(storage)),
      mShape(std::move(shape)),
      mStrides(std::move(strides)),
      mSize(shapeSize(mShape)) {
    validate();
}

void TensorData::validate() const {
    WEFT_CHECK(mStrides.size() == mShape.size(),
               "Len of strides " + weft::toString(mStrides) + " must match " +
                   weft::toString(mShape));
    WEFT_CHECK(mStorage.size() == mSize,
               std::format("Storage holds {} elements but shape {} needs {}", mStorage.size(),
                           weft::toString(mShape), mSize));
}

bool TensorData::isContiguous() const {
    size_t last = std::numeric_limits<size_t>::max();
    for (size_t stride : mStrides) {
        if (stride > last) {
            return false;
        }
        last = stride;
    }
    return true;
}

size_t TensorData::index(int64_t coordinate) const {
    return index(Index{coordinate});
}

size_t TensorData::index(const Index& coordinate) const {
    if (coordinate.size() != mShape.size()) {
        throw IndexingError("Index " + weft::toString(coordinate) + " must be size of " +
                            weft::toString(mShape));
    }
    for (size_t i = 0; i < coordinate.size(); ++i) {
        if (coordinate[i] < 0) {
            throw IndexingError("Negative indexing for " + weft::toString(coordinate) +
                                " not supported");
        }
        if (static_cast<size_t>(coordinate[i]) >= mShape[i]) {
            throw IndexingError("Index " + weft::toString(coordinate) + " out of range " +
                                weft::toString(mShape));
        }
    }
    return indexToPosition(coordinate, mStrides);
}

Index TensorData::sample(std::mt19937& engine) const {
    Index out(mShape.size());
    for (size_t i = 0; i < mShape.size(); ++i) {
        if (mShape[i] == 0) {
            throw IndexingError("Cannot sample from empty shape " + weft::toString(mShape));
        }
        std::uniform_int_distribution<int64_t> dist(0, static_cast<int64_t>(mShape[i]) - 1);
        out[i] = dist(engine);
    }
    return out;
}

double TensorData::get(const Index& coordinate) const {
    return mStorage[index(coordinate)];
}

void TensorData::set(const Index& coordinate, double value) {
    mStorage[index(coordinate)] = value;
}

TensorData TensorData::permute(const std::vector<int>& order) const {
    WEFT_CHECK(order.size() == mShape.size(),
               std::format("Must give a position to each dimension. Shape: {} Order size: {}",
                           weft::toString(mShape), order.size()));

    std::vector<bool> seen(order.size(), false);
    bool identity = true;
    for (size_t i = 0; i < order.size(); ++i) {
        const int d = order[i];
        WEFT_CHECK(d >= 0 && d < static_cast<int>(order.size()) && !seen[d],
                   std::format("Invalid permutation of {}: dimension {} at position {}",
                               weft::toString(mShape), d, i));
        seen[d] = true;
        identity = identity && d == static_cast<int>(i);
    }

    if (identity) {
        return *this;
    }

    Shape new_shape(order.size());
    Strides new_strides(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        new_shape[i] = mShape[order[i]];
        new_strides[i] = mStrides[order[i]];
    }

    Logger::getInstance("TensorData")
        .trace("permute {} -> {}", weft::toString(mShape), weft::toString(new_shape));
    return TensorData(mStorage, std::move(new_shape), std::move(new_strides));
}

TensorData TensorData::contiguous() const {
    if (mStrides == stridesFromShape(mShape)) {
        return *this;
    }

    std::vector<double> values;
    values.reserve(mSize);
    for (const Index& idx : indices()) {
        values.push_back(get(idx));
    }
    return TensorData(std::move(values), mShape);
}

std::string TensorData::toString() const {
    std::string out;
    for (const Index& idx : indices()) {
        // Open a bracket for every trailing dimension starting a new row
        std::string prefix;
        for (int i = static_cast<int>(idx.size()) - 1; i >= 0; --i) {
            if (idx[i] != 0) {
                break;
            }
            prefix = "\n" + std::string(i, '\t') + "[" + prefix;
        }
        out += prefix;
        out += std::format("{:3.2f}", get(idx));

        std::string suffix;
        for (int i = static_cast<int>(idx.size()) - 1; i >= 0; --i) {
            if (static_cast<size_t>(idx[i]) != mShape[i] - 1) {
                break;
            }
            suffix += "]";
        }
        out += suffix.empty() ? " " : suffix;
    }
    return out;
}

}  // namespace weft
