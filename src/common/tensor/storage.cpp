#include "weft/tensor/storage.h"

namespace weft {

Storage::Storage(size_t size) : mData(std::make_shared<std::vector<double>>(size, 0.0)) {}

Storage::Storage(std::vector<double> values)
    : mData(std::make_shared<std::vector<double>>(std::move(values))) {}

Storage Storage::clone() const {
    return Storage(*mData);
}

}  // namespace weft
