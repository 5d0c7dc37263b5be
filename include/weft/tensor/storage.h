#pragma once
#include <cstddef>
#include <memory>
#include <vector>

namespace weft {

// Flat buffer of doubles shared by every TensorData view created over it.
// Copying a Storage handle is shallow; clone() makes an independent deep copy.
class Storage {
  public:
    // @param size: Number of zero-initialised elements
    explicit Storage(size_t size);
    // @param values: Initial contents, moved into the buffer
    explicit Storage(std::vector<double> values);
    ~Storage() = default;

    Storage(const Storage& other) = default;
    Storage& operator=(const Storage& other) = default;
    Storage(Storage&& other) noexcept = default;
    Storage& operator=(Storage&& other) noexcept = default;

    // Deep copy of the buffer
    [[nodiscard]] Storage clone() const;

    [[nodiscard]] double* data() { return mData->data(); }
    [[nodiscard]] const double* data() const { return mData->data(); }

    double& operator[](size_t position) { return (*mData)[position]; }
    double operator[](size_t position) const { return (*mData)[position]; }

    [[nodiscard]] size_t size() const { return mData->size(); }

    // True if both handles refer to the same underlying buffer
    [[nodiscard]] bool sharesBufferWith(const Storage& other) const { return mData == other.mData; }

  private:
    std::shared_ptr<std::vector<double>> mData;
};

}  // namespace weft
