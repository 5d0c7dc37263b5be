#include "weft/tensor/index_iterator.h"

namespace weft {

IndexIterator::IndexIterator(const Shape* shape, size_t ordinal)
    : mShape(shape), mOrdinal(ordinal), mSize(shapeSize(*shape)) {
    load();
}

IndexIterator& IndexIterator::operator++() {
    ++mOrdinal;
    load();
    return *this;
}

IndexIterator IndexIterator::operator++(int) {
    IndexIterator previous = *this;
    ++(*this);
    return previous;
}

void IndexIterator::load() {
    // Past-the-end iterators carry no coordinate
    if (mOrdinal < mSize) {
        toIndex(mOrdinal, *mShape, mIndex);
    }
}

IndexRange::IndexRange(Shape shape) : mShape(std::move(shape)), mSize(shapeSize(mShape)) {}

}  // namespace weft
