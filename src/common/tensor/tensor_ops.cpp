#include "weft/tensor/tensor_ops.h"

namespace weft {
namespace ops {

TensorData full(const Shape& shape, double value) {
    return TensorData(std::vector<double>(shapeSize(shape), value), shape);
}

TensorData zeros(const Shape& shape) {
    return TensorData(Storage(shapeSize(shape)), shape, stridesFromShape(shape));
}

TensorData ones(const Shape& shape) {
    return full(shape, 1.0);
}

TensorData scalar(double value) {
    return TensorData(std::vector<double>{value}, Shape{});
}

TensorData sumTo(const TensorData& grad, const Shape& shape) {
    if (grad.shape() == shape) {
        return grad;
    }
    if (shapeBroadcast(grad.shape(), shape) != grad.shape()) {
        throw IndexingError("Cannot reduce gradient of shape " + toString(grad.shape()) +
                            " to " + toString(shape));
    }

    TensorData out = zeros(shape);
    Index small_index(shape.size());
    for (const Index& idx : grad.indices()) {
        broadcastIndex(idx, grad.shape(), shape, small_index);
        out.set(small_index, out.get(small_index) + grad.get(idx));
    }
    return out;
}

TensorData expand(const TensorData& a, const Shape& shape) {
    return zip(zeros(shape), a, [](double, double v) { return v; });
}

}  // namespace ops
}  // namespace weft
