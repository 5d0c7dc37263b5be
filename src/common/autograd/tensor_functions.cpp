#include "weft/autograd/tensor_functions.h"

#include <memory>

#include "weft/operators.h"
#include "weft/tensor/tensor_ops.h"

namespace weft {
namespace autograd {
namespace tensor {

namespace {

double addValues(double a, double b) {
    return operators::add(a, b);
}

double mulValues(double a, double b) {
    return operators::mul(a, b);
}

std::vector<TensorData> zeroGradients(const TensorContext& ctx) {
    const auto& saved = ctx.savedValues();
    return {ops::zeros(saved[0].shape()), ops::zeros(saved[1].shape())};
}

}  // namespace

// ============================================================================
// Add / Mul
// ============================================================================

TensorData Add::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0], inputs[1]);
    return ops::zip(inputs[0], inputs[1], addValues);
}

std::vector<TensorData> Add::backward(const TensorContext& ctx,
                                      const TensorData& gradOutput) const {
    const auto& saved = ctx.savedValues();
    return {ops::sumTo(gradOutput, saved[0].shape()), ops::sumTo(gradOutput, saved[1].shape())};
}

TensorData Mul::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0], inputs[1]);
    return ops::zip(inputs[0], inputs[1], mulValues);
}

std::vector<TensorData> Mul::backward(const TensorContext& ctx,
                                      const TensorData& gradOutput) const {
    const auto& saved = ctx.savedValues();
    const TensorData& a = saved[0];
    const TensorData& b = saved[1];
    return {ops::sumTo(ops::zip(gradOutput, b, mulValues), a.shape()),
            ops::sumTo(ops::zip(gradOutput, a, mulValues), b.shape())};
}

// ============================================================================
// Comparisons
// ============================================================================

TensorData LT::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0], inputs[1]);
    return ops::zip(inputs[0], inputs[1], operators::lt);
}

std::vector<TensorData> LT::backward(const TensorContext& ctx, const TensorData&) const {
    return zeroGradients(ctx);
}

TensorData GT::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0], inputs[1]);
    return ops::zip(inputs[0], inputs[1], operators::gt);
}

std::vector<TensorData> GT::backward(const TensorContext& ctx, const TensorData&) const {
    return zeroGradients(ctx);
}

TensorData EQ::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0], inputs[1]);
    return ops::zip(inputs[0], inputs[1], operators::eq);
}

std::vector<TensorData> EQ::backward(const TensorContext& ctx, const TensorData&) const {
    return zeroGradients(ctx);
}

// ============================================================================
// Unary Functions
// ============================================================================

TensorData Neg::forward(TensorContext&, const std::vector<TensorData>& inputs) const {
    return ops::map(inputs[0], operators::neg);
}

std::vector<TensorData> Neg::backward(const TensorContext&, const TensorData& gradOutput) const {
    return {ops::map(gradOutput, operators::neg)};
}

TensorData Inv::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return ops::map(inputs[0], operators::inv);
}

std::vector<TensorData> Inv::backward(const TensorContext& ctx,
                                      const TensorData& gradOutput) const {
    return {ops::zip(ctx.savedValues()[0], gradOutput, operators::invBack)};
}

TensorData Log::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return ops::map(inputs[0], operators::log);
}

std::vector<TensorData> Log::backward(const TensorContext& ctx,
                                      const TensorData& gradOutput) const {
    return {ops::zip(ctx.savedValues()[0], gradOutput, operators::logBack)};
}

TensorData Exp::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    TensorData out = ops::map(inputs[0], operators::exp);
    ctx.saveForBackward(out);
    return out;
}

std::vector<TensorData> Exp::backward(const TensorContext& ctx,
                                      const TensorData& gradOutput) const {
    return {ops::zip(ctx.savedValues()[0], gradOutput, mulValues)};
}

TensorData Sigmoid::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    TensorData out = ops::map(inputs[0], operators::sigmoid);
    ctx.saveForBackward(out);
    return out;
}

std::vector<TensorData> Sigmoid::backward(const TensorContext& ctx,
                                          const TensorData& gradOutput) const {
    return {ops::zip(ctx.savedValues()[0], gradOutput,
                     [](double s, double d) { return d * s * (1.0 - s); })};
}

TensorData ReLU::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return ops::map(inputs[0], operators::relu);
}

std::vector<TensorData> ReLU::backward(const TensorContext& ctx,
                                       const TensorData& gradOutput) const {
    return {ops::zip(ctx.savedValues()[0], gradOutput, operators::reluBack)};
}

// ============================================================================
// Sum / Permute
// ============================================================================

TensorData Sum::forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const {
    const TensorData& a = inputs[0];
    ctx.saveForBackward(a);
    if (mDim) {
        return ops::reduce(a, *mDim, addValues, 0.0);
    }

    double total = 0.0;
    for (const Index& idx : a.indices()) {
        total += a.get(idx);
    }
    return ops::full({1}, total);
}

std::vector<TensorData> Sum::backward(const TensorContext& ctx,
                                      const TensorData& gradOutput) const {
    const Shape& input_shape = ctx.savedValues()[0].shape();
    if (mDim) {
        return {ops::expand(gradOutput, input_shape)};
    }
    return {ops::full(input_shape, gradOutput.get({0}))};
}

TensorData Permute::forward(TensorContext&, const std::vector<TensorData>& inputs) const {
    return inputs[0].permute(mOrder);
}

std::vector<TensorData> Permute::backward(const TensorContext&,
                                          const TensorData& gradOutput) const {
    std::vector<int> inverse(mOrder.size());
    for (size_t i = 0; i < mOrder.size(); ++i) {
        inverse[mOrder[i]] = static_cast<int>(i);
    }
    return {gradOutput.permute(inverse).contiguous()};
}

}  // namespace tensor

// ============================================================================
// Expression Surface
// ============================================================================

namespace {

Tensor wrap(const Tensor& like, double value) {
    return like.graph().constant(ops::scalar(value));
}

}  // namespace

Tensor operator+(const Tensor& a, const Tensor& b) {
    return instance<tensor::Add>()->apply({a, b});
}

Tensor operator+(const Tensor& a, double b) {
    return a + wrap(a, b);
}

Tensor operator+(double a, const Tensor& b) {
    return wrap(b, a) + b;
}

Tensor operator-(const Tensor& a, const Tensor& b) {
    return a + (-b);
}

Tensor operator-(const Tensor& a, double b) {
    return a - wrap(a, b);
}

Tensor operator-(double a, const Tensor& b) {
    return wrap(b, a) - b;
}

Tensor operator-(const Tensor& a) {
    return instance<tensor::Neg>()->apply({a});
}

Tensor operator*(const Tensor& a, const Tensor& b) {
    return instance<tensor::Mul>()->apply({a, b});
}

Tensor operator*(const Tensor& a, double b) {
    return a * wrap(a, b);
}

Tensor operator*(double a, const Tensor& b) {
    return wrap(b, a) * b;
}

Tensor operator/(const Tensor& a, const Tensor& b) {
    return a * inv(b);
}

Tensor operator/(const Tensor& a, double b) {
    return a / wrap(a, b);
}

Tensor operator/(double a, const Tensor& b) {
    return wrap(b, a) / b;
}

Tensor log(const Tensor& a) {
    return instance<tensor::Log>()->apply({a});
}

Tensor exp(const Tensor& a) {
    return instance<tensor::Exp>()->apply({a});
}

Tensor inv(const Tensor& a) {
    return instance<tensor::Inv>()->apply({a});
}

Tensor sigmoid(const Tensor& a) {
    return instance<tensor::Sigmoid>()->apply({a});
}

Tensor relu(const Tensor& a) {
    return instance<tensor::ReLU>()->apply({a});
}

Tensor lt(const Tensor& a, const Tensor& b) {
    return instance<tensor::LT>()->apply({a, b});
}

Tensor gt(const Tensor& a, const Tensor& b) {
    return instance<tensor::GT>()->apply({a, b});
}

Tensor eq(const Tensor& a, const Tensor& b) {
    return instance<tensor::EQ>()->apply({a, b});
}

Tensor sum(const Tensor& a) {
    return instance<tensor::Sum>()->apply({a});
}

Tensor sum(const Tensor& a, size_t dim) {
    return std::make_shared<tensor::Sum>(dim)->apply({a});
}

Tensor mean(const Tensor& a) {
    return sum(a) / static_cast<double>(a.value().size());
}

Tensor permute(const Tensor& a, const std::vector<int>& order) {
    return std::make_shared<tensor::Permute>(order)->apply({a});
}

}  // namespace autograd
}  // namespace weft
