#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "weft/autograd/function.h"
#include "weft/autograd/graph.h"
#include "weft/tensor/tensor_data.h"

namespace weft {
namespace autograd {

using TensorFunction = Function<TensorData>;
using TensorContext = Context<TensorData>;

namespace tensor {

// ============================================================================
// Element-wise Binary Functions (broadcasting)
// ============================================================================
// Binary backwards sum the gradient back down to each input's own shape
// (ops::sumTo), undoing the broadcast done in forward.

class Add final : public TensorFunction {
  public:
    std::string name() const override { return "Add"; }
    size_t numInputs() const override { return 2; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

class Mul final : public TensorFunction {
  public:
    std::string name() const override { return "Mul"; }
    size_t numInputs() const override { return 2; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

// LT / GT / EQ: 1.0 / 0.0 element-wise, zero gradient shaped like each input
class LT final : public TensorFunction {
  public:
    std::string name() const override { return "LT"; }
    size_t numInputs() const override { return 2; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

class GT final : public TensorFunction {
  public:
    std::string name() const override { return "GT"; }
    size_t numInputs() const override { return 2; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

class EQ final : public TensorFunction {
  public:
    std::string name() const override { return "EQ"; }
    size_t numInputs() const override { return 2; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

// ============================================================================
// Element-wise Unary Functions
// ============================================================================

class Neg final : public TensorFunction {
  public:
    std::string name() const override { return "Neg"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

class Inv final : public TensorFunction {
  public:
    std::string name() const override { return "Inv"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

class Log final : public TensorFunction {
  public:
    std::string name() const override { return "Log"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

// Exp saves its output: d/dx e^x = e^x
class Exp final : public TensorFunction {
  public:
    std::string name() const override { return "Exp"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

// Sigmoid saves its output s: d/dx = s * (1 - s)
class Sigmoid final : public TensorFunction {
  public:
    std::string name() const override { return "Sigmoid"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

class ReLU final : public TensorFunction {
  public:
    std::string name() const override { return "ReLU"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;
};

// ============================================================================
// Reduction and View Functions - one instance per call (they carry parameters)
// ============================================================================

// Sum: over one dimension (kept with size 1) or, without a dimension, over all
// elements into shape (1). Backward repeats the gradient over the summed extent.
class Sum final : public TensorFunction {
  public:
    explicit Sum(std::optional<size_t> dim = std::nullopt) : mDim(dim) {}

    std::string name() const override { return "Sum"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;

  private:
    std::optional<size_t> mDim;
};

// Permute: zero-copy view with reordered dimensions
// Backward: gradient permuted by the inverse order, inverse[order[i]] = i
class Permute final : public TensorFunction {
  public:
    explicit Permute(std::vector<int> order) : mOrder(std::move(order)) {}

    std::string name() const override { return "Permute"; }
    size_t numInputs() const override { return 1; }
    TensorData forward(TensorContext& ctx, const std::vector<TensorData>& inputs) const override;
    std::vector<TensorData> backward(const TensorContext& ctx,
                                     const TensorData& gradOutput) const override;

  private:
    std::vector<int> mOrder;
};

}  // namespace tensor

// ============================================================================
// Tensor expression surface
// ============================================================================
// Bare doubles are wrapped as 0-dimensional constants on the other operand's graph.

Tensor operator+(const Tensor& a, const Tensor& b);
Tensor operator+(const Tensor& a, double b);
Tensor operator+(double a, const Tensor& b);

Tensor operator-(const Tensor& a, const Tensor& b);
Tensor operator-(const Tensor& a, double b);
Tensor operator-(double a, const Tensor& b);
Tensor operator-(const Tensor& a);

Tensor operator*(const Tensor& a, const Tensor& b);
Tensor operator*(const Tensor& a, double b);
Tensor operator*(double a, const Tensor& b);

Tensor operator/(const Tensor& a, const Tensor& b);
Tensor operator/(const Tensor& a, double b);
Tensor operator/(double a, const Tensor& b);

Tensor log(const Tensor& a);
Tensor exp(const Tensor& a);
Tensor inv(const Tensor& a);
Tensor sigmoid(const Tensor& a);
Tensor relu(const Tensor& a);

Tensor lt(const Tensor& a, const Tensor& b);
Tensor gt(const Tensor& a, const Tensor& b);
Tensor eq(const Tensor& a, const Tensor& b);

Tensor sum(const Tensor& a);
Tensor sum(const Tensor& a, size_t dim);
Tensor mean(const Tensor& a);
Tensor permute(const Tensor& a, const std::vector<int>& order);

}  // namespace autograd
}  // namespace weft
