#pragma once

#include <string>
#include <vector>

#include "weft/autograd/function.h"
#include "weft/autograd/graph.h"

namespace weft {
namespace autograd {

using ScalarFunction = Function<double>;
using ScalarContext = Context<double>;

namespace scalar {

// ============================================================================
// Binary Functions
// ============================================================================

// Add: z = x + y
// Backward: dL/dx = dL/dz, dL/dy = dL/dz
class Add final : public ScalarFunction {
  public:
    std::string name() const override { return "Add"; }
    size_t numInputs() const override { return 2; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

// Mul: z = x * y
// Backward: dL/dx = dL/dz * y, dL/dy = dL/dz * x (both operands saved)
class Mul final : public ScalarFunction {
  public:
    std::string name() const override { return "Mul"; }
    size_t numInputs() const override { return 2; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

// ============================================================================
// Unary Functions - each saves its input
// ============================================================================

class Log final : public ScalarFunction {
  public:
    std::string name() const override { return "Log"; }
    size_t numInputs() const override { return 1; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

// Inv: z = 1 / x
class Inv final : public ScalarFunction {
  public:
    std::string name() const override { return "Inv"; }
    size_t numInputs() const override { return 1; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

// Neg: z = -x (nothing saved)
class Neg final : public ScalarFunction {
  public:
    std::string name() const override { return "Neg"; }
    size_t numInputs() const override { return 1; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

// Sigmoid: z = 1 / (1 + e^-x)
// Backward: dL/dx = dL/dz * s * (1 - s), s recomputed from the saved input
class Sigmoid final : public ScalarFunction {
  public:
    std::string name() const override { return "Sigmoid"; }
    size_t numInputs() const override { return 1; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

// ReLU: z = max(0, x)
// Backward: gradient passes through where x > 0, zero elsewhere
class ReLU final : public ScalarFunction {
  public:
    std::string name() const override { return "ReLU"; }
    size_t numInputs() const override { return 1; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

class Exp final : public ScalarFunction {
  public:
    std::string name() const override { return "Exp"; }
    size_t numInputs() const override { return 1; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

// ============================================================================
// Comparisons - 1.0 / 0.0 results, zero gradient for both inputs
// ============================================================================

class LT final : public ScalarFunction {
  public:
    std::string name() const override { return "LT"; }
    size_t numInputs() const override { return 2; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

class GT final : public ScalarFunction {
  public:
    std::string name() const override { return "GT"; }
    size_t numInputs() const override { return 2; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

class EQ final : public ScalarFunction {
  public:
    std::string name() const override { return "EQ"; }
    size_t numInputs() const override { return 2; }
    double forward(ScalarContext& ctx, const std::vector<double>& inputs) const override;
    std::vector<double> backward(const ScalarContext& ctx,
                                 const double& gradOutput) const override;
};

}  // namespace scalar

// ============================================================================
// Scalar expression surface
// ============================================================================
// Bare doubles are wrapped with Graph::constant on the other operand's graph.

Scalar operator+(const Scalar& a, const Scalar& b);
Scalar operator+(const Scalar& a, double b);
Scalar operator+(double a, const Scalar& b);

Scalar operator-(const Scalar& a, const Scalar& b);
Scalar operator-(const Scalar& a, double b);
Scalar operator-(double a, const Scalar& b);
Scalar operator-(const Scalar& a);

Scalar operator*(const Scalar& a, const Scalar& b);
Scalar operator*(const Scalar& a, double b);
Scalar operator*(double a, const Scalar& b);

Scalar operator/(const Scalar& a, const Scalar& b);
Scalar operator/(const Scalar& a, double b);
Scalar operator/(double a, const Scalar& b);

Scalar log(const Scalar& a);
Scalar exp(const Scalar& a);
Scalar inv(const Scalar& a);
Scalar sigmoid(const Scalar& a);
Scalar relu(const Scalar& a);

Scalar lt(const Scalar& a, const Scalar& b);
Scalar gt(const Scalar& a, const Scalar& b);
Scalar eq(const Scalar& a, const Scalar& b);

}  // namespace autograd
}  // namespace weft
