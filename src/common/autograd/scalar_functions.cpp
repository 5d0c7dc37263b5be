#include "weft/autograd/scalar_functions.h"

#include "weft/operators.h"

namespace weft {
namespace autograd {
namespace scalar {

// ============================================================================
// Add / Mul
// ============================================================================

double Add::forward(ScalarContext&, const std::vector<double>& inputs) const {
    return operators::add(inputs[0], inputs[1]);
}

std::vector<double> Add::backward(const ScalarContext&, const double& gradOutput) const {
    return {gradOutput, gradOutput};
}

double Mul::forward(ScalarContext& ctx, const std::vector<double>& inputs) const {
    ctx.saveForBackward(inputs[0], inputs[1]);
    return operators::mul(inputs[0], inputs[1]);
}

std::vector<double> Mul::backward(const ScalarContext& ctx, const double& gradOutput) const {
    const auto& saved = ctx.savedValues();
    return {saved[1] * gradOutput, saved[0] * gradOutput};
}

// ============================================================================
// Unary Functions
// ============================================================================

double Log::forward(ScalarContext& ctx, const std::vector<double>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return operators::log(inputs[0]);
}

std::vector<double> Log::backward(const ScalarContext& ctx, const double& gradOutput) const {
    return {operators::logBack(ctx.savedValues()[0], gradOutput)};
}

double Inv::forward(ScalarContext& ctx, const std::vector<double>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return operators::inv(inputs[0]);
}

std::vector<double> Inv::backward(const ScalarContext& ctx, const double& gradOutput) const {
    return {operators::invBack(ctx.savedValues()[0], gradOutput)};
}

double Neg::forward(ScalarContext&, const std::vector<double>& inputs) const {
    return operators::neg(inputs[0]);
}

std::vector<double> Neg::backward(const ScalarContext&, const double& gradOutput) const {
    return {operators::neg(gradOutput)};
}

double Sigmoid::forward(ScalarContext& ctx, const std::vector<double>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return operators::sigmoid(inputs[0]);
}

std::vector<double> Sigmoid::backward(const ScalarContext& ctx, const double& gradOutput) const {
    return {operators::sigmoidBack(ctx.savedValues()[0], gradOutput)};
}

double ReLU::forward(ScalarContext& ctx, const std::vector<double>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return operators::relu(inputs[0]);
}

std::vector<double> ReLU::backward(const ScalarContext& ctx, const double& gradOutput) const {
    return {operators::reluBack(ctx.savedValues()[0], gradOutput)};
}

double Exp::forward(ScalarContext& ctx, const std::vector<double>& inputs) const {
    ctx.saveForBackward(inputs[0]);
    return operators::exp(inputs[0]);
}

std::vector<double> Exp::backward(const ScalarContext& ctx, const double& gradOutput) const {
    return {operators::exp(ctx.savedValues()[0]) * gradOutput};
}

// ============================================================================
// Comparisons
// ============================================================================

double LT::forward(ScalarContext&, const std::vector<double>& inputs) const {
    return operators::lt(inputs[0], inputs[1]);
}

std::vector<double> LT::backward(const ScalarContext&, const double&) const {
    return {0.0, 0.0};
}

double GT::forward(ScalarContext&, const std::vector<double>& inputs) const {
    return operators::gt(inputs[0], inputs[1]);
}

std::vector<double> GT::backward(const ScalarContext&, const double&) const {
    return {0.0, 0.0};
}

double EQ::forward(ScalarContext&, const std::vector<double>& inputs) const {
    return operators::eq(inputs[0], inputs[1]);
}

std::vector<double> EQ::backward(const ScalarContext&, const double&) const {
    return {0.0, 0.0};
}

}  // namespace scalar

// ============================================================================
// Expression Surface
// ============================================================================

namespace {

Scalar wrap(const Scalar& like, double value) {
    return like.graph().constant(value);
}

}  // namespace

Scalar operator+(const Scalar& a, const Scalar& b) {
    return instance<scalar::Add>()->apply({a, b});
}

Scalar operator+(const Scalar& a, double b) {
    return a + wrap(a, b);
}

Scalar operator+(double a, const Scalar& b) {
    return wrap(b, a) + b;
}

Scalar operator-(const Scalar& a, const Scalar& b) {
    return a + (-b);
}

Scalar operator-(const Scalar& a, double b) {
    return a - wrap(a, b);
}

Scalar operator-(double a, const Scalar& b) {
    return wrap(b, a) - b;
}

Scalar operator-(const Scalar& a) {
    return instance<scalar::Neg>()->apply({a});
}

Scalar operator*(const Scalar& a, const Scalar& b) {
    return instance<scalar::Mul>()->apply({a, b});
}

Scalar operator*(const Scalar& a, double b) {
    return a * wrap(a, b);
}

Scalar operator*(double a, const Scalar& b) {
    return wrap(b, a) * b;
}

Scalar operator/(const Scalar& a, const Scalar& b) {
    return a * inv(b);
}

Scalar operator/(const Scalar& a, double b) {
    return a / wrap(a, b);
}

Scalar operator/(double a, const Scalar& b) {
    return wrap(b, a) / b;
}

Scalar log(const Scalar& a) {
    return instance<scalar::Log>()->apply({a});
}

Scalar exp(const Scalar& a) {
    return instance<scalar::Exp>()->apply({a});
}

Scalar inv(const Scalar& a) {
    return instance<scalar::Inv>()->apply({a});
}

Scalar sigmoid(const Scalar& a) {
    return instance<scalar::Sigmoid>()->apply({a});
}

Scalar relu(const Scalar& a) {
    return instance<scalar::ReLU>()->apply({a});
}

Scalar lt(const Scalar& a, const Scalar& b) {
    return instance<scalar::LT>()->apply({a, b});
}

Scalar gt(const Scalar& a, const Scalar& b) {
    return instance<scalar::GT>()->apply({a, b});
}

Scalar eq(const Scalar& a, const Scalar& b) {
    return instance<scalar::EQ>()->apply({a, b});
}

}  // namespace autograd
}  // namespace weft
