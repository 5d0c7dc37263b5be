#pragma once
#include <functional>
#include <vector>

namespace weft {
namespace operators {

// ============================================================================
// Scalar Primitives
// ============================================================================

[[nodiscard]] double mul(double x, double y);
[[nodiscard]] double id(double x);
[[nodiscard]] double add(double x, double y);
[[nodiscard]] double neg(double x);

// Comparisons return 1.0 for true and 0.0 for false
[[nodiscard]] double lt(double x, double y);
[[nodiscard]] double gt(double x, double y);
[[nodiscard]] double eq(double x, double y);

[[nodiscard]] double max(double x, double y);

// |x - y| < 1e-2
[[nodiscard]] bool isClose(double x, double y);

// 1 / (1 + e^-x), evaluated as e^x / (1 + e^x) for negative x to avoid overflow
[[nodiscard]] double sigmoid(double x);
[[nodiscard]] double relu(double x);
[[nodiscard]] double log(double x);
[[nodiscard]] double exp(double x);
[[nodiscard]] double inv(double x);

// ============================================================================
// Derivative Helpers - d * f'(x)
// ============================================================================

[[nodiscard]] double logBack(double x, double d);
[[nodiscard]] double invBack(double x, double d);
[[nodiscard]] double reluBack(double x, double d);
[[nodiscard]] double sigmoidBack(double x, double d);

// ============================================================================
// List Helpers
// ============================================================================

[[nodiscard]] std::vector<double> map(const std::vector<double>& values,
                                      const std::function<double(double)>& fn);

// Element-wise combine; throws std::invalid_argument on length mismatch
[[nodiscard]] std::vector<double> zipWith(const std::vector<double>& a,
                                          const std::vector<double>& b,
                                          const std::function<double(double, double)>& fn);

[[nodiscard]] double reduce(const std::vector<double>& values,
                            const std::function<double(double, double)>& fn, double start);

[[nodiscard]] std::vector<double> negList(const std::vector<double>& values);
[[nodiscard]] std::vector<double> addLists(const std::vector<double>& a,
                                           const std::vector<double>& b);
[[nodiscard]] double sum(const std::vector<double>& values);
[[nodiscard]] double prod(const std::vector<double>& values);

}  // namespace operators
}  // namespace weft
