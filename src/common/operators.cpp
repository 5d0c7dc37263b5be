#include "weft/operators.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace weft {
namespace operators {

double mul(double x, double y) {
    return x * y;
}

double id(double x) {
    return x;
}

double add(double x, double y) {
    return x + y;
}

double neg(double x) {
    return -x;
}

double lt(double x, double y) {
    return x < y ? 1.0 : 0.0;
}

double gt(double x, double y) {
    return x > y ? 1.0 : 0.0;
}

double eq(double x, double y) {
    return x == y ? 1.0 : 0.0;
}

double max(double x, double y) {
    return x > y ? x : y;
}

bool isClose(double x, double y) {
    return std::abs(x - y) < 1e-2;
}

double sigmoid(double x) {
    if (x >= 0.0) {
        return 1.0 / (1.0 + std::exp(-x));
    }
    const double e = std::exp(x);
    return e / (1.0 + e);
}

double relu(double x) {
    return x > 0.0 ? x : 0.0;
}

double log(double x) {
    return std::log(x);
}

double exp(double x) {
    return std::exp(x);
}

double inv(double x) {
    return 1.0 / x;
}

// ============================================================================
// Derivative Helpers
// ============================================================================

double logBack(double x, double d) {
    // d/dx log(x) = 1/x
    return d / x;
}

double invBack(double x, double d) {
    // d/dx (1/x) = -1/x^2
    return -d / (x * x);
}

double reluBack(double x, double d) {
    return x > 0.0 ? d : 0.0;
}

double sigmoidBack(double x, double d) {
    const double s = sigmoid(x);
    return s * (1.0 - s) * d;
}

// ============================================================================
// List Helpers
// ============================================================================

std::vector<double> map(const std::vector<double>& values,
                        const std::function<double(double)>& fn) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        out.push_back(fn(v));
    }
    return out;
}

std::vector<double> zipWith(const std::vector<double>& a, const std::vector<double>& b,
                            const std::function<double(double, double)>& fn) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("zipWith: length mismatch (" + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()) + ")");
    }
    std::vector<double> out;
    out.reserve(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        out.push_back(fn(a[i], b[i]));
    }
    return out;
}

double reduce(const std::vector<double>& values, const std::function<double(double, double)>& fn,
              double start) {
    double acc = start;
    for (double v : values) {
        acc = fn(acc, v);
    }
    return acc;
}

std::vector<double> negList(const std::vector<double>& values) {
    return map(values, neg);
}

std::vector<double> addLists(const std::vector<double>& a, const std::vector<double>& b) {
    return zipWith(a, b, add);
}

double sum(const std::vector<double>& values) {
    return reduce(values, add, 0.0);
}

double prod(const std::vector<double>& values) {
    return reduce(values, mul, 1.0);
}

}  // namespace operators
}  // namespace weft
