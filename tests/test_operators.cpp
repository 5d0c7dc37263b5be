#include <cmath>
#include <stdexcept>
#include <vector>

#include "weft/operators.h"
#include <gtest/gtest.h>

using namespace weft;

// ============================================================================
// Scalar Primitives
// ============================================================================

TEST(OperatorsTest, Arithmetic) {
    EXPECT_DOUBLE_EQ(operators::mul(3.0, 4.0), 12.0);
    EXPECT_DOUBLE_EQ(operators::add(3.0, 4.0), 7.0);
    EXPECT_DOUBLE_EQ(operators::neg(3.0), -3.0);
    EXPECT_DOUBLE_EQ(operators::id(5.5), 5.5);
    EXPECT_DOUBLE_EQ(operators::inv(4.0), 0.25);
}

TEST(OperatorsTest, ComparisonsReturnOneOrZero) {
    EXPECT_EQ(operators::lt(1.0, 2.0), 1.0);
    EXPECT_EQ(operators::lt(2.0, 1.0), 0.0);
    EXPECT_EQ(operators::gt(2.0, 1.0), 1.0);
    EXPECT_EQ(operators::gt(2.0, 2.0), 0.0);
    EXPECT_EQ(operators::eq(2.0, 2.0), 1.0);
    EXPECT_EQ(operators::eq(2.0, 3.0), 0.0);
    EXPECT_EQ(operators::max(2.0, 3.0), 3.0);
}

TEST(OperatorsTest, IsCloseTolerance) {
    EXPECT_TRUE(operators::isClose(1.0, 1.005));
    EXPECT_FALSE(operators::isClose(1.0, 1.02));
}

TEST(OperatorsTest, SigmoidIsStable) {
    EXPECT_DOUBLE_EQ(operators::sigmoid(0.0), 0.5);
    EXPECT_NEAR(operators::sigmoid(2.0) + operators::sigmoid(-2.0), 1.0, 1e-12);
    EXPECT_NEAR(operators::sigmoid(-1000.0), 0.0, 1e-12);
    EXPECT_NEAR(operators::sigmoid(1000.0), 1.0, 1e-12);
    EXPECT_FALSE(std::isnan(operators::sigmoid(-1000.0)));
}

TEST(OperatorsTest, ReluClampsNegatives) {
    EXPECT_EQ(operators::relu(-3.0), 0.0);
    EXPECT_EQ(operators::relu(0.0), 0.0);
    EXPECT_EQ(operators::relu(2.5), 2.5);
}

TEST(OperatorsTest, LogAndExpAreInverse) {
    EXPECT_NEAR(operators::log(operators::exp(1.7)), 1.7, 1e-12);
    EXPECT_DOUBLE_EQ(operators::exp(0.0), 1.0);
}

// ============================================================================
// Derivative Helpers
// ============================================================================

TEST(OperatorsTest, BackHelpers) {
    EXPECT_DOUBLE_EQ(operators::logBack(2.0, 3.0), 1.5);
    EXPECT_DOUBLE_EQ(operators::invBack(2.0, 1.0), -0.25);
    EXPECT_DOUBLE_EQ(operators::reluBack(1.0, 5.0), 5.0);
    EXPECT_DOUBLE_EQ(operators::reluBack(-1.0, 5.0), 0.0);
    EXPECT_DOUBLE_EQ(operators::sigmoidBack(0.0, 1.0), 0.25);
}

TEST(OperatorsTest, SigmoidBackMatchesFiniteDifference) {
    const double x = 0.7;
    const double h = 1e-6;
    const double numeric = (operators::sigmoid(x + h) - operators::sigmoid(x - h)) / (2 * h);
    EXPECT_NEAR(operators::sigmoidBack(x, 1.0), numeric, 1e-6);
}

// ============================================================================
// List Helpers
// ============================================================================

TEST(OperatorsTest, MapAppliesToEveryElement) {
    std::vector<double> out = operators::map({1.0, -2.0, 3.0}, [](double x) { return x * 2; });
    EXPECT_EQ(out, (std::vector<double>{2.0, -4.0, 6.0}));
}

TEST(OperatorsTest, ZipWithRejectsLengthMismatch) {
    EXPECT_THROW((void)operators::zipWith({1.0, 2.0}, {1.0}, operators::add),
                 std::invalid_argument);
}

TEST(OperatorsTest, ListArithmetic) {
    EXPECT_EQ(operators::negList({1.0, -2.0}), (std::vector<double>{-1.0, 2.0}));
    EXPECT_EQ(operators::addLists({1.0, 2.0}, {10.0, 20.0}), (std::vector<double>{11.0, 22.0}));
    EXPECT_DOUBLE_EQ(operators::sum({1.0, 2.0, 3.0}), 6.0);
    EXPECT_DOUBLE_EQ(operators::prod({2.0, 3.0, 4.0}), 24.0);
}

TEST(OperatorsTest, EmptyListReductions) {
    EXPECT_DOUBLE_EQ(operators::sum({}), 0.0);
    EXPECT_DOUBLE_EQ(operators::prod({}), 1.0);
    EXPECT_DOUBLE_EQ(operators::reduce({}, operators::add, 5.0), 5.0);
}
