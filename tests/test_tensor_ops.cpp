#include <vector>

#include "weft/operators.h"
#include "weft/tensor/tensor_ops.h"
#include <gtest/gtest.h>

using namespace weft;

namespace {

double plus(double a, double b) {
    return a + b;
}

std::vector<double> values(const TensorData& t) {
    std::vector<double> out;
    for (const Index& idx : t.indices()) {
        out.push_back(t.get(idx));
    }
    return out;
}

}  // namespace

// ============================================================================
// Constructors
// ============================================================================

TEST(TensorOpsTest, FullZerosOnes) {
    EXPECT_EQ(values(ops::full({2, 2}, 3.0)), (std::vector<double>{3, 3, 3, 3}));
    EXPECT_EQ(values(ops::zeros({3})), (std::vector<double>{0, 0, 0}));
    EXPECT_EQ(values(ops::ones({1, 2})), (std::vector<double>{1, 1}));
}

TEST(TensorOpsTest, ZerosAreContiguousAndIndependent) {
    TensorData a = ops::zeros({2, 3});
    TensorData b = ops::zeros({2, 3});
    EXPECT_EQ(a.strides(), (Strides{3, 1}));
    EXPECT_FALSE(a.isSameStorage(b));
    a.set({0, 0}, 1.0);
    EXPECT_EQ(b.get({0, 0}), 0.0);
}

TEST(TensorOpsTest, ScalarIsZeroDimensional) {
    TensorData s = ops::scalar(2.5);
    EXPECT_EQ(s.dims(), 0u);
    EXPECT_EQ(s.get({}), 2.5);
}

// ============================================================================
// map / zip / reduce
// ============================================================================

TEST(TensorOpsTest, MapOfPermutedViewIsContiguous) {
    TensorData t(std::vector<double>{0, 1, 2, 3, 4, 5}, Shape{2, 3});
    TensorData out = ops::map(t.permute({1, 0}), operators::neg);

    EXPECT_EQ(out.shape(), (Shape{3, 2}));
    EXPECT_EQ(out.strides(), (Strides{2, 1}));
    EXPECT_EQ(values(out), (std::vector<double>{0, -3, -1, -4, -2, -5}));
}

TEST(TensorOpsTest, ZipSameShape) {
    TensorData a(std::vector<double>{1, 2, 3}, Shape{3});
    TensorData b(std::vector<double>{10, 20, 30}, Shape{3});
    EXPECT_EQ(values(ops::zip(a, b, plus)), (std::vector<double>{11, 22, 33}));
}

TEST(TensorOpsTest, ZipBroadcastsRowAgainstColumn) {
    TensorData column(std::vector<double>{1, 2}, Shape{2, 1});
    TensorData row(std::vector<double>{10, 20, 30}, Shape{3});

    TensorData out = ops::zip(column, row, plus);
    EXPECT_EQ(out.shape(), (Shape{2, 3}));
    EXPECT_EQ(values(out), (std::vector<double>{11, 21, 31, 12, 22, 32}));
}

TEST(TensorOpsTest, ZipBroadcastsZeroDimensional) {
    TensorData a(std::vector<double>{1, 2, 3, 4}, Shape{2, 2});
    TensorData out = ops::zip(a, ops::scalar(2.0), operators::mul);
    EXPECT_EQ(values(out), (std::vector<double>{2, 4, 6, 8}));
}

TEST(TensorOpsTest, ZipRejectsIncompatibleShapes) {
    EXPECT_THROW((void)ops::zip(ops::zeros({2, 3}), ops::zeros({2}), plus), IndexingError);
}

TEST(TensorOpsTest, ReduceKeepsRank) {
    TensorData t(std::vector<double>{0, 1, 2, 3, 4, 5}, Shape{2, 3});

    TensorData rows = ops::reduce(t, 1, plus, 0.0);
    EXPECT_EQ(rows.shape(), (Shape{2, 1}));
    EXPECT_EQ(values(rows), (std::vector<double>{3, 12}));

    TensorData cols = ops::reduce(t, 0, plus, 0.0);
    EXPECT_EQ(cols.shape(), (Shape{1, 3}));
    EXPECT_EQ(values(cols), (std::vector<double>{3, 5, 7}));
}

TEST(TensorOpsTest, ReduceUsesStart) {
    TensorData t(std::vector<double>{2, 3, 4}, Shape{3});
    EXPECT_EQ(values(ops::reduce(t, 0, operators::mul, 1.0)), (std::vector<double>{24}));
}

TEST(TensorOpsTest, ReduceRejectsBadDimension) {
    EXPECT_THROW((void)ops::reduce(ops::zeros({2, 3}), 2, plus, 0.0), IndexingError);
}

// ============================================================================
// Broadcast Helpers
// ============================================================================

TEST(TensorOpsTest, SumToUndoesBroadcast) {
    TensorData grad = ops::ones({2, 3});

    EXPECT_EQ(values(ops::sumTo(grad, {3})), (std::vector<double>{2, 2, 2}));
    EXPECT_EQ(values(ops::sumTo(grad, {2, 1})), (std::vector<double>{3, 3}));
    EXPECT_EQ(values(ops::sumTo(grad, {})), (std::vector<double>{6}));
}

TEST(TensorOpsTest, SumToSameShapeReturnsGradient) {
    TensorData grad = ops::ones({2, 3});
    EXPECT_TRUE(ops::sumTo(grad, {2, 3}).isSameStorage(grad));
}

TEST(TensorOpsTest, SumToRejectsIncompatibleShape) {
    EXPECT_THROW((void)ops::sumTo(ops::ones({2, 3}), {2}), IndexingError);
    EXPECT_THROW((void)ops::sumTo(ops::ones({3}), {2, 3}), IndexingError);
}

TEST(TensorOpsTest, ExpandRepeatsAlongSizeOneDimensions) {
    TensorData column(std::vector<double>{1, 2}, Shape{2, 1});
    TensorData out = ops::expand(column, {2, 3});
    EXPECT_EQ(out.shape(), (Shape{2, 3}));
    EXPECT_EQ(values(out), (std::vector<double>{1, 1, 1, 2, 2, 2}));
}
