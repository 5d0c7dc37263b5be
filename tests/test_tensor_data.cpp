#include <random>
#include <string>
#include <vector>

#include "weft/check.h"
#include "weft/tensor/storage.h"
#include "weft/tensor/tensor_data.h"
#include <gtest/gtest.h>

using namespace weft;

class TensorDataTest : public ::testing::Test {
  protected:
    // 2 x 3 tensor holding 0..5 in row-major order
    TensorData makeMatrix() const {
        return TensorData(std::vector<double>{0, 1, 2, 3, 4, 5}, Shape{2, 3});
    }
};

// ============================================================================
// Storage
// ============================================================================

TEST(StorageTest, ZeroInitialised) {
    Storage storage(4);
    EXPECT_EQ(storage.size(), 4u);
    for (size_t i = 0; i < storage.size(); ++i) {
        EXPECT_EQ(storage[i], 0.0);
    }
}

TEST(StorageTest, CopiesShareCloneDoesNot) {
    Storage a(std::vector<double>{1.0, 2.0});
    Storage shallow = a;
    Storage deep = a.clone();

    a[0] = 9.0;
    EXPECT_TRUE(shallow.sharesBufferWith(a));
    EXPECT_EQ(shallow[0], 9.0);
    EXPECT_FALSE(deep.sharesBufferWith(a));
    EXPECT_EQ(deep[0], 1.0);
}

// ============================================================================
// Construction
// ============================================================================

TEST_F(TensorDataTest, DefaultStridesAreContiguous) {
    TensorData t = makeMatrix();
    EXPECT_EQ(t.shape(), (Shape{2, 3}));
    EXPECT_EQ(t.strides(), (Strides{3, 1}));
    EXPECT_EQ(t.dims(), 2u);
    EXPECT_EQ(t.size(), 6u);
    EXPECT_TRUE(t.isContiguous());
}

TEST_F(TensorDataTest, StridesLengthMismatchIsFatal) {
    EXPECT_THROW(TensorData(std::vector<double>(6, 0.0), Shape{2, 3}, Strides{1}),
                 InvariantError);
}

TEST_F(TensorDataTest, StorageSizeMismatchIsFatal) {
    EXPECT_THROW(TensorData(std::vector<double>(5, 0.0), Shape{2, 3}), InvariantError);
}

TEST_F(TensorDataTest, ZeroDimensionalHoldsOneValue) {
    TensorData t(std::vector<double>{3.5}, Shape{});
    EXPECT_EQ(t.size(), 1u);
    EXPECT_EQ(t.dims(), 0u);
    EXPECT_EQ(t.get({}), 3.5);
}

// ============================================================================
// Indexing
// ============================================================================

TEST_F(TensorDataTest, GetAndSetUseStrides) {
    TensorData t = makeMatrix();
    EXPECT_EQ(t.get({1, 2}), 5.0);
    EXPECT_EQ(t.index({1, 0}), 3u);

    t.set({0, 1}, 42.0);
    EXPECT_EQ(t.get({0, 1}), 42.0);
    EXPECT_EQ(t.storage()[1], 42.0);
}

TEST_F(TensorDataTest, BareIntegerIndexesOneDimensional) {
    TensorData t(std::vector<double>{4, 5, 6}, Shape{3});
    EXPECT_EQ(t.index(int64_t{2}), 2u);
    EXPECT_THROW((void)makeMatrix().index(int64_t{0}), IndexingError);
}

TEST_F(TensorDataTest, IndexRejectsWrongRank) {
    TensorData t = makeMatrix();
    try {
        (void)t.index({0});
        FAIL() << "expected IndexingError";
    } catch (const IndexingError& e) {
        EXPECT_NE(std::string(e.what()).find("must be size of"), std::string::npos);
    }
}

TEST_F(TensorDataTest, IndexRejectsOutOfRange) {
    TensorData t = makeMatrix();
    try {
        (void)t.index({2, 0});
        FAIL() << "expected IndexingError";
    } catch (const IndexingError& e) {
        EXPECT_NE(std::string(e.what()).find("out of range"), std::string::npos);
    }
}

TEST_F(TensorDataTest, IndexRejectsNegative) {
    TensorData t = makeMatrix();
    try {
        (void)t.index({0, -1});
        FAIL() << "expected IndexingError";
    } catch (const IndexingError& e) {
        EXPECT_NE(std::string(e.what()).find("Negative indexing"), std::string::npos);
    }
}

TEST_F(TensorDataTest, IndicesEnumeratesEveryCoordinate) {
    TensorData t = makeMatrix();
    double expected = 0.0;
    size_t count = 0;
    for (const Index& idx : t.indices()) {
        EXPECT_EQ(t.get(idx), expected);
        expected += 1.0;
        ++count;
    }
    EXPECT_EQ(count, t.size());
}

TEST_F(TensorDataTest, SampleStaysInRange) {
    TensorData t(std::vector<double>(60, 0.0), Shape{3, 4, 5});
    std::mt19937 engine(42);
    for (int i = 0; i < 100; ++i) {
        Index idx = t.sample(engine);
        ASSERT_EQ(idx.size(), 3u);
        EXPECT_NO_THROW((void)t.index(idx));
    }
}

TEST_F(TensorDataTest, SampleFromEmptyShapeThrows) {
    TensorData t(std::vector<double>{}, Shape{2, 0});
    std::mt19937 engine(42);
    EXPECT_THROW((void)t.sample(engine), IndexingError);
}

// ============================================================================
// Views
// ============================================================================

TEST_F(TensorDataTest, PermuteSwapsShapeAndStrides) {
    TensorData t = makeMatrix();
    TensorData p = t.permute({1, 0});

    EXPECT_EQ(p.shape(), (Shape{3, 2}));
    EXPECT_EQ(p.strides(), (Strides{1, 3}));
    EXPECT_TRUE(p.isSameStorage(t));
    EXPECT_FALSE(p.isContiguous());

    for (const Index& idx : p.indices()) {
        EXPECT_EQ(p.get(idx), t.get({idx[1], idx[0]}));
    }
}

TEST_F(TensorDataTest, PermuteThenInverseRestoresLayout) {
    TensorData t(std::vector<double>(24, 0.0), Shape{2, 3, 4});
    const std::vector<int> order{2, 0, 1};
    std::vector<int> inverse(order.size());
    for (size_t i = 0; i < order.size(); ++i) {
        inverse[order[i]] = static_cast<int>(i);
    }

    TensorData p = t.permute(order);
    EXPECT_EQ(p.shape(), (Shape{4, 2, 3}));

    TensorData back = p.permute(inverse);
    EXPECT_EQ(back.shape(), t.shape());
    EXPECT_EQ(back.strides(), t.strides());
    EXPECT_TRUE(back.isSameStorage(t));
}

TEST_F(TensorDataTest, PermuteWritesAreVisibleThroughOriginal) {
    TensorData t = makeMatrix();
    TensorData p = t.permute({1, 0});
    p.set({2, 1}, -1.0);
    EXPECT_EQ(t.get({1, 2}), -1.0);
}

TEST_F(TensorDataTest, IdentityPermuteSharesStorage) {
    TensorData t = makeMatrix();
    TensorData p = t.permute({0, 1});
    EXPECT_EQ(p.shape(), t.shape());
    EXPECT_EQ(p.strides(), t.strides());
    EXPECT_TRUE(p.isSameStorage(t));
}

TEST_F(TensorDataTest, PermuteRejectsNonPermutation) {
    TensorData t = makeMatrix();
    EXPECT_THROW((void)t.permute({0}), InvariantError);
    EXPECT_THROW((void)t.permute({0, 0}), InvariantError);
    EXPECT_THROW((void)t.permute({0, 2}), InvariantError);
    EXPECT_THROW((void)t.permute({-1, 0}), InvariantError);
}

TEST_F(TensorDataTest, ContiguousCopiesPermutedLayout) {
    TensorData t = makeMatrix();
    TensorData p = t.permute({1, 0});
    TensorData c = p.contiguous();

    EXPECT_FALSE(c.isSameStorage(t));
    EXPECT_EQ(c.strides(), (Strides{2, 1}));
    for (const Index& idx : c.indices()) {
        EXPECT_EQ(c.get(idx), p.get(idx));
    }
}

TEST_F(TensorDataTest, ContiguousOfContiguousIsView) {
    TensorData t = makeMatrix();
    EXPECT_TRUE(t.contiguous().isSameStorage(t));
}

TEST_F(TensorDataTest, IsContiguousDetectsIncreasingStride) {
    TensorData t(std::vector<double>(6, 0.0), Shape{2, 3}, Strides{1, 2});
    EXPECT_FALSE(t.isContiguous());
}

// ============================================================================
// Formatting
// ============================================================================

TEST_F(TensorDataTest, ToStringNestsRows) {
    TensorData t(std::vector<double>{1, 2, 3, 4}, Shape{2, 2});
    const std::string text = t.toString();
    EXPECT_NE(text.find("[1.00 2.00]"), std::string::npos);
    EXPECT_NE(text.find("[3.00 4.00]]"), std::string::npos);
}
