#include "ITHIM.Core/array2d.h"
#include "pch.h"

TEST(TestCore_Array2D, CreateEmptyStorage) {
    using namespace ithim::core;

    auto d3x2 = DoubleArray2D(3, 2);

    ASSERT_EQ(3, d3x2.rows());
    ASSERT_EQ(2, d3x2.columns());
    ASSERT_EQ(6, d3x2.size());
}

TEST(TestCore_Array2D, CreateFullFromVector) {
    using namespace ithim::core;

    std::vector<int> n = {2, 1, 5, 7, 8, 9, 7, 3, 5, 4, 2, 9};
    auto i3x4v = IntegerArray2D(3, 4, n);

    ASSERT_EQ(12, i3x4v.size());
    ASSERT_EQ(2, i3x4v(0, 0));
    ASSERT_EQ(8, i3x4v(1, 0));
    ASSERT_EQ(9, i3x4v(2, 3));
    ASSERT_EQ(n, i3x4v.to_vector());
}

TEST(TestCore_Array2D, CreateWithZeroSizeThrows) {
    using namespace ithim::core;

    ASSERT_THROW(IntegerArray2D(0, 5), std::invalid_argument);
    ASSERT_THROW(IntegerArray2D(5, 0), std::invalid_argument);
}

TEST(TestCore_Array2D, CreateWithSizeMismatchThrows) {
    using namespace ithim::core;
    std::vector<int> n = {2, 1, 5, 7, 8, 9, 7, 3, 5, 4, 2, 9};

    ASSERT_THROW(IntegerArray2D(3, 3, n), std::invalid_argument);
}

TEST(TestCore_Array2D, AccessOutOfBoundsThrows) {
    using namespace ithim::core;

    auto data = DoubleArray2D(3, 2, 1.0);

    ASSERT_THROW(data(3, 0), std::out_of_range);
    ASSERT_THROW(data(0, 2), std::out_of_range);
    ASSERT_THROW(data.row_sum(3), std::out_of_range);
}

TEST(TestCore_Array2D, RowSumAndFill) {
    using namespace ithim::core;

    auto data = DoubleArray2D(2, 3, {1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
    ASSERT_DOUBLE_EQ(6.0, data.row_sum(0));
    ASSERT_DOUBLE_EQ(15.0, data.row_sum(1));

    data.fill(2.0);
    ASSERT_DOUBLE_EQ(6.0, data.row_sum(1));

    data.clear();
    ASSERT_DOUBLE_EQ(0.0, data.row_sum(0));
}

TEST(TestCore_Array2D, EqualityComparesShapeAndValues) {
    using namespace ithim::core;

    auto a = DoubleArray2D(2, 3, 1.5);
    auto b = DoubleArray2D(2, 3, 1.5);
    auto c = DoubleArray2D(3, 2, 1.5);

    ASSERT_EQ(a, b);
    ASSERT_NE(a, c);

    b(1, 1) = 0.0;
    ASSERT_NE(a, b);
}
