#include <gtest/gtest.h>

#include <kmedoids_core/matrix.hpp>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace kmedoids;

template <typename Scalar> class MatrixTestT : public ::testing::Test {};

using ScalarTypes = ::testing::Types<float, double>;
TYPED_TEST_SUITE(MatrixTestT, ScalarTypes);

TYPED_TEST(MatrixTestT, NestedRowsAreRowMajor) {
  Matrix<TypeParam> m{{0, 1, 2}, {3, 4, 5}};
  EXPECT_EQ(m.rows(), 2u);
  EXPECT_EQ(m.cols(), 3u);
  EXPECT_EQ(m.size(), 6u);
  EXPECT_EQ(m(1, 0), TypeParam(3));
  EXPECT_EQ(m.data()[4], TypeParam(4));

  auto row = m.row(1);
  ASSERT_EQ(row.size(), 3u);
  EXPECT_EQ(row[2], TypeParam(5));
}

TYPED_TEST(MatrixTestT, RaggedRowsThrow) {
  EXPECT_THROW((Matrix<TypeParam>{{0, 1}, {2}}), std::invalid_argument);

  std::vector<std::vector<TypeParam>> rows = {{0, 1}, {1, 0, 2}};
  EXPECT_THROW((void)Matrix<TypeParam>::from_rows(rows), std::invalid_argument);
}

TYPED_TEST(MatrixTestT, FromRowsCopiesValues) {
  std::vector<std::vector<TypeParam>> rows = {{0, 2}, {2, 0}};
  auto m = Matrix<TypeParam>::from_rows(rows);
  EXPECT_TRUE(m.is_square());
  EXPECT_EQ(m(0, 1), TypeParam(2));
  EXPECT_EQ(m(1, 1), TypeParam(0));
}

TYPED_TEST(MatrixTestT, DefaultIsEmpty) {
  Matrix<TypeParam> m;
  EXPECT_TRUE(m.empty());
  EXPECT_EQ(m.rows(), 0u);
  EXPECT_TRUE(m.is_square());
}

TYPED_TEST(MatrixTestT, SymmetryRespectsTolerance) {
  Matrix<TypeParam> m{{0, 1}, {TypeParam(1.25), 0}};
  EXPECT_FALSE(m.is_symmetric());
  EXPECT_TRUE(m.is_symmetric(TypeParam(0.5)));

  Matrix<TypeParam> rect(2, 3);
  EXPECT_FALSE(rect.is_symmetric());
  EXPECT_FALSE(rect.has_zero_diagonal());
}

TYPED_TEST(MatrixTestT, ZeroDiagonal) {
  Matrix<TypeParam> m{{0, 1}, {1, 0}};
  EXPECT_TRUE(m.has_zero_diagonal());
  m(1, 1) = TypeParam(0.5);
  EXPECT_FALSE(m.has_zero_diagonal());
  EXPECT_TRUE(m.has_zero_diagonal(TypeParam(1)));
}

TYPED_TEST(MatrixTestT, DissimilarityRejectsNegativeAndNonFinite) {
  Matrix<TypeParam> m{{0, 1}, {1, 0}};
  EXPECT_TRUE(m.is_valid_dissimilarity());

  m(0, 1) = TypeParam(-0.5);
  EXPECT_FALSE(m.is_valid_dissimilarity());

  m(0, 1) = std::numeric_limits<TypeParam>::infinity();
  EXPECT_FALSE(m.is_valid_dissimilarity());

  m(0, 1) = std::numeric_limits<TypeParam>::quiet_NaN();
  EXPECT_FALSE(m.is_valid_dissimilarity());
}

TYPED_TEST(MatrixTestT, ResizeChangesShape) {
  Matrix<TypeParam> m(2, 2);
  m.resize(3, 4);
  EXPECT_EQ(m.rows(), 3u);
  EXPECT_EQ(m.cols(), 4u);
  EXPECT_EQ(m.size(), 12u);
  EXPECT_FALSE(m.is_square());
}
