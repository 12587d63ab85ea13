#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <vector>

namespace kmedoids {

  // Dense row-major matrix. Used as the pairwise distance matrix (n x n) and
  // as the embedding input of pairwise_distances (n x dim).
  template <typename T> class Matrix {
  public:
    using value_type = T;
    using Scalar = T;

    Matrix() = default;

    Matrix(size_t rows, size_t cols) : rows_(rows), cols_(cols), data_(rows * cols) {}

    Matrix(size_t rows, size_t cols, const T* src)
        : rows_(rows), cols_(cols), data_(src, src + rows * cols) {}

    // Builds a matrix from nested rows; every row must have the same length.
    Matrix(std::initializer_list<std::initializer_list<T>> rows) {
      rows_ = rows.size();
      cols_ = rows_ == 0 ? 0 : rows.begin()->size();
      data_.reserve(rows_ * cols_);
      for (const auto& row : rows) {
        if (row.size() != cols_) {
          throw std::invalid_argument("all matrix rows must have the same length");
        }
        data_.insert(data_.end(), row.begin(), row.end());
      }
    }

    [[nodiscard]] static Matrix from_rows(const std::vector<std::vector<T>>& rows) {
      Matrix m(rows.size(), rows.empty() ? 0 : rows.front().size());
      for (size_t i = 0; i < m.rows_; ++i) {
        if (rows[i].size() != m.cols_) {
          throw std::invalid_argument("all matrix rows must have the same length");
        }
        std::ranges::copy(rows[i], m.data_.begin() + static_cast<std::ptrdiff_t>(i * m.cols_));
      }
      return m;
    }

    [[nodiscard]] size_t rows() const noexcept { return rows_; }
    [[nodiscard]] size_t cols() const noexcept { return cols_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] T* data() noexcept { return data_.data(); }
    [[nodiscard]] const T* data() const noexcept { return data_.data(); }

    T& operator()(size_t row, size_t col) { return data_[row * cols_ + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * cols_ + col]; }

    [[nodiscard]] std::span<const T> row(size_t r) const noexcept {
      return {data_.data() + r * cols_, cols_};
    }

    void resize(size_t rows, size_t cols) {
      rows_ = rows;
      cols_ = cols;
      data_.resize(rows * cols);
    }

    [[nodiscard]] bool is_square() const noexcept { return rows_ == cols_; }

    [[nodiscard]] bool is_symmetric(T tolerance = T(0)) const noexcept {
      if (!is_square()) return false;
      for (size_t i = 0; i < rows_; ++i) {
        for (size_t j = i + 1; j < cols_; ++j) {
          if (std::abs((*this)(i, j) - (*this)(j, i)) > tolerance) return false;
        }
      }
      return true;
    }

    [[nodiscard]] bool has_zero_diagonal(T tolerance = T(0)) const noexcept {
      if (!is_square()) return false;
      for (size_t i = 0; i < rows_; ++i) {
        if (std::abs((*this)(i, i)) > tolerance) return false;
      }
      return true;
    }

    // True when every entry is finite and >= 0.
    [[nodiscard]] bool is_valid_dissimilarity() const noexcept {
      return std::ranges::all_of(data_, [](T v) { return std::isfinite(v) && v >= T(0); });
    }

  private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<T> data_;
  };

  template <typename Scalar> using DistanceMatrixT = Matrix<Scalar>;
  using DistanceMatrix = DistanceMatrixT<double>;
  using DistanceMatrix32 = DistanceMatrixT<float>;

}  // namespace kmedoids
