#pragma once
#include <kmedoids_core/matrix.hpp>

namespace kmedoids {

  enum class Metric { L2, L2Squared, Cosine };

  // Builds the n x n distance matrix between the rows of points (n x dim).
  // The result is symmetric with an exact zero diagonal; cosine distances are
  // clamped at zero to absorb rounding.
  template <typename Scalar>
  [[nodiscard]] DistanceMatrixT<Scalar> pairwise_distances(const Matrix<Scalar>& points,
                                                           Metric metric = Metric::L2);

}  // namespace kmedoids
