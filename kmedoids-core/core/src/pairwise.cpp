#include <algorithm>
#include <cmath>
#include <kmedoids_core/pairwise.hpp>
#include <kmedoids_core/tracy.hpp>
#include <stdexcept>
#include <type_traits>

#ifdef _OPENMP
#  include <omp.h>
#endif

#include <usearch/index.hpp>
#include <usearch/index_dense.hpp>

namespace kmedoids {

  namespace {

    unum::usearch::metric_kind_t to_metric_kind(Metric metric) {
      using unum::usearch::metric_kind_t;
      switch (metric) {
        case Metric::L2:
        case Metric::L2Squared:
          return metric_kind_t::l2sq_k;
        case Metric::Cosine:
          return metric_kind_t::cos_k;
      }
      throw std::invalid_argument("unknown metric");
    }

    template <typename Scalar> constexpr unum::usearch::scalar_kind_t scalar_kind() {
      if constexpr (std::is_same_v<Scalar, float>) {
        return unum::usearch::scalar_kind_t::f32_k;
      } else {
        return unum::usearch::scalar_kind_t::f64_k;
      }
    }

  }  // namespace

  template <typename Scalar>
  DistanceMatrixT<Scalar> pairwise_distances(const Matrix<Scalar>& points, Metric metric) {
    KMEDOIDS_ZONE;
    if (points.rows() == 0 || points.cols() == 0) [[unlikely]] {
      throw std::invalid_argument("points must have at least one row and one column");
    }

    using namespace unum::usearch;
    metric_punned_t punned(points.cols(), to_metric_kind(metric), scalar_kind<Scalar>());

    const auto n = static_cast<std::ptrdiff_t>(points.rows());
    DistanceMatrixT<Scalar> distances(points.rows(), points.rows());

#ifdef _OPENMP
#  pragma omp parallel for schedule(dynamic)
#endif
    for (std::ptrdiff_t i = 0; i < n; ++i) {
      auto row = static_cast<size_t>(i);
      const auto* a = reinterpret_cast<const byte_t*>(points.row(row).data());
      for (size_t col = row + 1; col < points.rows(); ++col) {
        const auto* b = reinterpret_cast<const byte_t*>(points.row(col).data());
        auto d = static_cast<Scalar>(punned(a, b));
        if (metric == Metric::L2) d = std::sqrt(std::max(d, Scalar(0)));
        d = std::max(d, Scalar(0));
        distances(row, col) = d;
        distances(col, row) = d;
      }
      distances(row, row) = Scalar(0);
    }

    return distances;
  }

  template DistanceMatrixT<float> pairwise_distances(const Matrix<float>&, Metric);
  template DistanceMatrixT<double> pairwise_distances(const Matrix<double>&, Metric);

}  // namespace kmedoids
