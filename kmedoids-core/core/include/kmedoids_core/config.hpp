#pragma once
#include <cstddef>
#include <cstdint>
#include <kmedoids_core/matrix.hpp>
#include <optional>
#include <string>
#include <variant>

namespace kmedoids {

  // Version for format evolution
  inline constexpr const char* PROBLEM_FORMAT_VERSION = "1.0";

  // Clustering hyperparameters
  struct KMedoidsConfig {
    size_t n_clusters = 2;
    double start_prob = 0.90;  // seeding window, fraction of sorted non-medoids
    double end_prob = 0.99;
    int max_iter = 10;
    double tolerance = 0.01;
    std::optional<uint64_t> random_state;  // unset: seed from std::random_device
    bool require_symmetric = false;        // reject asymmetric matrices / non-zero diagonal
    double symmetry_tolerance = 1e-9;

    // Checks the ranges that do not depend on the matrix.
    void validate() const;
  };

  // Distance matrix in the precision it was stored with
  using DistanceMatrices = std::variant<DistanceMatrixT<float>, DistanceMatrixT<double>>;

  // A distance matrix plus the parameters to cluster it with. Only inputs are
  // serialized; clustering results are never written back.
  struct ClusteringProblem {
    std::string version = PROBLEM_FORMAT_VERSION;
    std::string dtype = "float64";  // "float32" or "float64" (single source of truth)
    KMedoidsConfig config;
    DistanceMatrices distances;

    [[nodiscard]] static ClusteringProblem from_json(const std::string& path);
    [[nodiscard]] static ClusteringProblem from_json_string(const std::string& json_str);
    [[nodiscard]] static ClusteringProblem from_msgpack(const std::string& path);
    [[nodiscard]] static ClusteringProblem from_msgpack_string(const std::string& data);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;
    void to_msgpack(const std::string& path) const;
    [[nodiscard]] std::string to_msgpack_string() const;

    void validate() const;

    [[nodiscard]] size_t n_points() const {
      return std::visit([](const auto& m) { return m.rows(); }, distances);
    }

    [[nodiscard]] bool is_float32() const noexcept {
      return std::holds_alternative<DistanceMatrixT<float>>(distances);
    }
    [[nodiscard]] bool is_float64() const noexcept {
      return std::holds_alternative<DistanceMatrixT<double>>(distances);
    }

    // Copy of the matrix converted to Scalar.
    template <typename Scalar> [[nodiscard]] DistanceMatrixT<Scalar> distances_as() const {
      return std::visit(
          [](const auto& m) {
            DistanceMatrixT<Scalar> out(m.rows(), m.cols());
            for (size_t i = 0; i < m.size(); ++i) {
              out.data()[i] = static_cast<Scalar>(m.data()[i]);
            }
            return out;
          },
          distances);
    }
  };

}  // namespace kmedoids
