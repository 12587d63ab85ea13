#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <format>
#include <fstream>
#include <kmedoids_core/config.hpp>
#include <kmedoids_core/tracy.hpp>
#include <map>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <type_traits>

using json = nlohmann::json;

namespace kmedoids {

  // ============================================================================
  // JSON Serialization - KMedoidsConfig
  // ============================================================================

  void to_json(json& j, const KMedoidsConfig& c) {
    j = {{"n_clusters", c.n_clusters},
         {"start_prob", c.start_prob},
         {"end_prob", c.end_prob},
         {"max_iter", c.max_iter},
         {"tolerance", c.tolerance},
         {"require_symmetric", c.require_symmetric},
         {"symmetry_tolerance", c.symmetry_tolerance}};
    if (c.random_state) j["random_state"] = *c.random_state;
  }

  void from_json(const json& j, KMedoidsConfig& c) {
    j.at("n_clusters").get_to(c.n_clusters);
    c.start_prob = j.value("start_prob", 0.90);
    c.end_prob = j.value("end_prob", 0.99);
    c.max_iter = j.value("max_iter", 10);
    c.tolerance = j.value("tolerance", 0.01);
    c.require_symmetric = j.value("require_symmetric", false);
    c.symmetry_tolerance = j.value("symmetry_tolerance", 1e-9);
    if (j.contains("random_state") && !j["random_state"].is_null()) {
      c.random_state = j["random_state"].get<uint64_t>();
    } else {
      c.random_state.reset();
    }
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void KMedoidsConfig::validate() const {
    if (n_clusters == 0) {
      throw std::invalid_argument("n_clusters must be positive");
    }

    if (!(0.0 <= start_prob && start_prob < end_prob && end_prob <= 1.0)) {
      throw std::invalid_argument(std::format(
          "start_prob ({}) must be in [0, end_prob) and end_prob ({}) must be in (start_prob, 1]",
          start_prob, end_prob));
    }

    if (max_iter < 0) {
      throw std::invalid_argument(std::format("max_iter must be non-negative, got {}", max_iter));
    }

    if (!std::isfinite(tolerance) || tolerance < 0.0) {
      throw std::invalid_argument(
          std::format("tolerance must be finite and non-negative, got {}", tolerance));
    }

    if (!std::isfinite(symmetry_tolerance) || symmetry_tolerance < 0.0) {
      throw std::invalid_argument(std::format(
          "symmetry_tolerance must be finite and non-negative, got {}", symmetry_tolerance));
    }
  }

  void ClusteringProblem::validate() const {
    config.validate();

    if (dtype != "float32" && dtype != "float64") {
      throw std::invalid_argument(
          std::format("dtype must be 'float32' or 'float64', got '{}'", dtype));
    }

    std::visit(
        [&](const auto& m) {
          using Scalar = typename std::decay_t<decltype(m)>::Scalar;
          bool is_double = std::is_same_v<Scalar, double>;

          if (is_double && dtype != "float64") {
            throw std::invalid_argument("Distance matrix is float64 but dtype is not 'float64'");
          }
          if (!is_double && dtype != "float32") {
            throw std::invalid_argument("Distance matrix is float32 but dtype is not 'float32'");
          }

          if (m.empty() || !m.is_square()) {
            throw std::invalid_argument(std::format(
                "distance matrix must be square and non-empty, got {}x{}", m.rows(), m.cols()));
          }

          if (config.n_clusters >= m.rows()) {
            throw std::invalid_argument(
                std::format("n_clusters ({}) must be smaller than the number of points ({})",
                            config.n_clusters, m.rows()));
          }

          if (!m.is_valid_dissimilarity()) {
            throw std::invalid_argument("distance matrix entries must be finite and non-negative");
          }

          if (config.require_symmetric) {
            auto tol = static_cast<Scalar>(config.symmetry_tolerance);
            if (!m.is_symmetric(tol) || !m.has_zero_diagonal(tol)) {
              throw std::invalid_argument(
                  "distance matrix must be symmetric with a zero diagonal");
            }
          }
        },
        distances);
  }

  // ============================================================================
  // JSON File I/O
  // ============================================================================

  namespace {

    template <typename Scalar> DistanceMatrixT<Scalar> matrix_from_json(const json& rows) {
      size_t n_rows = rows.size();
      size_t n_cols = n_rows == 0 ? 0 : rows[0].size();

      DistanceMatrixT<Scalar> m(n_rows, n_cols);
      for (size_t i = 0; i < n_rows; ++i) {
        if (rows[i].size() != n_cols) {
          throw std::invalid_argument(std::format(
              "distance_matrix row {} has {} entries, expected {}", i, rows[i].size(), n_cols));
        }
        for (size_t col = 0; col < n_cols; ++col) {
          m(i, col) = rows[i][col].get<Scalar>();
        }
      }
      return m;
    }

  }  // namespace

  ClusteringProblem ClusteringProblem::from_json(const std::string& path) {
    KMEDOIDS_ZONE;
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open problem file: {}", path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  ClusteringProblem ClusteringProblem::from_json_string(const std::string& json_str) {
    KMEDOIDS_ZONE;
    json j = json::parse(json_str);

    ClusteringProblem problem;
    problem.version = j.value("version", PROBLEM_FORMAT_VERSION);
    problem.dtype = j.value("dtype", "float64");
    problem.config = j.at("config").get<KMedoidsConfig>();

    const auto& rows = j.at("distance_matrix");
    if (!rows.is_array()) {
      throw std::invalid_argument("distance_matrix must be an array of rows");
    }

    if (problem.dtype == "float32") {
      problem.distances = matrix_from_json<float>(rows);
    } else {
      problem.distances = matrix_from_json<double>(rows);
    }
    return problem;
  }

  std::string ClusteringProblem::to_json_string() const {
    json j;

    j["version"] = version;
    j["dtype"] = dtype;
    j["config"] = config;

    std::visit(
        [&](const auto& m) {
          json rows = json::array();
          for (size_t i = 0; i < m.rows(); ++i) {
            json row = json::array();
            for (size_t col = 0; col < m.cols(); ++col) {
              row.push_back(m(i, col));
            }
            rows.push_back(row);
          }
          j["distance_matrix"] = rows;
        },
        distances);

    return j.dump(2);
  }

  void ClusteringProblem::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open problem file for writing: {}", path));
    }
    file << to_json_string();
  }

  // ============================================================================
  // MessagePack File I/O (with mmap)
  // ============================================================================

  ClusteringProblem ClusteringProblem::from_msgpack(const std::string& path) {
    KMEDOIDS_ZONE;

    int fd = open(path.c_str(), O_RDONLY);
    if (fd == -1) {
      throw std::runtime_error(std::format("Failed to open msgpack file: {}", path));
    }

    struct stat sb;
    if (fstat(fd, &sb) == -1) {
      close(fd);
      throw std::runtime_error(std::format("Failed to stat msgpack file: {}", path));
    }
    auto file_size = static_cast<size_t>(sb.st_size);
    if (file_size == 0) {
      close(fd);
      throw std::runtime_error(std::format("msgpack file is empty: {}", path));
    }

    void* mapped = mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mapped == MAP_FAILED) {
      close(fd);
      throw std::runtime_error(std::format("Failed to mmap msgpack file: {}", path));
    }

    try {
      auto result = from_msgpack_string(std::string(static_cast<const char*>(mapped), file_size));
      munmap(mapped, file_size);
      close(fd);
      return result;
    } catch (...) {
      munmap(mapped, file_size);
      close(fd);
      throw;
    }
  }

  ClusteringProblem ClusteringProblem::from_msgpack_string(const std::string& data) {
    KMEDOIDS_ZONE;

    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<std::map<std::string, msgpack::object>>();

    ClusteringProblem problem;
    problem.version
        = map.contains("version") ? map.at("version").as<std::string>() : PROBLEM_FORMAT_VERSION;
    problem.dtype = map.contains("dtype") ? map.at("dtype").as<std::string>() : "float64";

    // Clustering config
    auto cfg = map.at("config").as<std::map<std::string, msgpack::object>>();
    auto& c = problem.config;
    c.n_clusters = cfg.at("n_clusters").as<size_t>();
    c.start_prob = cfg.contains("start_prob") ? cfg.at("start_prob").as<double>() : 0.90;
    c.end_prob = cfg.contains("end_prob") ? cfg.at("end_prob").as<double>() : 0.99;
    c.max_iter = cfg.contains("max_iter") ? cfg.at("max_iter").as<int>() : 10;
    c.tolerance = cfg.contains("tolerance") ? cfg.at("tolerance").as<double>() : 0.01;
    c.require_symmetric
        = cfg.contains("require_symmetric") ? cfg.at("require_symmetric").as<bool>() : false;
    c.symmetry_tolerance
        = cfg.contains("symmetry_tolerance") ? cfg.at("symmetry_tolerance").as<double>() : 1e-9;
    if (cfg.contains("random_state") && !cfg.at("random_state").is_nil()) {
      c.random_state = cfg.at("random_state").as<uint64_t>();
    }

    // Distance matrix (binary blob)
    auto matrix_map = map.at("distance_matrix").as<std::map<std::string, msgpack::object>>();
    auto rows = matrix_map.at("rows").as<uint64_t>();
    auto cols = matrix_map.at("cols").as<uint64_t>();
    std::string bytes = matrix_map.at("data").as<std::string>();

    uint64_t total_elements = rows * cols;

    auto load = [&]<typename Scalar>(DistanceMatrixT<Scalar> m) {
      size_t expected_size = total_elements * sizeof(Scalar);
      if (bytes.size() != expected_size) {
        throw std::invalid_argument(
            std::format("distance_matrix data size mismatch: expected {} bytes, got {}",
                        expected_size, bytes.size()));
      }
      std::memcpy(m.data(), bytes.data(), expected_size);
      problem.distances = std::move(m);
    };

    if (problem.dtype == "float32") {
      load(DistanceMatrixT<float>(rows, cols));
    } else {
      load(DistanceMatrixT<double>(rows, cols));
    }

    return problem;
  }

  std::string ClusteringProblem::to_msgpack_string() const {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(4);

    pk.pack("version");
    pk.pack(version);

    pk.pack("dtype");
    pk.pack(dtype);

    // Clustering config
    pk.pack("config");
    pk.pack_map(config.random_state ? 8 : 7);
    pk.pack("n_clusters");
    pk.pack(static_cast<uint64_t>(config.n_clusters));
    pk.pack("start_prob");
    pk.pack(config.start_prob);
    pk.pack("end_prob");
    pk.pack(config.end_prob);
    pk.pack("max_iter");
    pk.pack(config.max_iter);
    pk.pack("tolerance");
    pk.pack(config.tolerance);
    pk.pack("require_symmetric");
    pk.pack(config.require_symmetric);
    pk.pack("symmetry_tolerance");
    pk.pack(config.symmetry_tolerance);
    if (config.random_state) {
      pk.pack("random_state");
      pk.pack(*config.random_state);
    }

    // Distance matrix (binary blob)
    pk.pack("distance_matrix");
    pk.pack_map(3);
    std::visit(
        [&](const auto& m) {
          using Scalar = typename std::decay_t<decltype(m)>::Scalar;
          pk.pack("rows");
          pk.pack(static_cast<uint64_t>(m.rows()));
          pk.pack("cols");
          pk.pack(static_cast<uint64_t>(m.cols()));
          pk.pack("data");
          size_t data_size = m.size() * sizeof(Scalar);
          pk.pack_bin(static_cast<uint32_t>(data_size));
          pk.pack_bin_body(reinterpret_cast<const char*>(m.data()),
                           static_cast<uint32_t>(data_size));
        },
        distances);

    return std::string(buffer.data(), buffer.size());
  }

  void ClusteringProblem::to_msgpack(const std::string& path) const {
    std::string binary_data = to_msgpack_string();
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open msgpack file for writing: {}", path));
    }
    file.write(binary_data.data(), static_cast<std::streamsize>(binary_data.size()));
  }

}  // namespace kmedoids
