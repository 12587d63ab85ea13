#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <algorithm>
#include <cstdint>
#include <kmedoids_core/config.hpp>
#include <kmedoids_core/kmedoids.hpp>
#include <kmedoids_core/pairwise.hpp>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;
using namespace kmedoids;

namespace {

  using MatrixArray = nb::ndarray<const double, nb::ndim<2>, nb::c_contig, nb::device::cpu>;

  DistanceMatrix to_matrix(const MatrixArray& array) {
    return DistanceMatrix(array.shape(0), array.shape(1), array.data());
  }

}  // namespace

NB_MODULE(kmedoids_core_ext, m) {
  m.doc() = "K-Medoids clustering over precomputed distance matrices";

  nb::enum_<Metric>(m, "Metric", "Distance used by pairwise_distances")
      .value("L2", Metric::L2)
      .value("L2_SQUARED", Metric::L2Squared)
      .value("COSINE", Metric::Cosine);

  nb::class_<Cluster<double>>(m, "Cluster", "One cluster of a clustering result")
      .def_ro("medoid", &Cluster<double>::medoid, "Medoid point index")
      .def_ro("members", &Cluster<double>::members, "Member indices, medoid first")
      .def_ro("total_distance", &Cluster<double>::total_distance,
          "Sum of member distances to the medoid")
      .def_prop_ro("mean_distance", &Cluster<double>::mean_distance,
          "Mean member distance to the medoid")
      .def("__len__", &Cluster<double>::size)
      .def("__repr__", [](const Cluster<double>& c) {
          return "<Cluster medoid=" + std::to_string(c.medoid) + " size="
                 + std::to_string(c.size()) + ">";
      });

  nb::class_<ClusteringResult<double>>(m, "ClusteringResult", "Outcome of KMedoids.run")
      .def_ro("medoids", &ClusteringResult<double>::medoids, "Medoid indices")
      .def_ro("clusters", &ClusteringResult<double>::clusters, "Clusters in medoid order")
      .def_ro("labels", &ClusteringResult<double>::labels,
          "Cluster position of every point")
      .def_ro("cost", &ClusteringResult<double>::cost, "Final configuration cost")
      .def_ro("initial_cost", &ClusteringResult<double>::initial_cost,
          "Configuration cost after seeding")
      .def_ro("iterations", &ClusteringResult<double>::iterations, "Refinement passes run")
      .def_ro("n_swaps", &ClusteringResult<double>::n_swaps, "Accepted medoid swaps")
      .def_ro("converged", &ClusteringResult<double>::converged,
          "Whether the last pass improved the cost by at most the tolerance")
      .def("cluster_sizes", &ClusteringResult<double>::cluster_sizes);

  nb::class_<KMedoids>(m, "KMedoids", "K-Medoids clustering engine")
      .def("__init__",
          [](KMedoids* self, const MatrixArray& distances, size_t n_clusters, double start_prob,
             double end_prob) {
            new (self) KMedoids(to_matrix(distances), n_clusters, start_prob, end_prob);
          },
          "distances"_a, "n_clusters"_a = 2, "start_prob"_a = 0.90, "end_prob"_a = 0.99,
          "Create an engine over a square distance matrix\n\n"
          "Raises:\n"
          "    ValueError: if the probability window is invalid or n_clusters >= n_points")
      .def_static("from_problem_file",
          [](const std::string& path) {
            auto problem = path.ends_with(".json") ? ClusteringProblem::from_json(path)
                                                   : ClusteringProblem::from_msgpack(path);
            problem.validate();
            return new KMedoids(problem.distances_as<double>(), problem.config);
          },
          "path"_a, nb::rv_policy::take_ownership,
          "Create an engine from a JSON or MessagePack problem file")
      .def("run",
          [](const KMedoids& self, int max_iterations, double tolerance,
             std::optional<uint64_t> seed) {
            if (max_iterations < 0) {
              throw std::invalid_argument("max_iterations must be non-negative");
            }
            RandomEngine rng(seed ? *seed : std::random_device{}());
            return self.run(rng, max_iterations, tolerance);
          },
          "max_iterations"_a = 10, "tolerance"_a = 0.01, "seed"_a = nb::none(),
          nb::call_guard<nb::gil_scoped_release>(),
          "Seed medoids and refine them by single swaps")
      .def_prop_ro("n_points", &KMedoids::n_points)
      .def_prop_ro("n_clusters", &KMedoids::n_clusters)
      .def_prop_ro("start_prob", &KMedoids::start_prob)
      .def_prop_ro("end_prob", &KMedoids::end_prob);

  m.def("pairwise_distances",
      [](nb::ndarray<const double, nb::ndim<2>, nb::c_contig, nb::device::cpu> points,
         Metric metric) {
        Matrix<double> input(points.shape(0), points.shape(1), points.data());
        auto distances = pairwise_distances(input, metric);
        size_t n = distances.rows();
        auto* data = new double[distances.size()];
        std::copy(distances.data(), distances.data() + distances.size(), data);
        nb::capsule owner(data, [](void* p) noexcept { delete[] static_cast<double*>(p); });
        return nb::ndarray<nb::numpy, double, nb::ndim<2>>(data, {n, n}, owner);
      },
      "points"_a, "metric"_a = Metric::L2,
      "Distance matrix between the rows of points");
}
