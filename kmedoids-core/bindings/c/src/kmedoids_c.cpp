#include <algorithm>
#include <cstdlib>
#include <exception>
#include <kmedoids_core/config.hpp>
#include <kmedoids_core/kmedoids.hpp>
#include <memory>
#include <msgpack.hpp>
#include <new>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

#include "kmedoids.h"

using kmedoids::ClusteringProblem;
using kmedoids::KMedoids;

namespace {

  void set_error(KMedoidsErrorCode* error_out, KMedoidsErrorCode code) {
    if (error_out) *error_out = code;
  }

  // Maps the exception in flight to an error code. Must be called from a catch block.
  KMedoidsErrorCode current_error_code() {
    try {
      throw;
    } catch (const std::invalid_argument&) {
      return KMEDOIDS_ERROR_INVALID_PARAMETER;
    } catch (const nlohmann::json::exception&) {
      return KMEDOIDS_ERROR_INVALID_PARAMETER;
    } catch (const msgpack::unpack_error&) {
      return KMEDOIDS_ERROR_INVALID_PARAMETER;
    } catch (const msgpack::type_error&) {
      return KMEDOIDS_ERROR_INVALID_PARAMETER;
    } catch (const std::bad_alloc&) {
      return KMEDOIDS_ERROR_ALLOCATION_FAILED;
    } catch (const std::runtime_error&) {
      return KMEDOIDS_ERROR_IO;
    } catch (const std::exception&) {
      return KMEDOIDS_ERROR_INTERNAL;
    }
    return KMEDOIDS_ERROR_INTERNAL;
  }

  KMedoidsEngine* to_handle(KMedoids engine) {
    return reinterpret_cast<KMedoidsEngine*>(new KMedoids(std::move(engine)));
  }

  KMedoidsEngine* from_problem(const ClusteringProblem& problem) {
    problem.validate();
    return to_handle(KMedoids(problem.distances_as<double>(), problem.config));
  }

  bool has_json_extension(const std::string& path) {
    constexpr std::string_view ext = ".json";
    return path.size() >= ext.size() && path.ends_with(ext);
  }

  void free_result_contents(KMedoidsResult* result) {
    free(result->medoids);
    result->medoids = nullptr;
    free(result->labels);
    result->labels = nullptr;
  }

}  // namespace

extern "C" {

KMedoidsEngine* kmedoids_create(const double* distances, size_t n, size_t n_clusters,
                                double start_prob, double end_prob, KMedoidsErrorCode* error_out) {
  if (!distances) {
    set_error(error_out, KMEDOIDS_ERROR_NULL_ARGUMENT);
    return nullptr;
  }

  try {
    kmedoids::DistanceMatrix matrix(n, n, distances);
    auto* handle = to_handle(KMedoids(std::move(matrix), n_clusters, start_prob, end_prob));
    set_error(error_out, KMEDOIDS_OK);
    return handle;
  } catch (const std::exception&) {
    set_error(error_out, current_error_code());
    return nullptr;
  }
}

KMedoidsEngine* kmedoids_create_from_json(const char* json_str, KMedoidsErrorCode* error_out) {
  if (!json_str) {
    set_error(error_out, KMEDOIDS_ERROR_NULL_ARGUMENT);
    return nullptr;
  }

  try {
    auto* handle = from_problem(ClusteringProblem::from_json_string(json_str));
    set_error(error_out, KMEDOIDS_OK);
    return handle;
  } catch (const std::exception&) {
    set_error(error_out, current_error_code());
    return nullptr;
  }
}

KMedoidsEngine* kmedoids_create_from_file(const char* path, KMedoidsErrorCode* error_out) {
  if (!path) {
    set_error(error_out, KMEDOIDS_ERROR_NULL_ARGUMENT);
    return nullptr;
  }

  try {
    std::string p(path);
    auto problem = has_json_extension(p) ? ClusteringProblem::from_json(p)
                                         : ClusteringProblem::from_msgpack(p);
    auto* handle = from_problem(problem);
    set_error(error_out, KMEDOIDS_OK);
    return handle;
  } catch (const std::exception&) {
    set_error(error_out, current_error_code());
    return nullptr;
  }
}

void kmedoids_destroy(KMedoidsEngine* engine) {
  if (engine) {
    delete reinterpret_cast<KMedoids*>(engine);
  }
}

KMedoidsResult* kmedoids_run(KMedoidsEngine* engine, int max_iterations, double tolerance,
                             uint64_t seed, KMedoidsErrorCode* error_out) {
  if (!engine) {
    set_error(error_out, KMEDOIDS_ERROR_NULL_ENGINE);
    return nullptr;
  }
  if (max_iterations < 0 || !(tolerance >= 0.0)) {
    set_error(error_out, KMEDOIDS_ERROR_INVALID_PARAMETER);
    return nullptr;
  }

  try {
    const auto* cpp_engine = reinterpret_cast<const KMedoids*>(engine);
    kmedoids::RandomEngine rng(seed);
    auto clustering = cpp_engine->run(rng, max_iterations, tolerance);

    auto* result = static_cast<KMedoidsResult*>(calloc(1, sizeof(KMedoidsResult)));
    if (!result) {
      set_error(error_out, KMEDOIDS_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }

    result->n_clusters = clustering.medoids.size();
    result->n_points = clustering.labels.size();
    result->medoids = static_cast<int*>(malloc(result->n_clusters * sizeof(int)));
    result->labels = static_cast<int*>(malloc(result->n_points * sizeof(int)));
    if (!result->medoids || !result->labels) {
      free_result_contents(result);
      free(result);
      set_error(error_out, KMEDOIDS_ERROR_ALLOCATION_FAILED);
      return nullptr;
    }

    std::ranges::copy(clustering.medoids, result->medoids);
    std::ranges::copy(clustering.labels, result->labels);
    result->cost = clustering.cost;
    result->iterations = clustering.iterations;
    result->converged = clustering.converged ? 1 : 0;

    set_error(error_out, KMEDOIDS_OK);
    return result;
  } catch (const std::exception&) {
    set_error(error_out, current_error_code());
    return nullptr;
  }
}

void kmedoids_result_free(KMedoidsResult* result) {
  if (!result) return;
  free_result_contents(result);
  free(result);
}

size_t kmedoids_get_n_points(const KMedoidsEngine* engine) {
  if (!engine) return 0;
  return reinterpret_cast<const KMedoids*>(engine)->n_points();
}

size_t kmedoids_get_n_clusters(const KMedoidsEngine* engine) {
  if (!engine) return 0;
  return reinterpret_cast<const KMedoids*>(engine)->n_clusters();
}

}  // extern "C"
