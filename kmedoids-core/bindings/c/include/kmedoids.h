#ifndef KMEDOIDS_H
#define KMEDOIDS_H

#include <stddef.h>
#include <stdint.h>

/* Cross-platform DLL export/import macros */
#if defined(_WIN32) || defined(_WIN64)
#  ifdef KMEDOIDS_C_EXPORTS
#    define KMEDOIDS_API __declspec(dllexport)
#  else
#    define KMEDOIDS_API __declspec(dllimport)
#  endif
#else
#  if __GNUC__ >= 4
#    define KMEDOIDS_API __attribute__((visibility("default")))
#  else
#    define KMEDOIDS_API
#  endif
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Opaque handle to a K-Medoids engine
 */
typedef struct KMedoidsEngine KMedoidsEngine;

/**
 * Clustering result structure
 */
typedef struct {
  int* medoids;         /**< Medoid point indices (n_clusters entries) */
  size_t n_clusters;    /**< Number of medoids */
  int* labels;          /**< Cluster position of every point (n_points entries) */
  size_t n_points;      /**< Number of points */
  double cost;          /**< Final configuration cost */
  int iterations;       /**< Refinement passes performed */
  int converged;        /**< Non-zero if the cost change fell within tolerance */
} KMedoidsResult;

/**
 * Error codes for kmedoids operations
 */
typedef enum {
  KMEDOIDS_OK = 0,
  KMEDOIDS_ERROR_NULL_ENGINE,
  KMEDOIDS_ERROR_NULL_ARGUMENT,
  KMEDOIDS_ERROR_INVALID_PARAMETER,
  KMEDOIDS_ERROR_IO,
  KMEDOIDS_ERROR_ALLOCATION_FAILED,
  KMEDOIDS_ERROR_INTERNAL
} KMedoidsErrorCode;

/**
 * Create an engine from a row-major n x n distance matrix
 * @param distances Pointer to n * n distances
 * @param n Number of points
 * @param n_clusters Number of clusters (must be smaller than n)
 * @param start_prob Start of the seeding window, in [0, end_prob)
 * @param end_prob End of the seeding window, in (start_prob, 1]
 * @param error_out Optional error code output (can be NULL)
 * @return Engine handle, or NULL on error
 */
KMEDOIDS_API KMedoidsEngine* kmedoids_create(const double* distances, size_t n,
                                             size_t n_clusters, double start_prob,
                                             double end_prob, KMedoidsErrorCode* error_out);

/**
 * Create an engine from a JSON problem string (config + distance_matrix)
 * @param json_str JSON string containing the problem
 * @param error_out Optional error code output (can be NULL)
 * @return Engine handle, or NULL on error
 */
KMEDOIDS_API KMedoidsEngine* kmedoids_create_from_json(const char* json_str,
                                                       KMedoidsErrorCode* error_out);

/**
 * Create an engine from a problem file (.json, anything else is read as MessagePack)
 * @param path Path to the problem file
 * @param error_out Optional error code output (can be NULL)
 * @return Engine handle, or NULL on error
 */
KMEDOIDS_API KMedoidsEngine* kmedoids_create_from_file(const char* path,
                                                       KMedoidsErrorCode* error_out);

/**
 * Destroy an engine and free its resources
 * @param engine Engine handle
 */
KMEDOIDS_API void kmedoids_destroy(KMedoidsEngine* engine);

/**
 * Run seeding and refinement
 * @param engine Engine handle
 * @param max_iterations Maximum refinement passes (0 runs seeding and assignment only)
 * @param tolerance Stop once a pass improves the cost by no more than this
 * @param seed Seed for the random source
 * @param error_out Optional error code output (can be NULL)
 * @return Result (caller must free with kmedoids_result_free)
 */
KMEDOIDS_API KMedoidsResult* kmedoids_run(KMedoidsEngine* engine, int max_iterations,
                                          double tolerance, uint64_t seed,
                                          KMedoidsErrorCode* error_out);

/**
 * Free a result
 * @param result Result to free
 */
KMEDOIDS_API void kmedoids_result_free(KMedoidsResult* result);

/**
 * Get number of points
 * @param engine Engine handle
 * @return Number of points, 0 for a NULL engine
 */
KMEDOIDS_API size_t kmedoids_get_n_points(const KMedoidsEngine* engine);

/**
 * Get number of clusters
 * @param engine Engine handle
 * @return Number of clusters, 0 for a NULL engine
 */
KMEDOIDS_API size_t kmedoids_get_n_clusters(const KMedoidsEngine* engine);

#ifdef __cplusplus
}
#endif

#endif /* KMEDOIDS_H */
