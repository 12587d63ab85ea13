#include <algorithm>
#include <climits>
#include <cmath>
#include <format>
#include <kmedoids_core/kmedoids.hpp>
#include <kmedoids_core/tracy.hpp>
#include <limits>
#include <ranges>
#include <stdexcept>
#include <utility>

#ifdef _OPENMP
#  include <omp.h>
#endif

namespace kmedoids {

  namespace {

    // Every index in [0, n_points) and no index twice.
    void check_medoid_indices(std::span<const int> medoids, size_t n_points) {
      std::vector<bool> seen(n_points, false);
      for (int m : medoids) {
        if (m < 0 || static_cast<size_t>(m) >= n_points) [[unlikely]] {
          throw std::invalid_argument(std::format("medoid index {} is out of range", m));
        }
        if (seen[static_cast<size_t>(m)]) [[unlikely]] {
          throw std::invalid_argument(std::format("medoid index {} appears twice", m));
        }
        seen[static_cast<size_t>(m)] = true;
      }
    }

    template <typename Scalar>
    void check_matrix(const DistanceMatrixT<Scalar>& distances, size_t n_clusters) {
      if (distances.empty()) [[unlikely]] {
        throw std::invalid_argument("distance matrix must not be empty");
      }
      if (!distances.is_square()) [[unlikely]] {
        throw std::invalid_argument(std::format("distance matrix must be square, got {}x{}",
                                                distances.rows(), distances.cols()));
      }
      if (distances.rows() > static_cast<size_t>(INT_MAX)) [[unlikely]] {
        throw std::invalid_argument(
            std::format("distance matrix has too many points ({})", distances.rows()));
      }
      if (!distances.is_valid_dissimilarity()) [[unlikely]] {
        throw std::invalid_argument("distance matrix entries must be finite and non-negative");
      }
      if (n_clusters == 0) [[unlikely]] {
        throw std::invalid_argument("n_clusters must be positive");
      }
      if (n_clusters >= distances.rows()) [[unlikely]] {
        throw std::invalid_argument(
            std::format("n_clusters ({}) must be smaller than the number of points ({})",
                        n_clusters, distances.rows()));
      }
    }

    template <typename Scalar> void check_window(Scalar start_prob, Scalar end_prob) {
      if (!(Scalar(0) <= start_prob && start_prob < end_prob && end_prob <= Scalar(1)))
          [[unlikely]] {
        throw std::invalid_argument(std::format(
            "start_prob ({}) must be in [0, end_prob) and end_prob ({}) must be in (start_prob, 1]",
            start_prob, end_prob));
      }
    }

  }  // namespace

  std::vector<int> swap_medoid(std::span<const int> medoids, int medoid, int replacement) {
    std::vector<int> swapped;
    swapped.reserve(medoids.size());
    for (int m : medoids) {
      if (m != medoid) swapped.push_back(m);
    }
    swapped.push_back(replacement);
    return swapped;
  }

  // =============================================================================
  // Construction
  // =============================================================================

  template <typename Scalar>
  KMedoidsT<Scalar>::KMedoidsT(DistanceMatrixT<Scalar> distances, size_t n_clusters,
                               Scalar start_prob, Scalar end_prob) {
    check_window(start_prob, end_prob);
    check_matrix(distances, n_clusters);

    distances_ = std::move(distances);
    n_points_ = distances_.rows();
    n_clusters_ = n_clusters;
    start_prob_ = start_prob;
    end_prob_ = end_prob;
  }

  template <typename Scalar>
  KMedoidsT<Scalar>::KMedoidsT(DistanceMatrixT<Scalar> distances, const KMedoidsConfig& config)
      : KMedoidsT(std::move(distances), config.n_clusters, static_cast<Scalar>(config.start_prob),
                  static_cast<Scalar>(config.end_prob)) {
    config.validate();

    if (config.require_symmetric) {
      auto tol = static_cast<Scalar>(config.symmetry_tolerance);
      if (!distances_.is_symmetric(tol)) {
        throw std::invalid_argument("distance matrix is not symmetric");
      }
      if (!distances_.has_zero_diagonal(tol)) {
        throw std::invalid_argument("distance matrix diagonal must be zero");
      }
    }

    max_iter_ = config.max_iter;
    tolerance_ = static_cast<Scalar>(config.tolerance);
    random_state_ = config.random_state;
  }

  template <typename Scalar>
  std::expected<KMedoidsT<Scalar>, std::string> KMedoidsT<Scalar>::create(
      DistanceMatrixT<Scalar> distances, const KMedoidsConfig& config) noexcept {
    try {
      return KMedoidsT(std::move(distances), config);
    } catch (const std::exception& e) {
      return std::unexpected(std::string(e.what()));
    }
  }

  // =============================================================================
  // Queries
  // =============================================================================

  template <typename Scalar>
  Neighbor<Scalar> KMedoidsT<Scalar>::closest_medoid(std::span<const int> medoids,
                                                     int point) const noexcept {
    Neighbor<Scalar> best;
    for (int medoid : medoids) {
      Scalar d = distance(point, medoid);
      if (d < best.distance) {
        best.index = medoid;
        best.distance = d;
      }
    }
    return best;
  }

  template <typename Scalar>
  Neighbor<Scalar> KMedoidsT<Scalar>::closest_point(int medoid,
                                                    const std::vector<bool>& excluded) const noexcept {
    Neighbor<Scalar> best;
    const int n = static_cast<int>(n_points_);
    for (int point = 0; point < n; ++point) {
      if (static_cast<size_t>(point) < excluded.size() && excluded[static_cast<size_t>(point)]) {
        continue;
      }
      Scalar d = distance(point, medoid);
      if (d < best.distance) {
        best.index = point;
        best.distance = d;
      }
    }
    return best;
  }

  template <typename Scalar>
  Neighbor<Scalar> KMedoidsT<Scalar>::closest_point(int medoid,
                                                    std::span<const int> excluded) const {
    std::vector<bool> mask(n_points_, false);
    for (int p : excluded) {
      if (p >= 0 && static_cast<size_t>(p) < n_points_) mask[static_cast<size_t>(p)] = true;
    }
    return closest_point(medoid, mask);
  }

  template <typename Scalar>
  typename KMedoidsT<Scalar>::MedoidSet KMedoidsT<Scalar>::non_medoids(
      std::span<const int> medoids) const {
    std::vector<bool> is_medoid(n_points_, false);
    for (int m : medoids) is_medoid[static_cast<size_t>(m)] = true;

    MedoidSet points;
    points.reserve(n_points_ - std::min(n_points_, medoids.size()));
    for (size_t i = 0; i < n_points_; ++i) {
      if (!is_medoid[i]) points.push_back(static_cast<int>(i));
    }
    return points;
  }

  // =============================================================================
  // Seeding
  // =============================================================================

  template <typename Scalar>
  typename KMedoidsT<Scalar>::MedoidSet KMedoidsT<Scalar>::initialize_medoids(
      RandomEngine& rng) const {
    KMEDOIDS_ZONE;
    MedoidSet medoids;
    medoids.reserve(n_clusters_);

    std::uniform_int_distribution<int> first(0, static_cast<int>(n_points_) - 1);
    medoids.push_back(first(rng));

    struct Candidate {
      int point;
      Scalar distance;
    };
    std::vector<Candidate> candidates;
    candidates.reserve(n_points_);

    while (medoids.size() != n_clusters_) {
      candidates.clear();
      for (int point : non_medoids(medoids)) {
        candidates.push_back({point, closest_medoid(medoids, point).distance});
      }
      std::ranges::stable_sort(candidates, {}, &Candidate::distance);

      const auto count = static_cast<Scalar>(candidates.size());
      auto start_idx = static_cast<size_t>(std::floor(start_prob_ * count));
      auto end_idx = static_cast<size_t>(std::lround(end_prob_ * (count - Scalar(1))));
      // Narrow windows on short lists can invert the bounds; draw between them either way.
      size_t hi = std::min(std::max(start_idx, end_idx), candidates.size() - 1);
      size_t lo = std::min(std::min(start_idx, end_idx), hi);

      std::uniform_int_distribution<size_t> pick(lo, hi);
      medoids.push_back(candidates[pick(rng)].point);
    }
    return medoids;
  }

  // =============================================================================
  // Assignment
  // =============================================================================

  template <typename Scalar>
  Assignment<Scalar> KMedoidsT<Scalar>::associate(std::span<const int> medoids) const {
    check_medoid_indices(medoids, n_points_);
    return assign_round_robin(medoids);
  }

  template <typename Scalar>
  Assignment<Scalar> KMedoidsT<Scalar>::assign_round_robin(std::span<const int> medoids) const {
    KMEDOIDS_ZONE;
    Assignment<Scalar> result;
    result.clusters.resize(medoids.size());
    result.labels.assign(n_points_, -1);

    std::vector<bool> assigned(n_points_, false);
    size_t n_assigned = 0;
    for (size_t c = 0; c < medoids.size(); ++c) {
      auto medoid = static_cast<size_t>(medoids[c]);
      result.clusters[c].medoid = medoids[c];
      result.clusters[c].members.push_back(medoids[c]);
      if (!assigned[medoid]) ++n_assigned;
      assigned[medoid] = true;
      result.labels[medoid] = static_cast<int>(c);
    }

    while (n_assigned != n_points_ && !medoids.empty()) {
      for (size_t c = 0; c < medoids.size(); ++c) {
        auto nearest = closest_point(medoids[c], assigned);
        if (!nearest.found()) continue;

        auto point = static_cast<size_t>(nearest.index);
        auto& cluster = result.clusters[c];
        cluster.members.push_back(nearest.index);
        cluster.total_distance += nearest.distance;
        assigned[point] = true;
        result.labels[point] = static_cast<int>(c);
        ++n_assigned;
      }
    }

    for (const auto& cluster : result.clusters) {
      result.cost += cluster.mean_distance();
    }
    return result;
  }

  template <typename Scalar>
  Assignment<Scalar> KMedoidsT<Scalar>::nearest_assignment(std::span<const int> medoids) const {
    check_medoid_indices(medoids, n_points_);

    Assignment<Scalar> result;
    result.clusters.resize(medoids.size());
    result.labels.assign(n_points_, -1);

    for (size_t c = 0; c < medoids.size(); ++c) {
      result.clusters[c].medoid = medoids[c];
      result.clusters[c].members.push_back(medoids[c]);
      result.labels[static_cast<size_t>(medoids[c])] = static_cast<int>(c);
    }

    for (size_t p = 0; p < n_points_; ++p) {
      if (result.labels[p] >= 0) continue;

      auto nearest = closest_medoid(medoids, static_cast<int>(p));
      if (!nearest.found()) continue;

      auto pos = std::ranges::find(medoids, nearest.index) - medoids.begin();
      auto& cluster = result.clusters[static_cast<size_t>(pos)];
      cluster.members.push_back(static_cast<int>(p));
      cluster.total_distance += nearest.distance;
      result.labels[p] = static_cast<int>(pos);
    }

    for (const auto& cluster : result.clusters) {
      result.cost += cluster.mean_distance();
    }
    return result;
  }

  // =============================================================================
  // Refinement
  // =============================================================================

  template <typename Scalar>
  std::optional<size_t> KMedoidsT<Scalar>::find_improving_swap(const MedoidSet& current,
                                                               int medoid,
                                                               const MedoidSet& candidates,
                                                               Scalar best_cost) const {
#ifdef _OPENMP
    // Evaluate every swap against the same best cost, then keep the first
    // improving one so the outcome matches the sequential scan.
    const auto n_candidates = static_cast<std::ptrdiff_t>(candidates.size());
    std::vector<Scalar> costs(candidates.size(), std::numeric_limits<Scalar>::infinity());

#  pragma omp parallel for schedule(dynamic)
    for (std::ptrdiff_t i = 0; i < n_candidates; ++i) {
      auto idx = static_cast<size_t>(i);
      costs[idx] = assign_round_robin(swap_medoid(current, medoid, candidates[idx])).cost;
    }

    for (size_t i = 0; i < costs.size(); ++i) {
      if (costs[i] < best_cost) return i;
    }
    return std::nullopt;
#else
    for (size_t i = 0; i < candidates.size(); ++i) {
      if (assign_round_robin(swap_medoid(current, medoid, candidates[i])).cost < best_cost) {
        return i;
      }
    }
    return std::nullopt;
#endif
  }

  template <typename Scalar> RandomEngine KMedoidsT<Scalar>::make_rng() const {
    if (random_state_) return RandomEngine(*random_state_);
    std::random_device rd;
    return RandomEngine(rd());
  }

  template <typename Scalar> ClusteringResult<Scalar> KMedoidsT<Scalar>::run() const {
    auto rng = make_rng();
    return run(rng, max_iter_, tolerance_);
  }

  template <typename Scalar>
  ClusteringResult<Scalar> KMedoidsT<Scalar>::run(int max_iterations, Scalar tolerance) const {
    auto rng = make_rng();
    return run(rng, max_iterations, tolerance);
  }

  template <typename Scalar>
  ClusteringResult<Scalar> KMedoidsT<Scalar>::run(RandomEngine& rng, int max_iterations,
                                                  Scalar tolerance) const {
    KMEDOIDS_ZONE;
    return refine(initialize_medoids(rng), max_iterations, tolerance);
  }

  template <typename Scalar>
  ClusteringResult<Scalar> KMedoidsT<Scalar>::refine(MedoidSet medoids, int max_iterations,
                                                     Scalar tolerance) const {
    KMEDOIDS_ZONE;
    if (medoids.size() != n_clusters_) [[unlikely]] {
      throw std::invalid_argument(std::format("expected {} initial medoids, got {}",
                                              n_clusters_, medoids.size()));
    }
    check_medoid_indices(medoids, n_points_);

    ClusteringResult<Scalar> result;
    Assignment<Scalar> best = assign_round_robin(medoids);
    result.initial_cost = best.cost;

    Scalar cost_change = std::numeric_limits<Scalar>::infinity();
    int iteration = 0;
    while (cost_change > tolerance && iteration < max_iterations) {
      KMEDOIDS_ZONE_N("kmedoids pass");
      cost_change = Scalar(0);

      const MedoidSet pass_medoids = medoids;
      for (int medoid : pass_medoids) {
        const MedoidSet candidates = non_medoids(medoids);
        auto found = find_improving_swap(medoids, medoid, candidates, best.cost);
        if (!found) continue;

        // The outgoing medoid is gone after this, so its remaining swaps no
        // longer describe a k-medoid configuration.
        MedoidSet swapped = swap_medoid(medoids, medoid, candidates[*found]);
        Assignment<Scalar> assignment = assign_round_robin(swapped);
        cost_change = best.cost - assignment.cost;
        medoids = std::move(swapped);
        best = std::move(assignment);
        ++result.n_swaps;
      }
      ++iteration;
    }

    result.medoids = std::move(medoids);
    result.clusters = std::move(best.clusters);
    result.labels = std::move(best.labels);
    result.cost = best.cost;
    result.iterations = iteration;
    result.converged = cost_change <= tolerance;
    return result;
  }

  template class KMedoidsT<float>;
  template class KMedoidsT<double>;

}  // namespace kmedoids
