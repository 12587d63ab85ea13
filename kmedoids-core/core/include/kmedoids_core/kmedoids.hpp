#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <kmedoids_core/config.hpp>
#include <kmedoids_core/matrix.hpp>
#include <limits>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace kmedoids {

  // Random source used for medoid seeding. Pass a seeded engine for reproducible runs.
  using RandomEngine = std::mt19937_64;

  // Result of a nearest-neighbor scan. index is -1 when nothing was eligible.
  template <typename Scalar> struct Neighbor {
    int index = -1;
    Scalar distance = std::numeric_limits<Scalar>::infinity();

    [[nodiscard]] bool found() const noexcept { return index >= 0; }
  };

  template <typename Scalar> struct Cluster {
    int medoid = -1;
    std::vector<int> members;  // medoid first, then in assignment order
    Scalar total_distance = Scalar(0);

    [[nodiscard]] size_t size() const noexcept { return members.size(); }
    [[nodiscard]] Scalar mean_distance() const noexcept {
      return members.empty() ? Scalar(0) : total_distance / static_cast<Scalar>(members.size());
    }
  };

  // Partition of all points for one medoid set.
  template <typename Scalar> struct Assignment {
    std::vector<Cluster<Scalar>> clusters;  // same order as the medoid set
    std::vector<int> labels;                // labels[point] = position in clusters
    Scalar cost = Scalar(0);                // sum of per-cluster mean distances
  };

  template <typename Scalar> struct ClusteringResult {
    std::vector<int> medoids;
    std::vector<Cluster<Scalar>> clusters;
    std::vector<int> labels;
    Scalar cost = Scalar(0);
    Scalar initial_cost = Scalar(0);
    int iterations = 0;
    int n_swaps = 0;
    bool converged = false;

    [[nodiscard]] const Cluster<Scalar>& cluster_of(int point) const {
      return clusters.at(static_cast<size_t>(labels.at(static_cast<size_t>(point))));
    }

    [[nodiscard]] std::vector<int> cluster_sizes() const {
      std::vector<int> sizes;
      sizes.reserve(clusters.size());
      for (const auto& c : clusters) sizes.push_back(static_cast<int>(c.size()));
      return sizes;
    }
  };

  // K-Medoids clustering over a precomputed distance matrix.
  //
  // Seeding draws each new medoid from the [start_prob, end_prob] window of
  // the non-medoids sorted by distance to their closest medoid. Assignment is
  // round-robin: medoids take turns claiming their closest unassigned point,
  // so a point is not necessarily placed with its globally nearest medoid.
  // Refinement greedily accepts any single medoid swap that lowers the cost.
  //
  // The matrix must be square with finite non-negative entries. Symmetry and
  // a zero diagonal are assumed and only checked when the config asks for it.
  // The engine is immutable after construction; run() returns its result.
  template <typename Scalar> class KMedoidsT {
  public:
    using MedoidSet = std::vector<int>;

    explicit KMedoidsT(DistanceMatrixT<Scalar> distances, size_t n_clusters = 2,
                       Scalar start_prob = Scalar(0.90), Scalar end_prob = Scalar(0.99));
    KMedoidsT(DistanceMatrixT<Scalar> distances, const KMedoidsConfig& config);

    // Non-throwing construction; the error holds the validation message.
    [[nodiscard]] static std::expected<KMedoidsT, std::string> create(
        DistanceMatrixT<Scalar> distances, const KMedoidsConfig& config) noexcept;

    ~KMedoidsT() = default;

    KMedoidsT(KMedoidsT&&) = default;
    KMedoidsT& operator=(KMedoidsT&&) = default;
    KMedoidsT(const KMedoidsT&) = delete;
    KMedoidsT& operator=(const KMedoidsT&) = delete;

    [[nodiscard]] size_t n_points() const noexcept { return n_points_; }
    [[nodiscard]] size_t n_clusters() const noexcept { return n_clusters_; }
    [[nodiscard]] Scalar start_prob() const noexcept { return start_prob_; }
    [[nodiscard]] Scalar end_prob() const noexcept { return end_prob_; }
    [[nodiscard]] const DistanceMatrixT<Scalar>& distances() const noexcept { return distances_; }

    [[nodiscard]] Scalar distance(int a, int b) const {
      return distances_(static_cast<size_t>(a), static_cast<size_t>(b));
    }

    // Picks n_clusters distinct medoids, the first uniformly, the rest from the
    // far tail of the distance-to-closest-medoid distribution.
    [[nodiscard]] MedoidSet initialize_medoids(RandomEngine& rng) const;

    // Closest medoid to point; ties keep the earliest medoid in the set.
    // point and every medoid must be in [0, n_points); not checked.
    [[nodiscard]] Neighbor<Scalar> closest_medoid(std::span<const int> medoids,
                                                  int point) const noexcept;

    // Closest point to medoid among points not flagged in excluded (size n_points).
    // medoid must be in [0, n_points); not checked. Out-of-range excluded entries are ignored.
    [[nodiscard]] Neighbor<Scalar> closest_point(int medoid,
                                                 const std::vector<bool>& excluded) const noexcept;
    [[nodiscard]] Neighbor<Scalar> closest_point(int medoid, std::span<const int> excluded) const;

    // Round-robin assignment of every point and the resulting configuration cost.
    // Throws std::invalid_argument unless medoids are distinct indices in [0, n_points).
    [[nodiscard]] Assignment<Scalar> associate(std::span<const int> medoids) const;

    // Classic assignment of every point to its nearest medoid, with the same cost definition.
    // Not used by run(); provided for comparison with textbook PAM. Same checks as associate().
    [[nodiscard]] Assignment<Scalar> nearest_assignment(std::span<const int> medoids) const;

    // Points not in medoids, ascending.
    [[nodiscard]] MedoidSet non_medoids(std::span<const int> medoids) const;

    // Uses max_iter, tolerance and random_state from the construction config.
    [[nodiscard]] ClusteringResult<Scalar> run() const;
    // Seeds from random_state when configured, otherwise from std::random_device.
    [[nodiscard]] ClusteringResult<Scalar> run(int max_iterations,
                                               Scalar tolerance = Scalar(0.01)) const;
    [[nodiscard]] ClusteringResult<Scalar> run(RandomEngine& rng, int max_iterations = 10,
                                               Scalar tolerance = Scalar(0.01)) const;

    // Swap refinement from caller-chosen medoids: n_clusters distinct indices in range.
    // Passes stop once a pass improves the cost by at most tolerance.
    [[nodiscard]] ClusteringResult<Scalar> refine(MedoidSet medoids, int max_iterations = 10,
                                                  Scalar tolerance = Scalar(0.01)) const;

  private:
    // associate() without the index checks; medoids are already valid.
    [[nodiscard]] Assignment<Scalar> assign_round_robin(std::span<const int> medoids) const;

    // First candidate whose swap with medoid lowers best_cost. candidates must be
    // non_medoids(current) and medoid a member of current.
    [[nodiscard]] std::optional<size_t> find_improving_swap(const MedoidSet& current, int medoid,
                                                            const MedoidSet& candidates,
                                                            Scalar best_cost) const;

    [[nodiscard]] RandomEngine make_rng() const;

    DistanceMatrixT<Scalar> distances_;
    size_t n_points_ = 0;
    size_t n_clusters_ = 0;
    Scalar start_prob_ = Scalar(0.90);
    Scalar end_prob_ = Scalar(0.99);
    int max_iter_ = 10;
    Scalar tolerance_ = Scalar(0.01);
    std::optional<uint64_t> random_state_;
  };

  using KMedoids = KMedoidsT<double>;
  using KMedoids32 = KMedoidsT<float>;

  // Returns a copy of medoids with medoid removed and replacement appended.
  [[nodiscard]] std::vector<int> swap_medoid(std::span<const int> medoids, int medoid,
                                             int replacement);

}  // namespace kmedoids
