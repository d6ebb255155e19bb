#pragma once

/// @file include/semdiff/clustering.hpp
/// @brief KMeansClusterer: unsupervised grouping of participant profiles.
///
/// # Module: K-Means Clusterer
///
/// ## Responsibility
/// Partition completed sessions into at most k clusters of similar response
/// vectors using Lloyd's iteration over an n × m Eigen matrix.
///
/// ## Algorithm
/// 1. Matrix: one row per completed session, one column per scale item.
///    A missing response is 0, the neutral midpoint, so every row has the
///    same dimensionality.
/// 2. Init: k distinct row indices drawn uniformly without replacement from
///    the supplied generator; those rows become the initial centroids.
/// 3. Repeat up to max_iterations:
///    - assign each row to the nearest centroid (Euclidean, strict `<`, so
///      the lowest index wins ties)
///    - stop if the assignment vector equals the previous one
///    - otherwise move each centroid to the mean of its rows; a centroid with
///      no rows keeps its coordinates
/// 4. Emit clusters 0..k-1, dropping empty ones.
///
/// ## Randomness
/// The generator is injected. Two runs on identical data with generators in
/// the same state produce identical output. The overload without a
/// generator seeds one from std::random_device.
///
/// ## Edge Cases
/// - Fewer completed sessions than k: empty result (not an error)
/// - No scale items: empty result
/// - k <= 0 or max_iterations <= 0: InvalidConfiguration
///
/// ## NOT Responsible For
/// - Choosing k, or guaranteeing a global optimum

#include "semdiff/types.hpp"

#include <random>
#include <span>
#include <vector>

namespace semdiff {

/// Random source used for centroid seeding.
using ClusterRng = std::mt19937_64;

/// Matrix-level outcome of one k-means run.
struct KMeansResult {
    std::vector<int> assignments;  ///< Cluster index per row
    Eigen::MatrixXd  centroids;    ///< k × m
    int              iterations = 0;
    bool             converged  = false;  ///< Stopped on a repeated assignment
};

class KMeansClusterer {
public:
    KMeansClusterer() = delete;

    /// Cluster completed sessions over the given items.
    [[nodiscard]] static std::vector<ClusterAssignment>
    cluster(std::span<const Session>   sessions,
            std::span<const ScaleItem> items,
            int                        k,
            int                        max_iterations,
            ClusterRng&                rng);

    /// As above, seeding a fresh generator from std::random_device.
    [[nodiscard]] static std::vector<ClusterAssignment>
    cluster(std::span<const Session>   sessions,
            std::span<const ScaleItem> items,
            int                        k,
            int                        max_iterations);

    /// Build the n × m response matrix over `sessions` (no status filter).
    [[nodiscard]] static ResponseMatrix
    build_matrix(std::span<const Session> sessions, std::span<const ScaleItem> items);

    /// Run k-means on a prepared matrix.
    /// Precondition: matrix.rows() >= k and k, max_iterations > 0.
    [[nodiscard]] static KMeansResult run(const ResponseMatrix& matrix,
                                          int                   k,
                                          int                   max_iterations,
                                          ClusterRng&           rng);

    /// Within-cluster sum of squared distances for a finished run.
    [[nodiscard]] static double inertia(const ResponseMatrix& matrix,
                                        const KMeansResult&   result) noexcept;

    /// k distinct indices in [0, n), in draw order.
    [[nodiscard]] static std::vector<Eigen::Index>
    sample_indices(Eigen::Index n, int k, ClusterRng& rng);

    /// Index of the nearest centroid row; lowest index wins ties.
    [[nodiscard]] static int nearest_centroid(const Eigen::RowVectorXd& point,
                                              const Eigen::MatrixXd&    centroids) noexcept;

private:
    static void validate(int k, int max_iterations);
};

}  // namespace semdiff
