/// @file src/clustering/kmeans.cpp
/// @brief KMeansClusterer: Lloyd iteration over the session × item matrix.
///
/// Each run():
///   1. Seeds k centroids by copying k distinct random rows
///   2. Assigns rows to their nearest centroid (strict `<` keeps ties on the
///      lower index)
///   3. Stops as soon as an assignment repeats, else moves every non-empty
///      centroid to its members' mean and repeats, up to max_iterations

#include "semdiff/clustering.hpp"
#include "semdiff/errors.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <limits>
#include <utility>

namespace semdiff {

// ─── validate ─────────────────────────────────────────────────────────────────

void KMeansClusterer::validate(int k, int max_iterations) {
    if (k <= 0) {
        throw InvalidConfiguration(fmt::format("cluster count k must be positive, got {}", k));
    }
    if (max_iterations <= 0) {
        throw InvalidConfiguration(
            fmt::format("max_iterations must be positive, got {}", max_iterations));
    }
}

// ─── build_matrix ─────────────────────────────────────────────────────────────

ResponseMatrix KMeansClusterer::build_matrix(std::span<const Session>   sessions,
                                             std::span<const ScaleItem> items) {
    const auto n = static_cast<Eigen::Index>(sessions.size());
    const auto m = static_cast<Eigen::Index>(items.size());

    // Missing answers stay at 0: "no response" is modelled as neutral.
    ResponseMatrix matrix = ResponseMatrix::Zero(n, m);
    for (Eigen::Index row = 0; row < n; ++row) {
        const auto& session = sessions[static_cast<std::size_t>(row)];
        for (Eigen::Index col = 0; col < m; ++col) {
            if (auto v = session.response_value(items[static_cast<std::size_t>(col)].id)) {
                matrix(row, col) = *v;
            }
        }
    }
    return matrix;
}

// ─── sample_indices ───────────────────────────────────────────────────────────

std::vector<Eigen::Index>
KMeansClusterer::sample_indices(Eigen::Index n, int k, ClusterRng& rng) {
    std::vector<Eigen::Index> picked;
    if (n <= 0) {
        return picked;
    }
    const auto target = std::min<Eigen::Index>(n, k);
    picked.reserve(static_cast<std::size_t>(target));

    // Rejection sampling; k is small relative to n in practice.
    std::uniform_int_distribution<Eigen::Index> dist(0, n - 1);
    while (static_cast<Eigen::Index>(picked.size()) < target) {
        const Eigen::Index idx = dist(rng);
        if (std::find(picked.begin(), picked.end(), idx) == picked.end()) {
            picked.push_back(idx);
        }
    }
    return picked;
}

// ─── nearest_centroid ─────────────────────────────────────────────────────────

int KMeansClusterer::nearest_centroid(const Eigen::RowVectorXd& point,
                                      const Eigen::MatrixXd&    centroids) noexcept {
    double min_dist = std::numeric_limits<double>::infinity();
    int    nearest  = 0;
    for (Eigen::Index c = 0; c < centroids.rows(); ++c) {
        const double dist = (point - centroids.row(c)).norm();
        if (dist < min_dist) {
            min_dist = dist;
            nearest  = static_cast<int>(c);
        }
    }
    return nearest;
}

// ─── run ──────────────────────────────────────────────────────────────────────

KMeansResult KMeansClusterer::run(const ResponseMatrix& matrix,
                                  int                   k,
                                  int                   max_iterations,
                                  ClusterRng&           rng) {
    validate(k, max_iterations);

    const Eigen::Index n = matrix.rows();
    const Eigen::Index m = matrix.cols();

    KMeansResult result;
    result.centroids = Eigen::MatrixXd::Zero(k, m);

    const auto seeds = sample_indices(n, k, rng);
    for (std::size_t c = 0; c < seeds.size(); ++c) {
        result.centroids.row(static_cast<Eigen::Index>(c)) = matrix.row(seeds[c]);
    }

    std::vector<int> assignments;  // empty until the first pass
    for (int iter = 0; iter < max_iterations; ++iter) {
        std::vector<int> next(static_cast<std::size_t>(n));
        for (Eigen::Index row = 0; row < n; ++row) {
            next[static_cast<std::size_t>(row)] =
                nearest_centroid(matrix.row(row), result.centroids);
        }
        result.iterations = iter + 1;

        if (next == assignments) {
            result.converged = true;
            break;
        }
        assignments = std::move(next);

        // Recompute: sum members per cluster, divide where non-empty.
        Eigen::MatrixXd sums   = Eigen::MatrixXd::Zero(k, m);
        Eigen::VectorXi counts = Eigen::VectorXi::Zero(k);
        for (Eigen::Index row = 0; row < n; ++row) {
            const int c = assignments[static_cast<std::size_t>(row)];
            sums.row(c) += matrix.row(row);
            ++counts(c);
        }
        for (int c = 0; c < k; ++c) {
            if (counts(c) > 0) {
                result.centroids.row(c) = sums.row(c) / static_cast<double>(counts(c));
            }
            // An empty cluster keeps its previous centroid.
        }
    }

    result.assignments = std::move(assignments);
    return result;
}

// ─── inertia ──────────────────────────────────────────────────────────────────

double KMeansClusterer::inertia(const ResponseMatrix& matrix,
                                const KMeansResult&   result) noexcept {
    double total = 0.0;
    const auto n = std::min<Eigen::Index>(
        matrix.rows(), static_cast<Eigen::Index>(result.assignments.size()));
    for (Eigen::Index row = 0; row < n; ++row) {
        const int c = result.assignments[static_cast<std::size_t>(row)];
        if (c < 0 || c >= result.centroids.rows()) continue;
        total += (matrix.row(row) - result.centroids.row(c)).squaredNorm();
    }
    return total;
}

// ─── cluster ──────────────────────────────────────────────────────────────────

std::vector<ClusterAssignment>
KMeansClusterer::cluster(std::span<const Session>   sessions,
                         std::span<const ScaleItem> items,
                         int                        k,
                         int                        max_iterations,
                         ClusterRng&                rng) {
    validate(k, max_iterations);

    std::vector<Session> completed;
    completed.reserve(sessions.size());
    for (const auto& s : sessions) {
        if (s.is_completed()) completed.push_back(s);
    }

    // Too little data to form k clusters, or nothing to cluster on.
    if (completed.size() < static_cast<std::size_t>(k) || items.empty()) {
        return {};
    }

    const ResponseMatrix matrix = build_matrix(completed, items);
    const KMeansResult   result = run(matrix, k, max_iterations, rng);

    std::vector<ClusterAssignment> clusters;
    for (int c = 0; c < k; ++c) {
        ClusterAssignment out;
        out.cluster_id = c;
        out.centroid   = result.centroids.row(c).transpose();
        for (std::size_t i = 0; i < completed.size(); ++i) {
            if (result.assignments[i] == c) {
                out.members.push_back(completed[i].id);
            }
        }
        out.member_count = out.members.size();
        if (out.member_count > 0) {
            clusters.push_back(std::move(out));
        }
    }
    return clusters;
}

std::vector<ClusterAssignment>
KMeansClusterer::cluster(std::span<const Session>   sessions,
                         std::span<const ScaleItem> items,
                         int                        k,
                         int                        max_iterations) {
    std::random_device device;
    ClusterRng rng(device());
    return cluster(sessions, items, k, max_iterations, rng);
}

}  // namespace semdiff
