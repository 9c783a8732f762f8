#ifndef ORD_NMDS_HPP
#define ORD_NMDS_HPP

#include "ord_types.hpp"
#include "ord_config.hpp"
#include "ord_dissimilarity.hpp"
#include "ord_utils.hpp"
#include <cstddef>
#include <vector>

namespace ord {

struct NMDSResult {
    std::vector<Point2> coordinates;
    dp_t stress = 0.0;           // Kruskal stress-1 of the returned layout
    bool converged = false;      // stress < NMDSConfig::convergence_stress
    integer_t iterations = 0;    // Iterations used by the winning attempt
    integer_t attempts_run = 0;
    integer_t best_attempt = -1; // -1 when a fallback layout was returned
    FitStatus status = FitStatus::OK;
};

// Outcome of a single optimization attempt
struct NMDSAttempt {
    std::vector<Point2> points;
    dp_t stress = 0.0;
    integer_t iterations = 0;
    bool finite = true;       // No NaN/Inf appeared
    bool degenerate = false;  // An axis range collapsed below the threshold
    bool valid() const { return finite && !degenerate; }
};

/**
 * @brief Kruskal stress-1 of a configuration against the rank order of D.
 *
 * sqrt(sum((d - t)^2) / sum(d^2)) where t is the monotone fit of the
 * configuration distances d to the dissimilarity ranks. Pairs with zero
 * dissimilarity have target 0. Returns NaN when all points coincide.
 */
dp_t kruskal_stress(const std::vector<Point2>& points, const DissimilarityMatrix& D);

/**
 * @brief Starting configuration for one attempt.
 *
 * Attempt 0 is a circle, attempt 1 a grid, attempt 2 the PCoA layout when
 * one is supplied; the rest are uniform random at scales cycling 2, 4, 6.
 */
std::vector<Point2> initial_configuration(size_t n, integer_t attempt, MT19937& rng,
                                          const std::vector<Point2>* pcoa_start);

// Runs one attempt from a given start; never throws for numerical trouble
NMDSAttempt run_nmds_attempt(const DissimilarityMatrix& D, std::vector<Point2> start,
                             const NMDSConfig& config);

/**
 * @brief Non-metric Multidimensional Scaling onto two axes.
 *
 * Runs up to max_attempts independent attempts (in parallel under OpenMP),
 * keeps the lowest finite stress among non-degenerate ones, centers it and
 * scales it so max |coordinate| equals display_bound. The choice is
 * independent of thread count for a fixed seed.
 *
 * N < 3, an all-zero matrix, or no valid attempt yields the unit-circle
 * fallback layout with a non-OK status.
 */
NMDSResult compute_nmds(const DissimilarityMatrix& D, const NMDSConfig& config = NMDSConfig());

} // namespace ord

#endif // ORD_NMDS_HPP
