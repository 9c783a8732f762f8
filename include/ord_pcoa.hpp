#ifndef ORD_PCOA_HPP
#define ORD_PCOA_HPP

#include "ord_types.hpp"
#include "ord_config.hpp"
#include "ord_dissimilarity.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <utility>
#include <vector>

namespace ord {

// One eigenpair found by power iteration
struct EigenPair {
    dp_t eigenvalue = 0.0;
    std::vector<dp_t> vector;
    integer_t iterations = 0;
    bool converged = false;
    bool finite = true;
};

struct PCoAResult {
    std::vector<Point2> coordinates;
    std::array<dp_t, 2> variance_explained{{0.0, 0.0}};  // Percent per axis
    dp_t total_variance_explained = 0.0;
    std::array<dp_t, 2> eigenvalues{{0.0, 0.0}};
    FitStatus status = FitStatus::OK;
};

/**
 * @brief Gower double centering of the squared dissimilarities.
 *
 * G[i][j] = -0.5 * (D[i][j]^2 - rowMean[i] - colMean[j] + grandMean)
 *
 * @return Row-major n x n symmetric matrix
 */
std::vector<dp_t> double_center(const DissimilarityMatrix& D);

/**
 * @brief Dominant eigenpair of a symmetric matrix by power iteration.
 *
 * The seed is orthogonalized against prior_vectors, then v <- normalize(G v)
 * is repeated (re-orthogonalizing after every multiply) until v moves less
 * than tolerance or max_iterations is reached. The eigenvalue is v'Gv.
 *
 * @param G Row-major n x n symmetric matrix
 * @param prior_vectors Unit eigenvectors already extracted
 * @param seed Starting vector (length n)
 * @param shift Iterate on G + shift*I; with shift >= -lambda_min the
 *        largest (not largest-magnitude) eigenvalue is found
 */
EigenPair power_iteration(const std::vector<dp_t>& G, size_t n,
                          const std::vector<std::vector<dp_t>>& prior_vectors,
                          std::vector<dp_t> seed,
                          integer_t max_iterations, dp_t tolerance, dp_t shift = 0.0);

/**
 * @brief Full eigenvalue spectrum of the double-centered matrix (LAPACK dsyevd).
 *
 * @return Eigenvalues in descending order
 * @throws std::runtime_error if LAPACK reports a failure
 */
std::vector<dp_t> compute_pcoa_spectrum(const DissimilarityMatrix& D);

/**
 * @brief Principal Coordinates Analysis onto two axes.
 *
 * Deterministic for a given matrix and config. Degenerate input (N < 3 or
 * an all-zero matrix) returns the unit-circle fallback layout with
 * placeholder variance (50/30) and status DEGENERATE_INPUT.
 *
 * @throws std::runtime_error if memory_check is on and the matrix does not fit
 */
PCoAResult compute_pcoa(const DissimilarityMatrix& D, const PCoAConfig& config = PCoAConfig());

// Estimate memory required for PCoA on n communities
size_t estimate_pcoa_memory(integer_t n_communities);

/**
 * @brief Check if the machine has sufficient memory for PCoA.
 *
 * @param available_memory_bytes Available memory in bytes (0 = read /proc/meminfo)
 * @return (can_compute, error_message)
 */
std::pair<bool, std::string> check_pcoa_memory(integer_t n_communities, size_t available_memory_bytes = 0);

} // namespace ord

#endif // ORD_PCOA_HPP
