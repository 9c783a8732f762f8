#include "ord_pcoa.hpp"
#include "ord_layout.hpp"
#include "ord_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <stdexcept>

// LAPACK function declarations
extern "C" {
    void dsyevd_(const char* jobz, const char* uplo, const int* n, double* a, const int* lda,
                 double* w, double* work, const int* lwork, int* iwork, const int* liwork, int* info);
}

namespace ord {

namespace {
    // Placeholder percentages reported when no axis carries positive variance
    constexpr dp_t kFallbackVariance1 = 50.0;
    constexpr dp_t kFallbackVariance2 = 30.0;

    size_t get_available_memory() {
        FILE* meminfo = fopen("/proc/meminfo", "r");
        if (meminfo) {
            char line[256];
            size_t available_kb = 0;
            while (fgets(line, sizeof(line), meminfo)) {
                if (sscanf(line, "MemAvailable: %zu kB", &available_kb) == 1) {
                    fclose(meminfo);
                    return available_kb * 1024; // Convert to bytes
                }
            }
            fclose(meminfo);
        }
        // Fallback: assume 4GB available if we can't read meminfo
        return 4ULL * 1024 * 1024 * 1024;
    }

    PCoAResult degenerate_result(size_t n, FitStatus status) {
        PCoAResult result;
        result.coordinates = fallback_circle_layout(n);
        result.variance_explained = {{kFallbackVariance1, kFallbackVariance2}};
        result.total_variance_explained = kFallbackVariance1 + kFallbackVariance2;
        result.status = status;
        return result;
    }

    // Eigenvalues of a symmetric row-major matrix, descending
    std::vector<dp_t> symmetric_eigenvalues(std::vector<dp_t> work_matrix, size_t n) {
        // Symmetric, so row-major and column-major storage coincide
        int n_int = static_cast<int>(n);
        char jobz = 'N'; // Eigenvalues only
        char uplo = 'U';
        int lwork = -1;
        int liwork = -1;
        int info = 0;

        double work_query = 0.0;
        int iwork_query = 0;
        std::vector<double> eigenvalues(n);

        dsyevd_(&jobz, &uplo, &n_int, work_matrix.data(), &n_int,
                eigenvalues.data(), &work_query, &lwork, &iwork_query, &liwork, &info);

        if (info != 0) {
            throw std::runtime_error("LAPACK workspace query failed");
        }

        lwork = std::max(1, static_cast<int>(work_query));
        liwork = std::max(1, iwork_query);
        std::vector<double> work(lwork);
        std::vector<int> iwork(liwork);

        dsyevd_(&jobz, &uplo, &n_int, work_matrix.data(), &n_int,
                eigenvalues.data(), work.data(), &lwork, iwork.data(), &liwork, &info);

        if (info != 0) {
            throw std::runtime_error("LAPACK eigendecomposition failed with error code: " + std::to_string(info));
        }

        // LAPACK returns eigenvalues in ascending order
        std::reverse(eigenvalues.begin(), eigenvalues.end());
        return eigenvalues;
    }

    // Lower bound on the smallest eigenvalue of a symmetric matrix
    dp_t gershgorin_lower_bound(const std::vector<dp_t>& G, size_t n) {
        dp_t bound = 0.0;
        for (size_t i = 0; i < n; i++) {
            dp_t off_diagonal = 0.0;
            for (size_t j = 0; j < n; j++) {
                if (j != i) off_diagonal += std::abs(G[i * n + j]);
            }
            bound = std::min(bound, G[i * n + i] - off_diagonal);
        }
        return bound;
    }

    // Flip v so its largest-magnitude entry is positive
    void normalize_sign(std::vector<dp_t>& v) {
        size_t arg = 0;
        for (size_t i = 1; i < v.size(); i++) {
            if (std::abs(v[i]) > std::abs(v[arg])) arg = i;
        }
        if (!v.empty() && v[arg] < 0.0) {
            for (auto& x : v) x = -x;
        }
    }
}

size_t estimate_pcoa_memory(integer_t n_communities) {
    // Memory requirements:
    // - Squared dissimilarities + centered matrix: 2 x n² doubles
    // - Deflated working copy: n² doubles
    // - LAPACK copy and workspace (eigenvalues only): n² + (2n + 1) doubles, 1 int
    size_t n = static_cast<size_t>(n_communities);
    size_t matrix_size = n * n * sizeof(double);
    size_t vectors_size = 6 * n * sizeof(double);
    size_t workspace_size = (1 + 2 * n) * sizeof(double) + sizeof(int);

    return 4 * matrix_size + vectors_size + workspace_size;
}

std::pair<bool, std::string> check_pcoa_memory(integer_t n_communities, size_t available_memory_bytes) {
    size_t required = estimate_pcoa_memory(n_communities);

    if (available_memory_bytes == 0) {
        available_memory_bytes = get_available_memory();
    }

    // Require at least 2x the estimated memory for safety
    size_t required_with_safety = required * 2;

    if (required_with_safety > available_memory_bytes) {
        double required_gb = required_with_safety / (1024.0 * 1024.0 * 1024.0);
        double available_gb = available_memory_bytes / (1024.0 * 1024.0 * 1024.0);

        std::string error_msg =
            "PCoA would exceed available memory.\n"
            "  Required (with safety margin): " + std::to_string(required_gb) + " GB\n"
            "  Available: " + std::to_string(available_gb) + " GB\n"
            "  Communities: " + std::to_string(n_communities);

        return std::make_pair(false, error_msg);
    }

    return std::make_pair(true, "");
}

std::vector<dp_t> double_center(const DissimilarityMatrix& D) {
    const size_t n = D.size();
    const size_t n2 = n * n;

    // Step 1: Square the dissimilarities
    std::vector<dp_t> squared(n2);
    for (size_t k = 0; k < n2; k++) {
        squared[k] = D.data()[k] * D.data()[k];
    }

    // Step 2: Row means, column means and grand mean of D²
    std::vector<dp_t> row_means(n, 0.0);
    std::vector<dp_t> col_means(n, 0.0);
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) {
            row_means[i] += squared[i * n + j];
            col_means[j] += squared[i * n + j];
        }
    }
    dp_t grand_mean = 0.0;
    for (size_t i = 0; i < n; i++) {
        row_means[i] /= static_cast<dp_t>(n);
        col_means[i] /= static_cast<dp_t>(n);
        grand_mean += row_means[i];
    }
    grand_mean /= static_cast<dp_t>(n);

    // Step 3: G = -0.5 * (D² - row_means - col_means + grand_mean)
    std::vector<dp_t> centered(n2);
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) {
            centered[i * n + j] = -0.5 * (squared[i * n + j] - row_means[i] - col_means[j] + grand_mean);
        }
    }
    return centered;
}

EigenPair power_iteration(const std::vector<dp_t>& G, size_t n,
                          const std::vector<std::vector<dp_t>>& prior_vectors,
                          std::vector<dp_t> seed,
                          integer_t max_iterations, dp_t tolerance, dp_t shift) {
    EigenPair pair;
    if (seed.size() != n || G.size() != n * n) {
        throw std::invalid_argument("power_iteration: seed/matrix dimensions do not match n=" + std::to_string(n));
    }

    std::vector<dp_t> v = std::move(seed);
    orthogonalize(v.data(), prior_vectors, n);
    if (!(normalize(v.data(), n) > 0.0)) {
        // Seed lies in the span of the prior vectors; nothing left to extract
        pair.vector.assign(n, 0.0);
        pair.converged = true;
        return pair;
    }

    std::vector<dp_t> w(n);
    for (integer_t iter = 0; iter < max_iterations; iter++) {
        pair.iterations = iter + 1;
        symmetric_matvec(G, v.data(), w.data(), n);
        for (size_t i = 0; i < n; i++) w[i] += shift * v[i];
        orthogonalize(w.data(), prior_vectors, n);

        const dp_t len = normalize(w.data(), n);
        if (!std::isfinite(len) || !all_finite(w.data(), n)) {
            pair.finite = false;
            pair.vector = v;
            return pair;
        }
        if (len == 0.0) {
            // v lies in the null space of G + shift*I
            pair.converged = true;
            break;
        }

        // A negative eigenvalue flips the sign every step; compare up to sign
        dp_t diff_same = 0.0;
        dp_t diff_flip = 0.0;
        for (size_t i = 0; i < n; i++) {
            diff_same += (w[i] - v[i]) * (w[i] - v[i]);
            diff_flip += (w[i] + v[i]) * (w[i] + v[i]);
        }
        const dp_t change = std::sqrt(std::min(diff_same, diff_flip));
        v.swap(w);
        if (change < tolerance) {
            pair.converged = true;
            break;
        }
    }

    symmetric_matvec(G, v.data(), w.data(), n);
    pair.eigenvalue = dot(v.data(), w.data(), n);
    pair.finite = std::isfinite(pair.eigenvalue);
    pair.vector = std::move(v);
    return pair;
}

std::vector<dp_t> compute_pcoa_spectrum(const DissimilarityMatrix& D) {
    if (D.size() == 0) return {};
    return symmetric_eigenvalues(double_center(D), D.size());
}

PCoAResult compute_pcoa(const DissimilarityMatrix& D, const PCoAConfig& config) {
    config.validate();
    const size_t n = D.size();

    if (n < 3 || D.is_all_zero()) {
        if (config.verbose) {
            std::cerr << "⚠️ PCoA: degenerate input (" << n << " communities"
                      << (n >= 3 ? ", all dissimilarities zero" : "") << "), using circle layout\n";
        }
        return degenerate_result(n, FitStatus::DEGENERATE_INPUT);
    }

    // Memory check
    if (config.memory_check) {
        auto [can_compute, error_msg] = check_pcoa_memory(static_cast<integer_t>(n));
        if (!can_compute) {
            throw std::runtime_error(error_msg);
        }
    }

    std::vector<dp_t> G = double_center(D);

    // Denominator for percent variance: all positive eigenvalues of G
    dp_t positive_sum = 0.0;
    dp_t lambda_min = 0.0;
    bool have_spectrum = false;
    try {
        const std::vector<dp_t> spectrum = symmetric_eigenvalues(G, n);
        for (dp_t lambda : spectrum) {
            if (lambda > 0.0) positive_sum += lambda;
        }
        lambda_min = spectrum.back();
        have_spectrum = std::isfinite(positive_sum) && std::isfinite(lambda_min);
    } catch (const std::runtime_error& e) {
        if (config.verbose) {
            std::cerr << "⚠️ PCoA: " << e.what() << "; estimating total variance from the trace\n";
        }
    }
    if (!have_spectrum) {
        lambda_min = gershgorin_lower_bound(G, n);
    }

    // Power iteration finds the largest |eigenvalue|. Shifting by -lambda_min
    // makes the spectrum non-negative so the top positive axis wins.
    const dp_t shift = std::max(0.0, -lambda_min);

    // Deflation: extract two eigenpairs, removing each from G before the next
    PCoAResult result;
    std::vector<std::vector<dp_t>> basis;
    std::array<std::vector<dp_t>, 2> vectors;
    integer_t failed_components = 0;

    for (int k = 0; k < 2; k++) {
        MT19937 rng(config.seed + static_cast<uint32_t>(k));
        std::vector<dp_t> seed(n);
        for (auto& s : seed) s = rng.uniform(-1.0, 1.0);

        EigenPair pair = power_iteration(G, n, basis, std::move(seed), config.max_iterations, config.tolerance, shift);
        if (!pair.finite) {
            failed_components++;
            vectors[k].assign(n, 0.0);
            if (config.verbose) {
                std::cerr << "⚠️ PCoA: component " << (k + 1) << " diverged, discarded\n";
            }
            continue;
        }

        if (config.verbose) {
            std::cout << "PCoA component " << (k + 1) << ": eigenvalue=" << pair.eigenvalue
                      << " iterations=" << pair.iterations
                      << (pair.converged ? "" : " (iteration cap reached)") << "\n";
        }

        normalize_sign(pair.vector);
        for (size_t i = 0; i < n; i++) {
            for (size_t j = 0; j < n; j++) {
                G[i * n + j] -= pair.eigenvalue * pair.vector[i] * pair.vector[j];
            }
        }
        result.eigenvalues[k] = pair.eigenvalue;
        vectors[k] = pair.vector;
        basis.push_back(std::move(pair.vector));
    }

    if (failed_components == 2) {
        return degenerate_result(n, FitStatus::NUMERIC_INSTABILITY);
    }

    const dp_t pos1 = std::max(result.eigenvalues[0], 0.0);
    const dp_t pos2 = std::max(result.eigenvalues[1], 0.0);
    if (pos1 <= 0.0 && pos2 <= 0.0) {
        // No Euclidean structure at all; every coordinate would be zero
        PCoAResult fallback = degenerate_result(n, FitStatus::DEGENERATE_INPUT);
        fallback.eigenvalues = result.eigenvalues;
        return fallback;
    }

    if (!have_spectrum) {
        // G is deflated by now, so its trace is the sum of the remaining eigenvalues
        dp_t residual_trace = 0.0;
        for (size_t i = 0; i < n; i++) residual_trace += G[i * n + i];
        positive_sum = pos1 + pos2 + std::max(residual_trace, 0.0);
    }
    positive_sum = std::max(positive_sum, pos1 + pos2);

    // Negative eigenvalues contribute nothing (non-Euclidean residual)
    const dp_t scale1 = std::sqrt(pos1);
    const dp_t scale2 = std::sqrt(pos2);
    result.coordinates.resize(n);
    for (size_t i = 0; i < n; i++) {
        result.coordinates[i].x = vectors[0][i] * scale1;
        result.coordinates[i].y = vectors[1][i] * scale2;
    }

    result.variance_explained[0] = pos1 / positive_sum * 100.0;
    result.variance_explained[1] = pos2 / positive_sum * 100.0;
    result.total_variance_explained = result.variance_explained[0] + result.variance_explained[1];
    result.status = failed_components > 0 ? FitStatus::NUMERIC_INSTABILITY : FitStatus::OK;
    return result;
}

} // namespace ord
