#include "ord_nmds.hpp"
#include "ord_isotonic.hpp"
#include "ord_layout.hpp"
#include "ord_pcoa.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace ord {

namespace {
    // Distances below this have no usable direction for the gradient
    constexpr dp_t kMinPairDistance = 1e-12;

    // Stress this low is an exact rank-order embedding
    constexpr dp_t kPerfectStress = 1e-12;

    // Upper-triangle pair list shared read-only by all attempts
    struct PairSet {
        std::vector<integer_t> first;
        std::vector<integer_t> second;
        std::vector<dp_t> dissimilarity;
        std::vector<integer_t> fitted_pairs;  // Pairs with dissimilarity > 0
    };

    PairSet build_pairs(const DissimilarityMatrix& D) {
        PairSet pairs;
        const size_t n = D.size();
        for (size_t i = 0; i < n; i++) {
            for (size_t j = i + 1; j < n; j++) {
                if (D(i, j) > 0.0) {
                    pairs.fitted_pairs.push_back(static_cast<integer_t>(pairs.first.size()));
                }
                pairs.first.push_back(static_cast<integer_t>(i));
                pairs.second.push_back(static_cast<integer_t>(j));
                pairs.dissimilarity.push_back(D(i, j));
            }
        }
        return pairs;
    }

    void pair_distances(const std::vector<Point2>& points, const PairSet& pairs, std::vector<dp_t>& dist) {
        dist.resize(pairs.first.size());
        for (size_t p = 0; p < dist.size(); p++) {
            dist[p] = distance(points[pairs.first[p]], points[pairs.second[p]]);
        }
    }

    // Monotone fit of the distances to the dissimilarity ranks. Identical
    // communities (dissimilarity 0) get target 0; ties among the others are
    // ordered by current distance (Kruskal's primary approach).
    void fit_targets(const std::vector<dp_t>& dist, const PairSet& pairs, std::vector<dp_t>& targets) {
        targets.assign(dist.size(), 0.0);
        const size_t m = pairs.fitted_pairs.size();
        if (m == 0) return;

        std::vector<dp_t> sub_diss(m);
        std::vector<dp_t> sub_dist(m);
        for (size_t k = 0; k < m; k++) {
            sub_diss[k] = pairs.dissimilarity[pairs.fitted_pairs[k]];
            sub_dist[k] = dist[pairs.fitted_pairs[k]];
        }
        const std::vector<dp_t> fitted = isotonic_regression(sub_dist, rank_order_by(sub_diss, sub_dist));
        for (size_t k = 0; k < m; k++) {
            targets[pairs.fitted_pairs[k]] = fitted[k];
        }
    }

    dp_t stress_of(const std::vector<dp_t>& dist, const std::vector<dp_t>& targets) {
        dp_t numerator = 0.0;
        dp_t denominator = 0.0;
        for (size_t p = 0; p < dist.size(); p++) {
            const dp_t diff = dist[p] - targets[p];
            numerator += diff * diff;
            denominator += dist[p] * dist[p];
        }
        if (!(denominator > 0.0)) {
            return std::numeric_limits<dp_t>::quiet_NaN();
        }
        return std::sqrt(numerator / denominator);
    }

    // Center and rescale to unit root mean square pair distance.
    // Returns false if the points coincide or the scale is not finite.
    bool normalize_configuration(std::vector<Point2>& points) {
        center_configuration(points);
        const size_t n = points.size();
        dp_t sum_sq = 0.0;
        for (size_t i = 0; i < n; i++) {
            for (size_t j = i + 1; j < n; j++) {
                const dp_t d = distance(points[i], points[j]);
                sum_sq += d * d;
            }
        }
        const dp_t pair_count = static_cast<dp_t>(n * (n - 1) / 2);
        const dp_t rms = std::sqrt(sum_sq / pair_count);
        if (!(rms > 0.0) || !std::isfinite(rms)) return false;
        for (auto& p : points) {
            p.x /= rms;
            p.y /= rms;
        }
        return true;
    }

    bool collapsed(const std::vector<Point2>& points, dp_t threshold) {
        const Point2 ranges = axis_ranges(points);
        return ranges.x < threshold || ranges.y < threshold;
    }

    NMDSAttempt run_attempt(const PairSet& pairs, std::vector<Point2> points, const NMDSConfig& config) {
        NMDSAttempt attempt;
        const size_t n = points.size();

        if (!all_finite(points) || !normalize_configuration(points)) {
            attempt.finite = false;
            attempt.points = std::move(points);
            attempt.stress = std::numeric_limits<dp_t>::quiet_NaN();
            return attempt;
        }

        std::vector<dp_t> dist;
        std::vector<dp_t> targets;
        std::vector<Point2> displacement(n);
        dp_t prev_stress = std::numeric_limits<dp_t>::infinity();
        integer_t stagnant = 0;

        for (integer_t iter = 0; iter < config.max_iterations; iter++) {
            pair_distances(points, pairs, dist);
            fit_targets(dist, pairs, targets);
            const dp_t stress = stress_of(dist, targets);
            if (!std::isfinite(stress)) {
                attempt.finite = false;
                break;
            }
            attempt.iterations = iter + 1;

            if (std::abs(prev_stress - stress) < config.tolerance) {
                if (++stagnant >= config.stagnation_limit) break;
            } else {
                stagnant = 0;
            }
            if (stress < kPerfectStress) break;
            prev_stress = stress;

            // Synchronous update: accumulate every pair's push, then apply
            const dp_t step = config.base_step / static_cast<dp_t>(n) *
                              std::max(config.min_step_fraction, std::exp(-iter / config.step_decay));
            std::fill(displacement.begin(), displacement.end(), Point2{});
            for (size_t p = 0; p < dist.size(); p++) {
                if (dist[p] < kMinPairDistance) continue;
                const integer_t i = pairs.first[p];
                const integer_t j = pairs.second[p];
                const dp_t coef = step * (dist[p] - targets[p]) / dist[p];
                const dp_t dx = coef * (points[i].x - points[j].x);
                const dp_t dy = coef * (points[i].y - points[j].y);
                displacement[i].x -= dx;
                displacement[i].y -= dy;
                displacement[j].x += dx;
                displacement[j].y += dy;
            }
            for (size_t i = 0; i < n; i++) {
                points[i].x += displacement[i].x;
                points[i].y += displacement[i].y;
            }

            if (!all_finite(points) || !normalize_configuration(points)) {
                attempt.finite = false;
                break;
            }
            if (iter >= config.warmup_iterations && collapsed(points, config.degeneracy_threshold)) {
                attempt.degenerate = true;
                break;
            }
        }

        if (attempt.finite) {
            pair_distances(points, pairs, dist);
            fit_targets(dist, pairs, targets);
            attempt.stress = stress_of(dist, targets);
            attempt.finite = std::isfinite(attempt.stress);
            if (!attempt.degenerate && collapsed(points, config.degeneracy_threshold)) {
                attempt.degenerate = true;
            }
        } else {
            attempt.stress = std::numeric_limits<dp_t>::quiet_NaN();
        }
        attempt.points = std::move(points);
        return attempt;
    }

    NMDSResult fallback_result(size_t n, FitStatus status, integer_t attempts_run) {
        NMDSResult result;
        result.coordinates = fallback_circle_layout(n);
        result.stress = 0.0;
        result.converged = false;
        result.iterations = 0;
        result.attempts_run = attempts_run;
        result.best_attempt = -1;
        result.status = status;
        return result;
    }
}

dp_t kruskal_stress(const std::vector<Point2>& points, const DissimilarityMatrix& D) {
    if (points.size() != D.size()) {
        throw std::invalid_argument("kruskal_stress: " + std::to_string(points.size()) +
                                    " points for a matrix of order " + std::to_string(D.size()));
    }
    const PairSet pairs = build_pairs(D);
    std::vector<dp_t> dist;
    std::vector<dp_t> targets;
    pair_distances(points, pairs, dist);
    fit_targets(dist, pairs, targets);
    return stress_of(dist, targets);
}

std::vector<Point2> initial_configuration(size_t n, integer_t attempt, MT19937& rng,
                                          const std::vector<Point2>* pcoa_start) {
    std::vector<Point2> points(n);
    if (attempt == 0) {
        // Circle of radius 2
        const dp_t two_pi = 2.0 * std::acos(-1.0);
        for (size_t i = 0; i < n; i++) {
            const dp_t angle = two_pi * static_cast<dp_t>(i) / static_cast<dp_t>(n);
            points[i] = Point2{2.0 * std::cos(angle), 2.0 * std::sin(angle)};
        }
    } else if (attempt == 1) {
        const size_t grid = static_cast<size_t>(std::ceil(std::sqrt(static_cast<dp_t>(n))));
        const dp_t half = static_cast<dp_t>(grid) / 2.0;
        for (size_t i = 0; i < n; i++) {
            points[i] = Point2{(static_cast<dp_t>(i % grid) - half) * 1.5,
                               (static_cast<dp_t>(i / grid) - half) * 1.5};
        }
    } else if (attempt == 2 && pcoa_start != nullptr && pcoa_start->size() == n) {
        points = *pcoa_start;
    } else {
        static const dp_t kScales[3] = {2.0, 4.0, 6.0};
        const dp_t scale = kScales[attempt % 3];
        for (auto& p : points) {
            p.x = rng.uniform(-0.5, 0.5) * scale;
            p.y = rng.uniform(-0.5, 0.5) * scale;
        }
    }
    return points;
}

NMDSAttempt run_nmds_attempt(const DissimilarityMatrix& D, std::vector<Point2> start,
                             const NMDSConfig& config) {
    config.validate();
    if (start.size() != D.size()) {
        throw std::invalid_argument("run_nmds_attempt: start has " + std::to_string(start.size()) +
                                    " points for a matrix of order " + std::to_string(D.size()));
    }
    if (D.size() < 2) {
        NMDSAttempt attempt;
        attempt.points = std::move(start);
        attempt.degenerate = true;
        return attempt;
    }
    return run_attempt(build_pairs(D), std::move(start), config);
}

NMDSResult compute_nmds(const DissimilarityMatrix& D, const NMDSConfig& config) {
    config.validate();
    const size_t n = D.size();

    if (n < 3 || D.is_all_zero()) {
        if (config.verbose) {
            std::cerr << "⚠️ NMDS: degenerate input (" << n << " communities"
                      << (n >= 3 ? ", all dissimilarities zero" : "") << "), using circle layout\n";
        }
        return fallback_result(n, FitStatus::DEGENERATE_INPUT, 0);
    }

    const PairSet pairs = build_pairs(D);
    const integer_t max_attempts = config.max_attempts;

    // PCoA start for attempt 2, only if it carries two real axes
    std::vector<Point2> pcoa_start;
    if (config.use_pcoa_start && max_attempts > 2) {
        try {
            PCoAResult pcoa = compute_pcoa(D);
            const Point2 ranges = axis_ranges(pcoa.coordinates);
            if (pcoa.status == FitStatus::OK && ranges.x > 0.0 && ranges.y > 0.0) {
                pcoa_start = std::move(pcoa.coordinates);
            }
        } catch (const std::runtime_error& e) {
            if (config.verbose) {
                std::cerr << "⚠️ NMDS: PCoA start unavailable: " << e.what() << "\n";
            }
        }
    }
    const std::vector<Point2>* pcoa_ptr = pcoa_start.empty() ? nullptr : &pcoa_start;

    std::vector<NMDSAttempt> attempts(max_attempts);
    std::vector<char> ran(max_attempts, 0);
    // Lowest attempt index that reached good_enough_stress; later attempts
    // are skipped. Attempts below the final cutoff always run, so the
    // selection does not depend on scheduling.
    std::atomic<integer_t> cutoff(max_attempts);
    std::string worker_error;

    // Thread count applies to this loop only
#ifdef _OPENMP
    const int n_threads = config.n_threads_cpu > 0 ? static_cast<int>(config.n_threads_cpu) : omp_get_max_threads();
#pragma omp parallel for schedule(dynamic, 1) num_threads(n_threads)
#endif
    for (integer_t a = 0; a < max_attempts; a++) {
        if (a > cutoff.load()) continue;
        try {
            MT19937 rng(derive_seed(config.seed, static_cast<uint64_t>(a)));
            std::vector<Point2> start = initial_configuration(n, a, rng, pcoa_ptr);
            attempts[a] = run_attempt(pairs, std::move(start), config);
            ran[a] = 1;

            if (attempts[a].valid() && attempts[a].stress < config.good_enough_stress) {
                integer_t current = cutoff.load();
                while (a < current && !cutoff.compare_exchange_weak(current, a)) {
                }
            }
        } catch (const std::exception& e) {
#ifdef _OPENMP
#pragma omp critical(ord_nmds_error)
#endif
            {
                if (worker_error.empty()) worker_error = e.what();
            }
        }
    }
    if (!worker_error.empty()) {
        throw std::runtime_error("NMDS attempt failed: " + worker_error);
    }

    // Deterministic reduction: lowest stress, ties to the lowest index
    const integer_t last = std::min(cutoff.load(), max_attempts - 1);
    integer_t best = -1;
    bool any_finite = false;
    for (integer_t a = 0; a <= last; a++) {
        if (!ran[a]) continue;
        const NMDSAttempt& attempt = attempts[a];
        if (config.verbose) {
            std::cout << "NMDS attempt " << a << ": stress=" << attempt.stress
                      << " iterations=" << attempt.iterations
                      << (attempt.degenerate ? " (collapsed)" : "")
                      << (attempt.finite ? "" : " (non-finite)") << "\n";
        }
        any_finite = any_finite || attempt.finite;
        if (!attempt.valid()) continue;
        if (best < 0 || attempt.stress < attempts[best].stress) {
            best = a;
        }
    }
    const integer_t attempts_run = last + 1;

    if (best < 0) {
        if (config.verbose) {
            std::cerr << "⚠️ NMDS: no valid attempt out of " << attempts_run << ", using circle layout\n";
        }
        return fallback_result(n, any_finite ? FitStatus::DEGENERATE_INPUT : FitStatus::NUMERIC_INSTABILITY,
                               attempts_run);
    }

    NMDSResult result;
    result.coordinates = std::move(attempts[best].points);
    center_configuration(result.coordinates);
    scale_to_bound(result.coordinates, config.display_bound);
    result.stress = attempts[best].stress;
    result.converged = result.stress < config.convergence_stress;
    result.iterations = attempts[best].iterations;
    result.attempts_run = attempts_run;
    result.best_attempt = best;
    result.status = FitStatus::OK;

    if (config.verbose) {
        std::cout << "NMDS: best attempt " << best << " stress=" << result.stress
                  << (result.converged ? " (converged)" : " (not converged)") << "\n";
    }
    return result;
}

} // namespace ord
