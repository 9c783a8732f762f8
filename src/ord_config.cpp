#include "ord_config.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace ord {

void PCoAConfig::validate() const {
    if (max_iterations <= 0) {
        throw std::invalid_argument("PCoA max_iterations must be positive, got " + std::to_string(max_iterations));
    }
    if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
        throw std::invalid_argument("PCoA tolerance must be a finite non-negative number");
    }
}

void NMDSConfig::validate() const {
    if (max_attempts <= 0) {
        throw std::invalid_argument("NMDS max_attempts must be positive, got " + std::to_string(max_attempts));
    }
    if (max_iterations <= 0) {
        throw std::invalid_argument("NMDS max_iterations must be positive, got " + std::to_string(max_iterations));
    }
    if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
        throw std::invalid_argument("NMDS tolerance must be a finite non-negative number");
    }
    if (stagnation_limit <= 0) {
        throw std::invalid_argument("NMDS stagnation_limit must be positive");
    }
    if (!(base_step > 0.0) || !std::isfinite(base_step)) {
        throw std::invalid_argument("NMDS base_step must be positive");
    }
    if (!(min_step_fraction > 0.0) || min_step_fraction > 1.0) {
        throw std::invalid_argument("NMDS min_step_fraction must lie in (0, 1]");
    }
    if (!(step_decay > 0.0)) {
        throw std::invalid_argument("NMDS step_decay must be positive");
    }
    if (warmup_iterations < 0) {
        throw std::invalid_argument("NMDS warmup_iterations must be non-negative");
    }
    if (!(degeneracy_threshold >= 0.0)) {
        throw std::invalid_argument("NMDS degeneracy_threshold must be non-negative");
    }
    if (!(display_bound > 0.0) || !std::isfinite(display_bound)) {
        throw std::invalid_argument("NMDS display_bound must be a finite positive number");
    }
    if (n_threads_cpu < 0) {
        throw std::invalid_argument("NMDS n_threads_cpu must be non-negative (0 = auto)");
    }
}

} // namespace ord
