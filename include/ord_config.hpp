#ifndef ORD_CONFIG_HPP
#define ORD_CONFIG_HPP

#include "ord_types.hpp"
#include <cstdint>

namespace ord {

// Principal Coordinates Analysis configuration
struct PCoAConfig {
    integer_t max_iterations = 200;   // Power iteration cap per component
    dp_t tolerance = 1e-8;            // Stop when the eigenvector moves less than this
    uint32_t seed = 12345;            // Seed vector for component k is drawn from MT19937(seed + k)
    bool memory_check = true;         // Refuse matrices that do not fit in available memory
    bool verbose = false;

    // Throws std::invalid_argument on nonsensical values
    void validate() const;
};

// Non-metric Multidimensional Scaling configuration
struct NMDSConfig {
    uint64_t seed = 12345;            // Attempt a uses MT19937 seeded from (seed, a)
    integer_t max_attempts = 15;      // Independent starts, best one kept
    integer_t max_iterations = 500;   // Gradient steps per attempt
    dp_t tolerance = 1e-7;            // Stress change counted as stagnation
    integer_t stagnation_limit = 15;  // Consecutive stagnant steps before an attempt stops

    // step = base_step / N * max(min_step_fraction, exp(-iter / step_decay))
    // base_step = 1 is the Guttman majorization step
    dp_t base_step = 1.0;
    dp_t min_step_fraction = 0.2;
    dp_t step_decay = 100.0;

    integer_t warmup_iterations = 50; // Degeneracy is not checked before this
    dp_t degeneracy_threshold = 0.05; // Minimum coordinate range on each axis
    dp_t good_enough_stress = 0.15;   // Stop launching attempts once one gets here
    dp_t convergence_stress = 0.2;    // Reported converged flag is stress < this
    dp_t display_bound = 2.0;         // Max |coordinate| of the returned layout
    bool use_pcoa_start = true;       // Attempt 2 starts from the PCoA layout

    integer_t n_threads_cpu = 0;      // OpenMP threads (0 = runtime default)
    bool verbose = false;

    void validate() const;
};

// Full pipeline configuration
struct OrdinationConfig {
    PCoAConfig pcoa;
    NMDSConfig nmds;

    bool compute_pcoa = true;
    bool compute_nmds = true;
    bool compute_diversity = true;
    bool verbose = false;

    void validate() const {
        pcoa.validate();
        nmds.validate();
    }
};

} // namespace ord

#endif // ORD_CONFIG_HPP
