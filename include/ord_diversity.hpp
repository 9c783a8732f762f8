#ifndef ORD_DIVERSITY_HPP
#define ORD_DIVERSITY_HPP

#include "ord_types.hpp"
#include "ord_community.hpp"
#include <vector>

namespace ord {

// Within-community indices. Proportions p_i = n_i / N over species with n_i > 0.
struct AlphaDiversity {
    integer_t richness = 0;        // S
    count_t total_abundance = 0;   // N
    dp_t shannon = 0.0;            // H' = -sum p_i ln p_i
    dp_t simpson_diversity = 0.0;  // 1 - sum p_i^2
    dp_t inverse_simpson = 0.0;    // 1 / sum p_i^2
    dp_t pielou = 0.0;             // H' / ln S (0 when S <= 1)
    dp_t berger_parker = 0.0;      // max n_i / N
    dp_t margalef = 0.0;           // (S - 1) / ln N (0 when N <= 1)
    dp_t menhinick = 0.0;          // S / sqrt(N)
};

// Among-community summary over the whole set
struct BetaDiversity {
    integer_t gamma_richness = 0;
    dp_t mean_alpha_richness = 0.0;
    dp_t whittaker = 0.0;   // gamma / mean alpha
    dp_t additive = 0.0;    // gamma - mean alpha
    dp_t harrison = 0.0;    // (gamma - mean alpha) / (gamma - 1)
    dp_t williams = 0.0;    // (gamma - mean alpha) / gamma
    dp_t routledge = 0.0;   // (gamma^2 - sum alpha^2) / (2 mean alpha gamma (n - 1))

    // Means over all community pairs of presence-based similarities
    dp_t mean_jaccard_similarity = 0.0;
    dp_t mean_jaccard_dissimilarity = 0.0;
    dp_t mean_sorensen_similarity = 0.0;
    dp_t mean_sorensen_dissimilarity = 0.0;
    integer_t comparisons = 0;
};

/**
 * @brief Alpha diversity indices of one community.
 * @throws InvalidCommunityError for an invalid community
 */
AlphaDiversity compute_alpha_diversity(const Community& community);

/**
 * @brief Beta diversity across a set of communities.
 *
 * Presence means abundance > 0. With a single community every pairwise
 * mean is 0 and comparisons is 0.
 *
 * @throws InvalidCommunityError / std::invalid_argument for an invalid set
 */
BetaDiversity compute_beta_diversity(const std::vector<Community>& communities);

} // namespace ord

#endif // ORD_DIVERSITY_HPP
