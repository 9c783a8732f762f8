#include "ord_diversity.hpp"
#include <algorithm>
#include <cmath>

namespace ord {

namespace {
    // Sorted ids of species present (abundance > 0)
    std::vector<integer_t> presence_set(const Community& community) {
        std::vector<integer_t> present;
        for (size_t i = 0; i < community.species.size(); i++) {
            if (community.abundance[i] > 0) present.push_back(community.species[i]);
        }
        std::sort(present.begin(), present.end());
        return present;
    }

    size_t shared_count(const std::vector<integer_t>& a, const std::vector<integer_t>& b) {
        size_t shared = 0;
        size_t i = 0, j = 0;
        while (i < a.size() && j < b.size()) {
            if (a[i] < b[j]) {
                i++;
            } else if (b[j] < a[i]) {
                j++;
            } else {
                shared++;
                i++;
                j++;
            }
        }
        return shared;
    }

    AlphaDiversity alpha_of_valid(const Community& community) {
        AlphaDiversity alpha;
        alpha.richness = community.richness();
        alpha.total_abundance = community.total_abundance();

        const dp_t total = static_cast<dp_t>(alpha.total_abundance);
        dp_t sum_sq = 0.0;
        integer_t max_count = 0;
        for (integer_t count : community.abundance) {
            if (count <= 0) continue;
            const dp_t p = count / total;
            alpha.shannon -= p * std::log(p);
            sum_sq += p * p;
            max_count = std::max(max_count, count);
        }

        const dp_t S = static_cast<dp_t>(alpha.richness);
        alpha.simpson_diversity = 1.0 - sum_sq;
        alpha.inverse_simpson = 1.0 / sum_sq;
        alpha.pielou = alpha.richness > 1 ? alpha.shannon / std::log(S) : 0.0;
        alpha.berger_parker = max_count / total;
        alpha.margalef = alpha.total_abundance > 1 ? (S - 1.0) / std::log(total) : 0.0;
        alpha.menhinick = S / std::sqrt(total);
        return alpha;
    }
}

AlphaDiversity compute_alpha_diversity(const Community& community) {
    validate_community(community, 0);
    return alpha_of_valid(community);
}

BetaDiversity compute_beta_diversity(const std::vector<Community>& communities) {
    validate_communities(communities);

    BetaDiversity beta;
    const size_t n = communities.size();

    std::vector<std::vector<integer_t>> presence(n);
    std::vector<integer_t> universe;
    dp_t sum_alpha = 0.0;
    dp_t sum_alpha_sq = 0.0;
    for (size_t c = 0; c < n; c++) {
        presence[c] = presence_set(communities[c]);
        universe.insert(universe.end(), presence[c].begin(), presence[c].end());
        const dp_t s = static_cast<dp_t>(presence[c].size());
        sum_alpha += s;
        sum_alpha_sq += s * s;
    }
    std::sort(universe.begin(), universe.end());
    universe.erase(std::unique(universe.begin(), universe.end()), universe.end());

    beta.gamma_richness = static_cast<integer_t>(universe.size());
    beta.mean_alpha_richness = sum_alpha / static_cast<dp_t>(n);

    const dp_t gamma = static_cast<dp_t>(beta.gamma_richness);
    const dp_t alpha = beta.mean_alpha_richness;
    beta.whittaker = gamma / alpha;
    beta.additive = gamma - alpha;
    beta.harrison = beta.gamma_richness > 1 ? (gamma - alpha) / (gamma - 1.0) : 0.0;
    beta.williams = (gamma - alpha) / gamma;
    beta.routledge = n > 1 ? (gamma * gamma - sum_alpha_sq) / (2.0 * alpha * gamma * static_cast<dp_t>(n - 1)) : 0.0;

    dp_t jaccard = 0.0;
    dp_t sorensen = 0.0;
    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            const dp_t shared = static_cast<dp_t>(shared_count(presence[i], presence[j]));
            const dp_t a = static_cast<dp_t>(presence[i].size());
            const dp_t b = static_cast<dp_t>(presence[j].size());
            jaccard += shared / (a + b - shared);
            sorensen += 2.0 * shared / (a + b);
            beta.comparisons++;
        }
    }

    if (beta.comparisons > 0) {
        beta.mean_jaccard_similarity = jaccard / beta.comparisons;
        beta.mean_sorensen_similarity = sorensen / beta.comparisons;
        beta.mean_jaccard_dissimilarity = 1.0 - beta.mean_jaccard_similarity;
        beta.mean_sorensen_dissimilarity = 1.0 - beta.mean_sorensen_similarity;
    }
    return beta;
}

} // namespace ord
