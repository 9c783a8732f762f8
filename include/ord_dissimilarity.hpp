#ifndef ORD_DISSIMILARITY_HPP
#define ORD_DISSIMILARITY_HPP

#include "ord_types.hpp"
#include "ord_community.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace ord {

/**
 * @brief Square, symmetric, zero-diagonal matrix of dissimilarities in [0,1].
 *
 * Indexed by community position (0-based), not by community id. Stored
 * row-major. Instances are only produced by the builders below or by
 * from_dense(), which enforce the invariants; there are no mutators.
 */
class DissimilarityMatrix {
public:
    DissimilarityMatrix() : n_(0) {}

    /**
     * @brief Wrap an externally computed matrix after checking it.
     *
     * @param values Row-major n x n values
     * @param n Matrix order
     * @throws std::invalid_argument if the matrix is not square, not finite,
     *         not symmetric (1e-9), has a non-zero diagonal or leaves [0,1]
     */
    static DissimilarityMatrix from_dense(std::vector<dp_t> values, size_t n);

    size_t size() const { return n_; }
    size_t pair_count() const { return n_ < 2 ? 0 : n_ * (n_ - 1) / 2; }

    dp_t operator()(size_t i, size_t j) const { return values_[i * n_ + j]; }
    const dp_t* data() const { return values_.data(); }
    const std::vector<dp_t>& values() const { return values_; }

    dp_t max_value() const;

    // True when every off-diagonal entry is <= eps (identical compositions)
    bool is_all_zero(dp_t eps = 1e-12) const;

private:
    DissimilarityMatrix(std::vector<dp_t> values, size_t n) : n_(n), values_(std::move(values)) {}

    friend DissimilarityMatrix build_bray_curtis_matrix(const std::vector<Community>&);
    friend DissimilarityMatrix build_jaccard_matrix(const std::vector<Community>&);
    friend DissimilarityMatrix build_sorensen_matrix(const std::vector<Community>&);

    size_t n_;
    std::vector<dp_t> values_;
};

// Dense community x species abundance lookup (0 where a species is absent)
struct AbundanceTable {
    size_t n_communities = 0;
    size_t n_species = 0;
    std::vector<integer_t> species_ids;  // Sorted species universe (column order)
    std::vector<dp_t> values;            // (n_communities, n_species) row-major

    dp_t at(size_t community, size_t species_col) const {
        return values[community * n_species + species_col];
    }
};

// Sorted union of species ids across all communities
std::vector<integer_t> build_species_universe(const std::vector<Community>& communities);

AbundanceTable build_abundance_table(const std::vector<Community>& communities,
                                     const std::vector<integer_t>& universe);

// Bray-Curtis: 1 - 2 * sum(min) / sum(a_i + a_j). Validates the communities first.
DissimilarityMatrix build_bray_curtis_matrix(const std::vector<Community>& communities);

// Presence/absence dissimilarities: 1 - |A∩B|/|A∪B| and 1 - 2|A∩B|/(|A|+|B|)
DissimilarityMatrix build_jaccard_matrix(const std::vector<Community>& communities);
DissimilarityMatrix build_sorensen_matrix(const std::vector<Community>& communities);

} // namespace ord

#endif // ORD_DISSIMILARITY_HPP
