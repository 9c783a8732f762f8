#include "ord_dissimilarity.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_map>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace ord {

namespace {
    // Relative tolerance on symmetry for caller-supplied matrices
    constexpr dp_t kSymmetryTolerance = 1e-9;

    // Fill the upper triangle with pair_fn(i, j) and mirror it
    template<typename PairFn>
    std::vector<dp_t> fill_symmetric(size_t n, PairFn pair_fn) {
        std::vector<dp_t> values(n * n, 0.0);
        const long long nn = static_cast<long long>(n);
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
        for (long long i = 0; i < nn; i++) {
            for (size_t j = static_cast<size_t>(i) + 1; j < n; j++) {
                dp_t d = pair_fn(static_cast<size_t>(i), j);
                // Clamp rounding excursions so the [0,1] contract holds exactly
                d = std::min(1.0, std::max(0.0, d));
                values[static_cast<size_t>(i) * n + j] = d;
                values[j * n + static_cast<size_t>(i)] = d;
            }
        }
        return values;
    }

    std::vector<std::vector<integer_t>> presence_sets(const std::vector<Community>& communities) {
        std::vector<std::vector<integer_t>> sets(communities.size());
        for (size_t c = 0; c < communities.size(); c++) {
            const Community& comm = communities[c];
            for (size_t k = 0; k < comm.species.size(); k++) {
                if (comm.abundance[k] > 0) sets[c].push_back(comm.species[k]);
            }
            std::sort(sets[c].begin(), sets[c].end());
        }
        return sets;
    }

    size_t intersection_size(const std::vector<integer_t>& a, const std::vector<integer_t>& b) {
        size_t shared = 0;
        auto ia = a.begin();
        auto ib = b.begin();
        while (ia != a.end() && ib != b.end()) {
            if (*ia < *ib) {
                ++ia;
            } else if (*ib < *ia) {
                ++ib;
            } else {
                ++shared;
                ++ia;
                ++ib;
            }
        }
        return shared;
    }
}

DissimilarityMatrix DissimilarityMatrix::from_dense(std::vector<dp_t> values, size_t n) {
    if (values.size() != n * n) {
        throw std::invalid_argument("Dissimilarity matrix must be square: expected " + std::to_string(n * n) +
                                    " values, got " + std::to_string(values.size()));
    }
    for (size_t i = 0; i < n; i++) {
        if (values[i * n + i] != 0.0) {
            throw std::invalid_argument("Dissimilarity matrix diagonal must be zero (row " + std::to_string(i) + ")");
        }
        for (size_t j = 0; j < n; j++) {
            dp_t v = values[i * n + j];
            if (!std::isfinite(v)) {
                throw std::invalid_argument("Dissimilarity matrix contains a non-finite value at (" +
                                            std::to_string(i) + ", " + std::to_string(j) + ")");
            }
            if (v < 0.0 || v > 1.0) {
                throw std::invalid_argument("Dissimilarity matrix values must lie in [0,1], got " +
                                            std::to_string(v) + " at (" + std::to_string(i) + ", " +
                                            std::to_string(j) + ")");
            }
            if (j > i && std::abs(v - values[j * n + i]) > kSymmetryTolerance) {
                throw std::invalid_argument("Dissimilarity matrix is not symmetric at (" +
                                            std::to_string(i) + ", " + std::to_string(j) + ")");
            }
        }
    }
    // Make symmetry exact so downstream code can rely on D(i,j) == D(j,i)
    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            values[j * n + i] = values[i * n + j];
        }
    }
    return DissimilarityMatrix(std::move(values), n);
}

dp_t DissimilarityMatrix::max_value() const {
    dp_t m = 0.0;
    for (dp_t v : values_) {
        m = std::max(m, v);
    }
    return m;
}

bool DissimilarityMatrix::is_all_zero(dp_t eps) const {
    for (dp_t v : values_) {
        if (v > eps) return false;
    }
    return true;
}

std::vector<integer_t> build_species_universe(const std::vector<Community>& communities) {
    std::vector<integer_t> universe;
    for (const auto& comm : communities) {
        universe.insert(universe.end(), comm.species.begin(), comm.species.end());
    }
    std::sort(universe.begin(), universe.end());
    universe.erase(std::unique(universe.begin(), universe.end()), universe.end());
    return universe;
}

AbundanceTable build_abundance_table(const std::vector<Community>& communities,
                                     const std::vector<integer_t>& universe) {
    AbundanceTable table;
    table.n_communities = communities.size();
    table.n_species = universe.size();
    table.species_ids = universe;
    table.values.assign(table.n_communities * table.n_species, 0.0);

    std::unordered_map<integer_t, size_t> column;
    column.reserve(universe.size());
    for (size_t s = 0; s < universe.size(); s++) {
        column[universe[s]] = s;
    }

    for (size_t c = 0; c < communities.size(); c++) {
        const Community& comm = communities[c];
        for (size_t k = 0; k < comm.species.size(); k++) {
            auto it = column.find(comm.species[k]);
            if (it == column.end()) {
                throw std::invalid_argument("Species " + std::to_string(comm.species[k]) +
                                            " is missing from the species universe");
            }
            table.values[c * table.n_species + it->second] = static_cast<dp_t>(comm.abundance[k]);
        }
    }
    return table;
}

DissimilarityMatrix build_bray_curtis_matrix(const std::vector<Community>& communities) {
    validate_communities(communities);

    const std::vector<integer_t> universe = build_species_universe(communities);
    const AbundanceTable table = build_abundance_table(communities, universe);
    const size_t n = communities.size();
    const size_t s_count = table.n_species;

    std::vector<dp_t> values = fill_symmetric(n, [&](size_t i, size_t j) {
        dp_t numerator = 0.0;
        dp_t denominator = 0.0;
        const dp_t* row_i = &table.values[i * s_count];
        const dp_t* row_j = &table.values[j * s_count];
        for (size_t s = 0; s < s_count; s++) {
            numerator += std::min(row_i[s], row_j[s]);
            denominator += row_i[s] + row_j[s];
        }
        return denominator > 0.0 ? 1.0 - 2.0 * numerator / denominator : 0.0;
    });

    return DissimilarityMatrix(std::move(values), n);
}

DissimilarityMatrix build_jaccard_matrix(const std::vector<Community>& communities) {
    validate_communities(communities);
    const auto sets = presence_sets(communities);

    std::vector<dp_t> values = fill_symmetric(communities.size(), [&](size_t i, size_t j) {
        size_t shared = intersection_size(sets[i], sets[j]);
        size_t united = sets[i].size() + sets[j].size() - shared;
        return united > 0 ? 1.0 - static_cast<dp_t>(shared) / static_cast<dp_t>(united) : 0.0;
    });
    return DissimilarityMatrix(std::move(values), communities.size());
}

DissimilarityMatrix build_sorensen_matrix(const std::vector<Community>& communities) {
    validate_communities(communities);
    const auto sets = presence_sets(communities);

    std::vector<dp_t> values = fill_symmetric(communities.size(), [&](size_t i, size_t j) {
        size_t shared = intersection_size(sets[i], sets[j]);
        size_t total = sets[i].size() + sets[j].size();
        return total > 0 ? 1.0 - 2.0 * static_cast<dp_t>(shared) / static_cast<dp_t>(total) : 0.0;
    });
    return DissimilarityMatrix(std::move(values), communities.size());
}

} // namespace ord
