#ifndef ORD_ISOTONIC_HPP
#define ORD_ISOTONIC_HPP

#include "ord_types.hpp"
#include <vector>

namespace ord {

/**
 * @brief Least-squares monotone fit (Pool Adjacent Violators).
 *
 * Finds x_hat minimizing sum((values[i] - x_hat[i])^2) subject to x_hat being
 * non-decreasing when read in rank order. rank_order is an argsort:
 * rank_order[k] is the index of the element at position k of the order.
 *
 * @param values Observed values (any order)
 * @param rank_order Permutation of 0..n-1
 * @return Fitted values, indexed like values
 * @throws std::invalid_argument if rank_order is not a permutation of 0..n-1
 */
std::vector<dp_t> isotonic_regression(const std::vector<dp_t>& values,
                                      const std::vector<integer_t>& rank_order);

// Stable argsort of keys (ties keep index order)
std::vector<integer_t> rank_order_by(const std::vector<dp_t>& keys);

// Lexicographic argsort on (primary, secondary); used for Kruskal's primary
// approach to ties where tied dissimilarities are ordered by current distance
std::vector<integer_t> rank_order_by(const std::vector<dp_t>& primary,
                                     const std::vector<dp_t>& secondary);

} // namespace ord

#endif // ORD_ISOTONIC_HPP
