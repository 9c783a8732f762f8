#include "ord_isotonic.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace ord {

namespace {
    // One pooled run of consecutive positions with a common fitted value
    struct Pool {
        dp_t sum;
        size_t count;
        size_t first;  // First position (in rank order) covered by the pool

        dp_t mean() const { return sum / static_cast<dp_t>(count); }
    };
}

std::vector<dp_t> isotonic_regression(const std::vector<dp_t>& values,
                                      const std::vector<integer_t>& rank_order) {
    const size_t n = values.size();
    if (rank_order.size() != n) {
        throw std::invalid_argument("isotonic_regression: rank_order has " + std::to_string(rank_order.size()) +
                                    " entries for " + std::to_string(n) + " values");
    }

    std::vector<bool> seen(n, false);
    for (integer_t idx : rank_order) {
        if (idx < 0 || static_cast<size_t>(idx) >= n || seen[idx]) {
            throw std::invalid_argument("isotonic_regression: rank_order is not a permutation of 0.." +
                                        std::to_string(n == 0 ? 0 : n - 1));
        }
        seen[idx] = true;
    }

    // Left-to-right scan in rank order. A new element starts its own pool;
    // while the previous pool's mean exceeds the newest pool's mean, merge.
    std::vector<Pool> pools;
    pools.reserve(n);
    for (size_t k = 0; k < n; k++) {
        pools.push_back(Pool{values[rank_order[k]], 1, k});
        while (pools.size() > 1 && pools[pools.size() - 2].mean() > pools.back().mean()) {
            Pool top = pools.back();
            pools.pop_back();
            pools.back().sum += top.sum;
            pools.back().count += top.count;
        }
    }

    std::vector<dp_t> fitted(n);
    for (const Pool& pool : pools) {
        const dp_t m = pool.mean();
        for (size_t k = pool.first; k < pool.first + pool.count; k++) {
            fitted[rank_order[k]] = m;
        }
    }
    return fitted;
}

std::vector<integer_t> rank_order_by(const std::vector<dp_t>& keys) {
    std::vector<integer_t> order(keys.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&keys](integer_t a, integer_t b) {
        return keys[a] < keys[b];
    });
    return order;
}

std::vector<integer_t> rank_order_by(const std::vector<dp_t>& primary,
                                     const std::vector<dp_t>& secondary) {
    if (primary.size() != secondary.size()) {
        throw std::invalid_argument("rank_order_by: key vectors differ in length");
    }
    std::vector<integer_t> order(primary.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](integer_t a, integer_t b) {
        if (primary[a] != primary[b]) return primary[a] < primary[b];
        return secondary[a] < secondary[b];
    });
    return order;
}

} // namespace ord
