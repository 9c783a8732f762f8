#include "ord_utils.hpp"
#include <cmath>

namespace ord {

uint32_t derive_seed(uint64_t seed, uint64_t stream) {
    // splitmix64 finalizer so neighbouring streams get unrelated seeds
    uint64_t z = seed + 0x9e3779b97f4a7c15ULL * (stream + 1);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    z = z ^ (z >> 31);
    return static_cast<uint32_t>(z ^ (z >> 32));
}

dp_t dot(const dp_t* a, const dp_t* b, size_t n) {
    dp_t sum = 0.0;
    for (size_t i = 0; i < n; i++) {
        sum += a[i] * b[i];
    }
    return sum;
}

dp_t norm2(const dp_t* a, size_t n) {
    return std::sqrt(dot(a, a, n));
}

dp_t normalize(dp_t* v, size_t n) {
    dp_t len = norm2(v, n);
    if (len > 0.0 && std::isfinite(len)) {
        for (size_t i = 0; i < n; i++) {
            v[i] /= len;
        }
    }
    return len;
}

void symmetric_matvec(const std::vector<dp_t>& A, const dp_t* v, dp_t* out, size_t n) {
    for (size_t i = 0; i < n; i++) {
        out[i] = dot(&A[i * n], v, n);
    }
}

void orthogonalize(dp_t* v, const std::vector<std::vector<dp_t>>& basis, size_t n) {
    // Gram-Schmidt against the already extracted eigenvectors
    for (const auto& b : basis) {
        dp_t proj = dot(v, b.data(), n);
        for (size_t i = 0; i < n; i++) {
            v[i] -= proj * b[i];
        }
    }
}

bool all_finite(const dp_t* v, size_t n) {
    for (size_t i = 0; i < n; i++) {
        if (!std::isfinite(v[i])) return false;
    }
    return true;
}

} // namespace ord
