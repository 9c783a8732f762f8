#ifndef ORD_UTILS_HPP
#define ORD_UTILS_HPP

#include "ord_types.hpp"
#include <cstddef>
#include <vector>

namespace ord {

// MT19937 Random Number Generator
// Each caller owns its instance; nothing in the library shares one.
class MT19937 {
private:
    static constexpr int N = 624;
    static constexpr int M = 397;
    static constexpr uint32_t MATA = 0x9908b0dfUL;
    static constexpr uint32_t UMASK = 0x80000000UL;  // Most significant w-r bits
    static constexpr uint32_t LMASK = 0x7fffffffUL;  // Least significant r bits
    static constexpr uint32_t TMASKB = 0x9d2c5680UL;
    static constexpr uint32_t TMASKC = 0xefc60000UL;

    int mti;
    uint32_t mt[N];
    uint32_t mag01[2];

public:
    MT19937() : mti(N + 1) {
        mag01[0] = 0x0UL;
        mag01[1] = MATA;
    }

    explicit MT19937(uint32_t seed) : MT19937() {
        sgrnd(seed);
    }

    // Initialize generator
    void sgrnd(uint32_t seed) {
        mt[0] = seed & 0xffffffffUL;
        for (mti = 1; mti < N; mti++) {
            mt[mti] = (1812433253UL * (mt[mti-1] ^ (mt[mti-1] >> 30)) + mti);
            mt[mti] &= 0xffffffffUL;
        }
    }

    // Generate random double in [0,1]
    double grnd() {
        uint32_t y;
        int kk;

        if (mti >= N) {
            if (mti == N + 1) {
                sgrnd(5489UL);
            }

            for (kk = 0; kk < N - M; kk++) {
                y = (mt[kk] & UMASK) | (mt[kk+1] & LMASK);
                mt[kk] = mt[kk+M] ^ (y >> 1) ^ mag01[y & 0x1UL];
            }
            for (kk = N - M; kk < N - 1; kk++) {
                y = (mt[kk] & UMASK) | (mt[kk+1] & LMASK);
                mt[kk] = mt[kk+(M-N)] ^ (y >> 1) ^ mag01[y & 0x1UL];
            }
            y = (mt[N-1] & UMASK) | (mt[0] & LMASK);
            mt[N-1] = mt[M-1] ^ (y >> 1) ^ mag01[y & 0x1UL];

            mti = 0;
        }

        y = mt[mti++];

        y ^= (y >> 11);
        y ^= (y << 7) & TMASKB;
        y ^= (y << 15) & TMASKC;
        y ^= (y >> 18);

        return ((double)y / (double)0xffffffffUL);
    }

    // Uniform value in [lo, hi]
    dp_t uniform(dp_t lo, dp_t hi) {
        return lo + (hi - lo) * grnd();
    }
};

// Fold a 64-bit user seed and a stream index into a 32-bit MT19937 seed
uint32_t derive_seed(uint64_t seed, uint64_t stream);

// Dense vector helpers (length n, contiguous)
dp_t dot(const dp_t* a, const dp_t* b, size_t n);
dp_t norm2(const dp_t* a, size_t n);

// Scale v to unit length in place. Returns the original norm;
// a zero or non-finite norm leaves v untouched.
dp_t normalize(dp_t* v, size_t n);

// out = A * v for a row-major n x n matrix A
void symmetric_matvec(const std::vector<dp_t>& A, const dp_t* v, dp_t* out, size_t n);

// Remove from v its projection onto each (unit) vector in basis
void orthogonalize(dp_t* v, const std::vector<std::vector<dp_t>>& basis, size_t n);

bool all_finite(const dp_t* v, size_t n);

} // namespace ord

#endif // ORD_UTILS_HPP
