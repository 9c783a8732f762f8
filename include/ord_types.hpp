#ifndef ORD_TYPES_HPP
#define ORD_TYPES_HPP

#include <cstdint>

namespace ord {

// Precision types
using float64 = double;
using int32 = int32_t;
using int64 = int64_t;

// All ordination arithmetic runs in double precision
using dp_t = float64;
using integer_t = int32;

// Abundance totals can exceed 32 bits for large surveys
using count_t = int64;

// One ordination coordinate pair (Axis1, Axis2)
struct Point2 {
    dp_t x = 0.0;
    dp_t y = 0.0;
};

// Outcome of an ordination run. Degenerate and unstable inputs still
// produce a usable layout; the status tells the caller how to read it.
enum class FitStatus {
    OK,
    DEGENERATE_INPUT,     // N < 3 or all-zero dissimilarity matrix
    NUMERIC_INSTABILITY   // every component/attempt produced NaN or Inf
};

} // namespace ord

#endif // ORD_TYPES_HPP
