#ifndef ORD_LAYOUT_HPP
#define ORD_LAYOUT_HPP

#include "ord_types.hpp"
#include <cstddef>
#include <vector>

namespace ord {

// Deterministic structured layout used by every degenerate path:
// n points evenly spaced on the unit circle (a single point sits at the origin)
std::vector<Point2> fallback_circle_layout(size_t n);

// Subtract the centroid from every point
void center_configuration(std::vector<Point2>& points);

// Uniformly scale so the largest |coordinate| equals bound.
// A configuration collapsed onto the origin is left as is.
void scale_to_bound(std::vector<Point2>& points, dp_t bound);

// Coordinate range (max - min) on each axis
Point2 axis_ranges(const std::vector<Point2>& points);

dp_t distance(const Point2& a, const Point2& b);

bool all_finite(const std::vector<Point2>& points);

} // namespace ord

#endif // ORD_LAYOUT_HPP
