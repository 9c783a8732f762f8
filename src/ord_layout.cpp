#include "ord_layout.hpp"
#include <algorithm>
#include <cmath>

namespace ord {

std::vector<Point2> fallback_circle_layout(size_t n) {
    std::vector<Point2> points(n);
    if (n == 1) {
        return points;
    }
    const dp_t two_pi = 2.0 * std::acos(-1.0);
    for (size_t i = 0; i < n; i++) {
        dp_t angle = two_pi * static_cast<dp_t>(i) / static_cast<dp_t>(n);
        points[i].x = std::cos(angle);
        points[i].y = std::sin(angle);
    }
    return points;
}

void center_configuration(std::vector<Point2>& points) {
    if (points.empty()) return;
    dp_t mean_x = 0.0;
    dp_t mean_y = 0.0;
    for (const auto& p : points) {
        mean_x += p.x;
        mean_y += p.y;
    }
    mean_x /= static_cast<dp_t>(points.size());
    mean_y /= static_cast<dp_t>(points.size());
    for (auto& p : points) {
        p.x -= mean_x;
        p.y -= mean_y;
    }
}

void scale_to_bound(std::vector<Point2>& points, dp_t bound) {
    dp_t max_abs = 0.0;
    for (const auto& p : points) {
        max_abs = std::max(max_abs, std::max(std::abs(p.x), std::abs(p.y)));
    }
    if (!(max_abs > 0.0) || !std::isfinite(max_abs)) return;
    const dp_t scale = bound / max_abs;
    for (auto& p : points) {
        p.x *= scale;
        p.y *= scale;
    }
}

Point2 axis_ranges(const std::vector<Point2>& points) {
    if (points.empty()) return Point2{};
    dp_t min_x = points[0].x, max_x = points[0].x;
    dp_t min_y = points[0].y, max_y = points[0].y;
    for (const auto& p : points) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    return Point2{max_x - min_x, max_y - min_y};
}

dp_t distance(const Point2& a, const Point2& b) {
    const dp_t dx = a.x - b.x;
    const dp_t dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

bool all_finite(const std::vector<Point2>& points) {
    for (const auto& p : points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
    }
    return true;
}

} // namespace ord
