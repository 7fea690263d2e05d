#include "shippack/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace shippack {

double volume(const Dims& d) {
    return d.length * d.width * d.height;
}

double max_dim(const Dims& d) {
    return std::max({d.length, d.width, d.height});
}

std::array<double, 3> sorted_desc(const Dims& d) {
    std::array<double, 3> s{d.length, d.width, d.height};
    std::sort(s.begin(), s.end(), std::greater<double>());
    return s;
}

bool fits_rotated(const Dims& item, const Dims& box, double eps) {
    // For axis-aligned boxes, comparing sorted extents covers all 6 rotations.
    const auto a = sorted_desc(item);
    const auto b = sorted_desc(box);
    for (size_t k = 0; k < 3; ++k) {
        if (a[k] > b[k] + eps) {
            return false;
        }
    }
    return true;
}

Dims grow(const Dims& d, double margin) {
    return Dims{d.length + margin, d.width + margin, d.height + margin};
}

bool all_positive(const Dims& d) {
    return std::isfinite(d.length) && std::isfinite(d.width) && std::isfinite(d.height) && d.length > 0.0 &&
           d.width > 0.0 && d.height > 0.0;
}

}  // namespace shippack
