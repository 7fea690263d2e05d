#pragma once

#include <array>

namespace shippack {

// Axis-aligned box extents in inches.
struct Dims {
    double length = 0.0;
    double width = 0.0;
    double height = 0.0;
};

double volume(const Dims& d);
double max_dim(const Dims& d);

// {largest, middle, smallest}.
std::array<double, 3> sorted_desc(const Dims& d);

// True when `item` fits inside `box` under at least one of the 6 axis-aligned rotations.
bool fits_rotated(const Dims& item, const Dims& box, double eps = 1e-9);

Dims grow(const Dims& d, double margin);

bool all_positive(const Dims& d);

}  // namespace shippack
