#pragma once

#include <array>

#include "shippack/geometry.hpp"

namespace shippack {

// One of the 6 axis permutations of an item's (length, width, height).
// Footprint `length` runs along the box length (y), `width` along the box width (x).
struct Orientation {
    double length = 0.0;
    double width = 0.0;
    double height = 0.0;

    double base_area() const { return length * width; }
    double volume() const { return length * width * height; }
};

// Fixed enumeration order: (a,b,c) (a,c,b) (b,a,c) (b,c,a) (c,a,b) (c,b,a).
std::array<Orientation, 6> orientations(const Dims& d);

}  // namespace shippack
