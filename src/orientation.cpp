#include "shippack/orientation.hpp"

namespace shippack {

std::array<Orientation, 6> orientations(const Dims& d) {
    const double a = d.length;
    const double b = d.width;
    const double c = d.height;
    return {
        Orientation{a, b, c},
        Orientation{a, c, b},
        Orientation{b, a, c},
        Orientation{b, c, a},
        Orientation{c, a, b},
        Orientation{c, b, a},
    };
}

}  // namespace shippack
