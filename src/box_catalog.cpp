#include "shippack/box_catalog.hpp"

namespace shippack {

std::vector<BoxType> standard_box_catalog() {
    return {
        BoxType{"small-envelope", "Small Envelope", 1.50, Dims{9.0, 6.0, 0.5}, 0.5, false},
        BoxType{"envelope", "Padded Envelope", 2.25, Dims{12.0, 9.0, 0.75}, 1.0, false},
        BoxType{"large-envelope", "Large Envelope", 3.00, Dims{15.0, 12.0, 1.0}, 2.0, false},
        BoxType{"small", "Small Box", 4.50, Dims{10.0, 7.0, 4.0}, 3.0, false},
        BoxType{"medium", "Medium Box", 6.50, Dims{14.0, 10.0, 6.0}, 10.0, false},
        BoxType{"large", "Large Box", 9.00, Dims{18.0, 14.0, 8.0}, 20.0, false},
        BoxType{"xlarge", "Extra Large Box", 14.00, Dims{24.0, 18.0, 12.0}, 40.0, false},
    };
}

const BoxType* find_box(const std::vector<BoxType>& catalog, const std::string& id) {
    for (const auto& b : catalog) {
        if (b.id == id) {
            return &b;
        }
    }
    return nullptr;
}

}  // namespace shippack
