#pragma once

#include <optional>
#include <string>
#include <vector>

#include "shippack/model.hpp"
#include "shippack/orientation.hpp"

namespace shippack {

enum class WeightPolicy {
    kAbort = 0,           // exceeding max_weight fails the whole trial
    kSkipOverweight = 1,  // units that would exceed max_weight stay unpacked
};

struct LayerPackOptions {
    // Orientation heights within this tolerance of the layer lead share one layer; the
    // layer is as tall as its tallest member.
    double height_tol = 1e-9;

    WeightPolicy weight_policy = WeightPolicy::kAbort;

    // Upper bound on layers formed per box trial (stall guard).
    int max_layers = 10'000;
};

struct Placement {
    int instance = -1;  // arena index
    int item = -1;      // index into the item list
    std::string id;
    Orientation orient;
    double x = 0.0;  // along box width
    double y = 0.0;  // along box length
    double z = 0.0;  // layer offset
};

struct PackResult {
    bool ok = false;
    std::string reason;  // set when !ok

    std::vector<Placement> placements;
    double used_volume = 0.0;
    double total_weight = 0.0;
    double void_ratio = 1.0;
    int layers = 0;
};

// Lowest orientation of `item` whose footprint fits the box floor and whose height fits
// `room`. Ties: larger footprint, then the footprint tiling more copies on the floor,
// then enumeration order.
std::optional<Orientation> preferred_orientation(const Dims& item, const BoxType& box, double room, double eps = 1e-9);

// Layered packing of the `candidates` (arena indices) into one box of type `box`.
// Each round picks the smallest preferred height, 2D-packs every candidate sharing it
// and stacks the layer. Instances are matched back by arena index.
PackResult pack_box(
    const BoxType& box,
    const std::vector<Item>& items,
    const std::vector<ItemInstance>& arena,
    const std::vector<int>& candidates,
    const LayerPackOptions& opt = {}
);

}  // namespace shippack
