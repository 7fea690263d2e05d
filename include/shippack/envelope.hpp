#pragma once

#include <string>
#include <vector>

#include "shippack/model.hpp"

namespace shippack {

struct EnvelopeOptions {
    // Eligibility (per unit).
    double max_thickness = 1.0;
    double max_unit_weight = 2.0;
    double max_long_side = 15.0;
    double max_mid_side = 12.0;

    // Clustering.
    double max_cluster_weight = 2.0;
    double thickness_tol = 0.25;

    // Standard envelope footprint: members are clamped into [min, max] per side.
    double min_length = 9.0;
    double min_width = 6.0;
    double min_thickness = 0.5;  // padding

    bool verbose = false;
    std::string log_prefix = "[envelope]";
};

struct EnvelopeCluster {
    int id = 0;  // 1-based, matches the synthetic item id suffix
    std::vector<ContentEntry> contents;
    std::vector<std::string> names;
    double weight = 0.0;
    double thickness = 0.0;  // thickest member before padding
    Dims dims;
};

struct EnvelopeGrouping {
    // Synthetic envelope items first, then pass-through items unchanged.
    std::vector<Item> items;
    std::vector<EnvelopeCluster> clusters;
    int passthrough = 0;
};

bool envelope_eligible(const Item& item, const EnvelopeOptions& opt = {});

// Clusters small, flat, light, non-fragile units into envelope items so they skip 3D box
// packing. Units of one item may be split across clusters to respect max_cluster_weight.
EnvelopeGrouping group_for_envelopes(const std::vector<Item>& items, const EnvelopeOptions& opt = {});

}  // namespace shippack
