#include "shippack/envelope.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include "shippack/logging.hpp"

namespace shippack {
namespace {

constexpr double kEps = 1e-9;

void validate_envelope_options(const EnvelopeOptions& opt) {
    if (!(opt.max_thickness > 0.0) || !(opt.max_unit_weight > 0.0) || !(opt.max_long_side > 0.0) ||
        !(opt.max_mid_side > 0.0)) {
        throw std::invalid_argument("group_for_envelopes: eligibility limits must be > 0");
    }
    if (!(opt.max_cluster_weight > 0.0)) {
        throw std::invalid_argument("group_for_envelopes: max_cluster_weight must be > 0");
    }
    if (!(opt.thickness_tol >= 0.0)) {
        throw std::invalid_argument("group_for_envelopes: thickness_tol must be >= 0");
    }
    if (opt.min_length > opt.max_long_side || opt.min_width > opt.max_mid_side) {
        throw std::invalid_argument("group_for_envelopes: envelope minimum footprint exceeds the maximum");
    }
}

// How many more units of `unit_weight` fit under the cluster weight cap.
int units_that_fit(double current, double unit_weight, double cap) {
    const double room = cap - current;
    if (room < unit_weight - kEps) {
        return 0;
    }
    return static_cast<int>(std::floor((room + kEps) / unit_weight));
}

void add_units(EnvelopeCluster& cl, const Item& it, int units) {
    auto pos = std::find_if(cl.contents.begin(), cl.contents.end(), [&](const ContentEntry& c) {
        return c.id == it.id;
    });
    if (pos == cl.contents.end()) {
        cl.contents.push_back(ContentEntry{it.id, units});
        cl.names.push_back(it.name.empty() ? it.id : it.name);
    } else {
        pos->units += units;
    }
    cl.weight += it.weight * units;
}

Item cluster_item(const EnvelopeCluster& cl) {
    Item out;
    out.id = "envelope_group_" + std::to_string(cl.id);
    out.name = (cl.names.size() > 1 ? std::string("Multiple Small Items") : cl.names.front()) + " (Envelope)";
    out.dims = cl.dims;
    out.weight = cl.weight;
    out.quantity = 1;
    out.fragile = false;
    out.contents = cl.contents;
    return out;
}

}  // namespace

bool envelope_eligible(const Item& item, const EnvelopeOptions& opt) {
    const auto s = sorted_desc(item.dims);
    const bool flat = s[2] <= opt.max_thickness + kEps;
    const bool light = item.weight <= opt.max_unit_weight + kEps;
    const bool fits = s[0] <= opt.max_long_side + kEps && s[1] <= opt.max_mid_side + kEps;
    const bool sturdy = !item.fragile && !is_fragile_material(item.material);
    return flat && light && fits && sturdy && item.contents.empty();
}

EnvelopeGrouping group_for_envelopes(const std::vector<Item>& items, const EnvelopeOptions& opt) {
    validate_envelope_options(opt);

    EnvelopeGrouping out;
    std::vector<Item> passthrough;

    for (const auto& it : items) {
        if (!envelope_eligible(it, opt)) {
            passthrough.push_back(it);
            continue;
        }

        const auto s = sorted_desc(it.dims);
        const double thickness = s[2];
        int left = it.quantity;

        // Join existing clusters first, in creation order.
        for (auto& cl : out.clusters) {
            if (left == 0) {
                break;
            }
            if (std::abs(cl.thickness - thickness) > opt.thickness_tol + kEps) {
                continue;
            }
            const int k = std::min(left, units_that_fit(cl.weight, it.weight, opt.max_cluster_weight));
            if (k <= 0) {
                continue;
            }
            add_units(cl, it, k);
            cl.dims.length = std::max(cl.dims.length, std::min(opt.max_long_side, s[0]));
            cl.dims.width = std::max(cl.dims.width, std::min(opt.max_mid_side, s[1]));
            cl.thickness = std::max(cl.thickness, thickness);
            cl.dims.height = std::max(cl.thickness, opt.min_thickness);
            left -= k;
        }

        while (left > 0) {
            EnvelopeCluster cl;
            cl.id = static_cast<int>(out.clusters.size()) + 1;
            cl.dims.length = std::clamp(s[0], opt.min_length, opt.max_long_side);
            cl.dims.width = std::clamp(s[1], opt.min_width, opt.max_mid_side);
            cl.thickness = thickness;
            cl.dims.height = std::max(thickness, opt.min_thickness);
            const int k = std::max(1, std::min(left, units_that_fit(0.0, it.weight, opt.max_cluster_weight)));
            add_units(cl, it, k);
            left -= k;
            out.clusters.push_back(std::move(cl));
        }
    }

    out.items.reserve(out.clusters.size() + passthrough.size());
    for (const auto& cl : out.clusters) {
        out.items.push_back(cluster_item(cl));
    }
    out.passthrough = static_cast<int>(passthrough.size());
    for (auto& it : passthrough) {
        out.items.push_back(std::move(it));
    }

    if (opt.verbose) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << opt.log_prefix << " items=" << items.size() << " -> " << out.items.size()
                  << " clusters=" << out.clusters.size() << " passthrough=" << out.passthrough << "\n";
    }
    return out;
}

}  // namespace shippack
