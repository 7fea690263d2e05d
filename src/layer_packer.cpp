#include "shippack/layer_packer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "shippack/guillotine.hpp"

namespace shippack {
namespace {

constexpr double kEps = 1e-9;

// How many copies of a w x l footprint tile the floor as a plain grid.
double grid_count(const Orientation& o, const BoxType& box) {
    const double across = std::floor((box.inner.width + kEps) / o.width);
    const double along = std::floor((box.inner.length + kEps) / o.length);
    return across * along;
}

bool better_orientation(const Orientation& cand, const Orientation& best, const BoxType& box, double eps) {
    if (cand.height < best.height - eps) {
        return true;
    }
    if (cand.height > best.height + eps) {
        return false;
    }
    if (cand.base_area() > best.base_area() + eps) {
        return true;
    }
    if (cand.base_area() < best.base_area() - eps) {
        return false;
    }
    return grid_count(cand, box) > grid_count(best, box);
}

struct LayerCandidate {
    int instance = -1;
    Orientation orient;
};

}  // namespace

std::optional<Orientation> preferred_orientation(const Dims& item, const BoxType& box, double room, double eps) {
    std::optional<Orientation> best;
    if (!fits_rotated(item, Dims{box.inner.length, box.inner.width, room}, eps)) {
        return best;
    }
    for (const auto& o : orientations(item)) {
        if (o.height > room + eps || o.length > box.inner.length + eps || o.width > box.inner.width + eps) {
            continue;
        }
        if (!best || better_orientation(o, *best, box, eps)) {
            best = o;
        }
    }
    return best;
}

PackResult pack_box(
    const BoxType& box,
    const std::vector<Item>& items,
    const std::vector<ItemInstance>& arena,
    const std::vector<int>& candidates,
    const LayerPackOptions& opt
) {
    if (!(opt.height_tol >= 0.0)) {
        throw std::invalid_argument("pack_box: height_tol must be >= 0");
    }
    if (opt.max_layers <= 0) {
        throw std::invalid_argument("pack_box: max_layers must be > 0");
    }
    for (const int idx : candidates) {
        if (idx < 0 || idx >= static_cast<int>(arena.size())) {
            throw std::out_of_range("pack_box: candidate index out of range");
        }
        const int item = arena[static_cast<size_t>(idx)].item;
        if (item < 0 || item >= static_cast<int>(items.size())) {
            throw std::out_of_range("pack_box: arena item index out of range");
        }
    }

    auto item_of = [&](int idx) -> const Item& {
        return items[static_cast<size_t>(arena[static_cast<size_t>(idx)].item)];
    };

    PackResult res;
    const double box_vol = volume(box.inner);

    std::vector<int> remaining = candidates;
    std::stable_sort(remaining.begin(), remaining.end(), [&](int a, int b) {
        return volume(item_of(a).dims) > volume(item_of(b).dims);
    });

    double z = 0.0;
    while (!remaining.empty() && z < box.inner.height - kEps && res.layers < opt.max_layers) {
        const double room = box.inner.height - z;

        std::vector<LayerCandidate> consider;
        consider.reserve(remaining.size());
        for (const int idx : remaining) {
            if (auto o = preferred_orientation(item_of(idx).dims, box, room, kEps)) {
                consider.push_back(LayerCandidate{idx, *o});
            }
        }
        if (consider.empty()) {
            break;
        }

        // Smallest preferred height lets the most instances share the layer.
        const LayerCandidate* lead = &consider.front();
        for (const auto& c : consider) {
            const double dh = c.orient.height - lead->orient.height;
            if (dh < -opt.height_tol ||
                (std::abs(dh) <= opt.height_tol && c.orient.base_area() > lead->orient.base_area())) {
                lead = &c;
            }
        }
        const double h = lead->orient.height;

        std::vector<SheetRect> rects;
        std::vector<const LayerCandidate*> by_tag;
        for (const auto& c : consider) {
            if (std::abs(c.orient.height - h) <= opt.height_tol) {
                rects.push_back(SheetRect{static_cast<int>(by_tag.size()), c.orient.width, c.orient.length});
                by_tag.push_back(&c);
            }
        }

        const GuillotineResult sheet = guillotine_pack(box.inner.width, box.inner.length, rects, kEps);
        res.layers++;

        std::vector<int> placed;
        placed.reserve(sheet.placed.size());
        // Members may be up to height_tol taller than the lead; the next layer starts above the tallest.
        double layer_h = 0.0;
        for (const auto& pr : sheet.placed) {
            const LayerCandidate& c = *by_tag[static_cast<size_t>(pr.tag)];
            const Item& it = item_of(c.instance);
            if (res.total_weight + it.weight > box.max_weight + kEps) {
                if (opt.weight_policy == WeightPolicy::kAbort) {
                    PackResult fail;
                    fail.ok = false;
                    fail.reason = "weight_exceeded";
                    fail.total_weight = res.total_weight + it.weight;
                    fail.layers = res.layers;
                    return fail;
                }
                continue;
            }

            Placement p;
            p.instance = c.instance;
            p.item = arena[static_cast<size_t>(c.instance)].item;
            p.id = it.id;
            p.orient = c.orient;
            p.x = pr.x;
            p.y = pr.y;
            p.z = z;
            res.placements.push_back(std::move(p));
            res.total_weight += it.weight;
            res.used_volume += c.orient.volume();
            layer_h = std::max(layer_h, c.orient.height);
            placed.push_back(c.instance);
        }

        if (!placed.empty()) {
            std::sort(placed.begin(), placed.end());
            remaining.erase(std::remove_if(remaining.begin(),
                                           remaining.end(),
                                           [&](int idx) { return std::binary_search(placed.begin(), placed.end(), idx); }),
                            remaining.end());
            z += layer_h;
        } else {
            // Nothing landed (fragmented sheet or weight-skipped units): step past the
            // smallest eligible height so the loop always advances.
            double min_h = std::numeric_limits<double>::infinity();
            for (const auto& c : consider) {
                min_h = std::min(min_h, c.orient.height);
            }
            if (!std::isfinite(min_h) || min_h <= 0.0) {
                break;
            }
            z += min_h;
        }
    }

    res.ok = true;
    res.void_ratio = (box_vol > 0.0) ? std::clamp(1.0 - res.used_volume / box_vol, 0.0, 1.0) : 0.0;
    return res;
}

}  // namespace shippack
