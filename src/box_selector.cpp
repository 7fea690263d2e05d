#include "shippack/box_selector.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

#include "shippack/errors.hpp"
#include "shippack/logging.hpp"

namespace shippack {
namespace {

constexpr double kEps = 1e-9;

BoxPacking commit(const BoxType& box, PackResult pack, const OptimizerOptions& opt) {
    BoxPacking out;
    out.box = box;
    out.used_volume = pack.used_volume;
    out.packed_weight = pack.total_weight;
    out.void_ratio = pack.void_ratio;
    out.layers = pack.layers;
    out.dim_weight = dimensional_weight(volume(box.inner), pack.total_weight, opt.dim_divisor);
    out.placements = std::move(pack.placements);
    return out;
}

// Items are validated, so the sum stays within kMaxTotalUnits.
int total_units(const std::vector<Item>& items) {
    int n = 0;
    for (const auto& it : items) {
        n += it.units();
    }
    return n;
}

}  // namespace

void validate_options(const OptimizerOptions& opt) {
    if (!std::isfinite(opt.dim_divisor) || !(opt.dim_divisor > 0.0)) {
        throw std::invalid_argument("optimize_shipment: dim_divisor must be > 0");
    }
    validate_weights(opt.weights);
    if (!(opt.custom_box.margin >= 0.0)) {
        throw std::invalid_argument("optimize_shipment: custom_box.margin must be >= 0");
    }
    if (!std::isfinite(opt.custom_box.base_cost) || opt.custom_box.base_cost < 0.0) {
        throw std::invalid_argument("optimize_shipment: custom_box.base_cost must be >= 0");
    }
    if (!(opt.custom_box.weight_factor >= 1.0)) {
        throw std::invalid_argument("optimize_shipment: custom_box.weight_factor must be >= 1");
    }
    if (!(opt.baseline_unit_cost >= 0.0)) {
        throw std::invalid_argument("optimize_shipment: baseline_unit_cost must be >= 0");
    }
    if (opt.max_rounds <= 0) {
        throw std::invalid_argument("optimize_shipment: max_rounds must be > 0");
    }
}

BoxType make_custom_box(const Item& item, const CustomBoxOptions& opt) {
    BoxType box;
    box.id = opt.id;
    box.name = "Custom Box";
    box.cost = opt.base_cost;
    box.inner = grow(item.dims, opt.margin);
    box.max_weight = std::max(item.weight * opt.weight_factor, opt.min_max_weight);
    box.custom = true;
    return box;
}

TrialFeatures trial_features(const BoxType& box, const PackResult& pack, const OptimizerOptions& opt) {
    TrialFeatures f;
    const double box_vol = volume(box.inner);
    f.cost = (opt.cost_basis == CostBasis::kPerBox) ? box.cost : box.cost / std::max(pack.used_volume, kEps);
    f.void_ratio = pack.void_ratio;
    f.dim_weight = dimensional_weight(box_vol, pack.total_weight, opt.dim_divisor);
    f.box_count = 1.0;
    return f;
}

void consume_placed(std::vector<int>& remaining, const std::vector<ItemInstance>& arena, const std::vector<Placement>& placed) {
    std::unordered_map<int, int> by_item;
    for (const auto& p : placed) {
        by_item[p.item] += 1;
    }

    std::vector<int> kept;
    kept.reserve(remaining.size());
    for (const int idx : remaining) {
        auto pos = by_item.find(arena[static_cast<size_t>(idx)].item);
        if (pos != by_item.end() && pos->second > 0) {
            pos->second -= 1;
        } else {
            kept.push_back(idx);
        }
    }
    remaining.swap(kept);
}

ShipmentPlan select_boxes(const std::vector<Item>& items, const std::vector<BoxType>& catalog, const OptimizerOptions& opt) {
    validate_options(opt);
    validate_items(items);
    validate_catalog(catalog);

    ShipmentPlan plan;
    plan.items = items;

    const std::vector<ItemInstance> arena = expand_instances(items);
    std::vector<int> remaining(arena.size());
    std::iota(remaining.begin(), remaining.end(), 0);

    const std::string prefix = opt.log_prefix.empty() ? std::string("[selector]") : opt.log_prefix;
    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " start items=" << items.size() << " units=" << arena.size()
                  << " box_types=" << catalog.size() << "\n";
    }

    int round = 0;
    while (!remaining.empty()) {
        if (round >= opt.max_rounds) {
            throw PackingError("select_boxes: round budget exhausted with " + std::to_string(remaining.size()) +
                               " units unpacked");
        }
        ++round;

        std::vector<BoxTrial> trials;
        for (size_t b = 0; b < catalog.size(); ++b) {
            PackResult pack = pack_box(catalog[b], plan.items, arena, remaining, opt.layer);
            if (!pack.ok || pack.placements.empty()) {
                continue;
            }
            BoxTrial t;
            t.box = static_cast<int>(b);
            t.features = trial_features(catalog[b], pack, opt);
            t.pack = std::move(pack);
            trials.push_back(std::move(t));
        }

        if (trials.empty()) {
            // Nothing in the catalog takes even one unit: size a box around the first one.
            const int first = remaining.front();
            const Item& it = plan.items[static_cast<size_t>(arena[static_cast<size_t>(first)].item)];
            const BoxType custom = make_custom_box(it, opt.custom_box);
            PackResult pack = pack_box(custom, plan.items, arena, {first}, opt.layer);
            if (!pack.ok || pack.placements.size() != 1) {
                throw PackingError("unable to package item '" + it.id + "': it does not fit even a custom box");
            }
            if (opt.log_every > 0) {
                std::lock_guard<std::mutex> lk(log_mutex());
                std::cerr << prefix << " round=" << round << " no catalog box fits '" << it.id
                          << "', using custom box " << custom.inner.length << "x" << custom.inner.width << "x"
                          << custom.inner.height << "\n";
            }
            plan.boxes.push_back(commit(custom, std::move(pack), opt));
            remaining.erase(remaining.begin());
            continue;
        }

        if (opt.ship_together != ShipTogether::kAuto) {
            std::vector<BoxTrial> whole;
            for (auto& t : trials) {
                if (t.pack.placements.size() == remaining.size()) {
                    whole.push_back(std::move(t));
                }
            }
            if (!whole.empty()) {
                trials.swap(whole);
            } else if (opt.ship_together == ShipTogether::kAlways) {
                throw PackingError("select_boxes: no box takes all " + std::to_string(remaining.size()) +
                                   " remaining units together");
            }
        }

        std::vector<TrialFeatures> features;
        features.reserve(trials.size());
        for (const auto& t : trials) {
            features.push_back(t.features);
        }
        const std::vector<double> scores = score_trials(features, opt.weights);
        const int k = best_trial(scores);
        BoxTrial& best = trials[static_cast<size_t>(k)];

        if (should_log(opt.log_every, round)) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << " round=" << round << " remaining=" << remaining.size()
                      << " trials=" << trials.size() << " pick=" << catalog[static_cast<size_t>(best.box)].id
                      << " placed=" << best.pack.placements.size() << " score=" << scores[static_cast<size_t>(k)]
                      << "\n";
        }

        consume_placed(remaining, arena, best.pack.placements);
        plan.boxes.push_back(commit(catalog[static_cast<size_t>(best.box)], std::move(best.pack), opt));
    }

    plan.summary = summarize_plan(plan.boxes, opt.baseline_unit_cost * total_units(items));

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " done boxes=" << plan.summary.total_boxes << " cost=" << plan.summary.total_cost
                  << " rounds=" << round << "\n";
    }
    return plan;
}

ShipmentPlan optimize_shipment(const std::vector<Item>& items, const std::vector<BoxType>& catalog, const OptimizerOptions& opt) {
    validate_options(opt);
    validate_items(items);
    validate_catalog(catalog);

    if (!opt.envelope_grouping) {
        return select_boxes(items, catalog, opt);
    }
    const EnvelopeGrouping grouped = group_for_envelopes(items, opt.envelope);
    return select_boxes(grouped.items, catalog, opt);
}

}  // namespace shippack
