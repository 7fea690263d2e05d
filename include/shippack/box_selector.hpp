#pragma once

#include <string>
#include <vector>

#include "shippack/envelope.hpp"
#include "shippack/layer_packer.hpp"
#include "shippack/model.hpp"
#include "shippack/plan_stats.hpp"
#include "shippack/scoring.hpp"

namespace shippack {

enum class ShipTogether {
    kAuto = 0,        // score every trial
    kIfPossible = 1,  // prefer trials that take every remaining unit
    kAlways = 2,      // require one box for all remaining units
};

// Fallback box synthesized when no catalog box takes a remaining unit.
struct CustomBoxOptions {
    std::string id = "CUSTOM_NEXT_UP";
    double margin = 2.0;  // added to each item dimension
    double base_cost = 2.0;
    double weight_factor = 2.0;   // max weight >= weight_factor * unit weight
    double min_max_weight = 5.0;  // and never below this
};

struct OptimizerOptions {
    // Volume per chargeable pound (139 in^3/lb domestic; 5000 for cm^3/kg).
    double dim_divisor = 139.0;

    ScoreWeights weights;
    CostBasis cost_basis = CostBasis::kPerPackedVolume;
    ShipTogether ship_together = ShipTogether::kAuto;

    bool envelope_grouping = true;
    EnvelopeOptions envelope;

    LayerPackOptions layer;
    CustomBoxOptions custom_box;

    // Per-unit price of shipping every unit on its own (savings baseline).
    double baseline_unit_cost = 9.0;

    // Upper bound on selection rounds (each round commits one box).
    int max_rounds = 100'000;

    // If >0, print a line every k rounds (stderr).
    int log_every = 0;
    std::string log_prefix = "[selector]";
};

struct BoxTrial {
    int box = -1;  // catalog index
    PackResult pack;
    TrialFeatures features;
};

void validate_options(const OptimizerOptions& opt);

BoxType make_custom_box(const Item& item, const CustomBoxOptions& opt);

TrialFeatures trial_features(const BoxType& box, const PackResult& pack, const OptimizerOptions& opt);

// Removes consumed units from `remaining`: for every item, as many of its instances as the
// placements hold, earliest first. Instances of one item are interchangeable.
void consume_placed(
    std::vector<int>& remaining,
    const std::vector<ItemInstance>& arena,
    const std::vector<Placement>& placed
);

// Greedy multi-box loop over `items` as given (no envelope pre-pass).
ShipmentPlan select_boxes(const std::vector<Item>& items, const std::vector<BoxType>& catalog, const OptimizerOptions& opt = {});

// Full pipeline: validation, envelope pre-pass (if enabled), box selection.
ShipmentPlan optimize_shipment(const std::vector<Item>& items, const std::vector<BoxType>& catalog, const OptimizerOptions& opt = {});

}  // namespace shippack
