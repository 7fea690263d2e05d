#pragma once

#include <map>
#include <string>
#include <vector>

#include "shippack/layer_packer.hpp"
#include "shippack/model.hpp"

namespace shippack {

struct BoxPacking {
    BoxType box;
    std::vector<Placement> placements;
    double used_volume = 0.0;
    double packed_weight = 0.0;
    double void_ratio = 1.0;
    double dim_weight = 0.0;
    int layers = 0;

    double box_volume() const;
    double fill_percent() const;
};

struct PlanSummary {
    int total_boxes = 0;
    double total_cost = 0.0;
    double total_actual_weight = 0.0;
    double total_chargeable_weight = 0.0;

    // Individual-shipping comparison.
    double baseline_cost = 0.0;
    double savings = 0.0;
    double average_fill_percent = 0.0;
};

struct ShipmentPlan {
    // Items the boxes were packed from (after envelope grouping); Placement::item indexes here.
    std::vector<Item> items;
    std::vector<BoxPacking> boxes;
    PlanSummary summary;
};

PlanSummary summarize_plan(const std::vector<BoxPacking>& boxes, double baseline_cost);

// Units placed per original item id, expanding envelope cluster contents.
std::map<std::string, int> count_placed_units(const ShipmentPlan& plan);

// Human-readable invariant violations (empty when the plan is sound): weight and volume
// bounds, placements outside the box, intersecting placements, and unit conservation
// against `requested`.
std::vector<std::string> plan_violations(const ShipmentPlan& plan, const std::vector<Item>& requested, double eps = 1e-6);

}  // namespace shippack
