#pragma once

#include <string>
#include <vector>

#include "shippack/geometry.hpp"

namespace shippack {

// Original units merged into an envelope cluster item.
struct ContentEntry {
    std::string id;
    int units = 0;
};

struct Item {
    std::string id;
    std::string name;
    Dims dims;
    double weight = 0.0;  // per unit, pounds
    int quantity = 1;
    bool fragile = false;
    std::string material;

    // Non-empty only for synthetic envelope items.
    std::vector<ContentEntry> contents;

    // Number of caller units this item stands for.
    int units() const;
};

struct BoxType {
    std::string id;
    std::string name;
    double cost = 0.0;
    Dims inner;
    double max_weight = 0.0;
    bool custom = false;
};

// One unit of an item inside a single optimization call; instances are addressed by
// their index in the arena returned by expand_instances(). Instances of the same item
// are interchangeable.
struct ItemInstance {
    int item = -1;
    int unit = 0;
};

// Upper bound on the summed quantity of one request; each unit gets an arena entry.
constexpr int kMaxTotalUnits = 100'000;

bool is_fragile_material(const std::string& material);

// Throws ValidationError naming the first offending field ("items[2].weight"), or
// "items: ..." when the quantities add up to more than kMaxTotalUnits.
void validate_items(const std::vector<Item>& items);
void validate_catalog(const std::vector<BoxType>& boxes);

// One instance per unit, grouped by item, items ordered by total volume (unit volume x quantity)
// descending; ties keep input order.
std::vector<ItemInstance> expand_instances(const std::vector<Item>& items);

}  // namespace shippack
