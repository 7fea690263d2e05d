#pragma once

#include <string>
#include <vector>

#include "shippack/model.hpp"
#include "shippack/plan_stats.hpp"

namespace shippack {

bool is_fragile_item(const Item& item);

// Step-by-step lines for a person packing `box` (box_number is 1-based).
std::vector<std::string> packing_instructions(const BoxPacking& box, const std::vector<Item>& items, int box_number);

}  // namespace shippack
