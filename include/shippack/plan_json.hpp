#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "shippack/plan_stats.hpp"
#include "shippack/rate_quote.hpp"

namespace shippack {

std::string json_escape(std::string_view s);

// Rounds half away from zero to `digits` decimals.
double round_to(double v, int digits);

// {summary, shipments[, quotes]}; money/volume/weight to 2 decimals, voidRatio to 4.
void write_plan_json(
    std::ostream& out,
    const ShipmentPlan& plan,
    bool pretty = false,
    const std::vector<RateQuote>* quotes = nullptr
);

}  // namespace shippack
