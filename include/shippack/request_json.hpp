#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "shippack/box_selector.hpp"
#include "shippack/model.hpp"
#include "shippack/rate_quote.hpp"

namespace shippack {

// One optimization request as read from JSON.
struct PackRequest {
    std::vector<BoxType> boxes;  // standard catalog when the request has none
    std::vector<Item> products;
    OptimizerOptions options;
    std::optional<Destination> destination;
    RateProviderConfig rates;
};

double length_to_inches(double v, const std::string& unit);
double weight_to_pounds(double v, const std::string& unit);

ShipTogether parse_ship_together(const std::string& s);
CostBasis parse_cost_basis(const std::string& s);

// Throws ValidationError for missing/non-numeric fields and boost::property_tree's
// json_parser_error for malformed JSON.
PackRequest parse_request(std::istream& in);
PackRequest load_request_file(const std::string& path);

}  // namespace shippack
