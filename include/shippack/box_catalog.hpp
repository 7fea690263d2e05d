#pragma once

#include <string>
#include <vector>

#include "shippack/model.hpp"

namespace shippack {

// The 7 standard tiers: small-envelope, envelope, large-envelope, small, medium, large, xlarge.
std::vector<BoxType> standard_box_catalog();

const BoxType* find_box(const std::vector<BoxType>& catalog, const std::string& id);

}  // namespace shippack
