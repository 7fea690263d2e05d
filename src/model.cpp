#include "shippack/model.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <string>
#include <unordered_set>

#include "shippack/errors.hpp"

namespace shippack {
namespace {

std::string lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool positive_finite(double v) {
    return std::isfinite(v) && v > 0.0;
}

}  // namespace

int Item::units() const {
    if (contents.empty()) {
        return quantity;
    }
    int n = 0;
    for (const auto& c : contents) {
        n += c.units;
    }
    return n;
}

bool is_fragile_material(const std::string& material) {
    const std::string m = lower_copy(material);
    return m == "glass" || m == "ceramic" || m == "crystal";
}

void validate_items(const std::vector<Item>& items) {
    long long total = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        const Item& it = items[i];
        const std::string where = "items[" + std::to_string(i) + "]";
        if (it.id.empty()) {
            throw ValidationError(where + ".id: must be non-empty");
        }
        if (!positive_finite(it.dims.length)) {
            throw ValidationError(where + ".dimensions.length: must be a positive number");
        }
        if (!positive_finite(it.dims.width)) {
            throw ValidationError(where + ".dimensions.width: must be a positive number");
        }
        if (!positive_finite(it.dims.height)) {
            throw ValidationError(where + ".dimensions.height: must be a positive number");
        }
        if (!positive_finite(it.weight)) {
            throw ValidationError(where + ".weight: must be a positive number");
        }
        if (it.quantity <= 0) {
            throw ValidationError(where + ".quantity: must be a positive integer");
        }
        total += it.quantity;
        if (total > kMaxTotalUnits) {
            throw ValidationError("items: total quantity exceeds " + std::to_string(kMaxTotalUnits) + " units");
        }
    }
}

void validate_catalog(const std::vector<BoxType>& boxes) {
    if (boxes.empty()) {
        throw ValidationError("boxes: catalog must not be empty");
    }
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < boxes.size(); ++i) {
        const BoxType& b = boxes[i];
        const std::string where = "boxes[" + std::to_string(i) + "]";
        if (b.id.empty()) {
            throw ValidationError(where + ".id: must be non-empty");
        }
        if (!seen.insert(b.id).second) {
            throw ValidationError(where + ".id: duplicate box id '" + b.id + "'");
        }
        if (!all_positive(b.inner)) {
            throw ValidationError(where + ".innerDims: all dimensions must be positive numbers");
        }
        if (!positive_finite(b.max_weight)) {
            throw ValidationError(where + ".maxWeight: must be a positive number");
        }
        if (!std::isfinite(b.cost) || b.cost < 0.0) {
            throw ValidationError(where + ".cost: must be a non-negative number");
        }
    }
}

std::vector<ItemInstance> expand_instances(const std::vector<Item>& items) {
    std::vector<int> order(items.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        const Item& ia = items[static_cast<size_t>(a)];
        const Item& ib = items[static_cast<size_t>(b)];
        return volume(ia.dims) * ia.quantity > volume(ib.dims) * ib.quantity;
    });

    std::vector<ItemInstance> arena;
    for (const int i : order) {
        const int qty = items[static_cast<size_t>(i)].quantity;
        for (int u = 0; u < qty; ++u) {
            arena.push_back(ItemInstance{i, u});
        }
    }
    return arena;
}

}  // namespace shippack
