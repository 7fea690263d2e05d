#include "shippack/packing_instructions.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <sstream>

namespace shippack {
namespace {

const char* const kFragileWords[] = {"glass", "ceramic", "fragile", "delicate", "crystal"};

std::string lower_copy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string fmt(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    std::string s = oss.str();
    while (!s.empty() && s.back() == '0') {
        s.pop_back();
    }
    if (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

std::string display_name(const Item& it) {
    return it.name.empty() ? it.id : it.name;
}

}  // namespace

bool is_fragile_item(const Item& item) {
    if (item.fragile || is_fragile_material(item.material)) {
        return true;
    }
    const std::string name = lower_copy(item.name);
    for (const char* w : kFragileWords) {
        if (name.find(w) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> packing_instructions(const BoxPacking& box, const std::vector<Item>& items, int box_number) {
    std::vector<std::string> lines;
    const std::string box_name = box.box.name.empty() ? box.box.id : box.box.name;
    lines.push_back("Box " + std::to_string(box_number) + " (" + box_name + "):");

    auto item_at = [&](const Placement& p) -> const Item* {
        if (p.item < 0 || p.item >= static_cast<int>(items.size())) {
            return nullptr;
        }
        return &items[static_cast<size_t>(p.item)];
    };

    std::vector<std::string> fragile;
    for (const auto& p : box.placements) {
        const Item* it = item_at(p);
        if (it && is_fragile_item(*it)) {
            const std::string n = display_name(*it);
            if (std::find(fragile.begin(), fragile.end(), n) == fragile.end()) {
                fragile.push_back(n);
            }
        }
    }

    int step = 1;
    if (!fragile.empty()) {
        lines.push_back(std::to_string(step++) + ". Add protective padding to the bottom");
        std::string names;
        for (size_t i = 0; i < fragile.size(); ++i) {
            names += (i ? ", " : "") + fragile[i];
        }
        lines.push_back(std::to_string(step++) + ". Wrap fragile items before placing them: " + names);
    }

    // Placements are recorded layer by layer, so z only grows.
    std::map<double, std::vector<const Placement*>> layers;
    for (const auto& p : box.placements) {
        layers[p.z].push_back(&p);
    }
    int layer_no = 1;
    for (const auto& [z, ps] : layers) {
        std::ostringstream oss;
        oss << step++ << ". Layer " << layer_no++ << " at height " << fmt(z) << " in:";
        for (size_t i = 0; i < ps.size(); ++i) {
            const Placement& p = *ps[i];
            const Item* it = item_at(p);
            oss << (i ? ";" : "") << " " << (it ? display_name(*it) : p.id) << " at (" << fmt(p.x) << ", "
                << fmt(p.y) << "), " << fmt(p.orient.length) << "x" << fmt(p.orient.width) << "x"
                << fmt(p.orient.height);
        }
        lines.push_back(oss.str());
    }

    lines.push_back(std::to_string(step++) + ". Total weight: " + fmt(box.packed_weight) + " lb");
    lines.push_back(std::to_string(step++) + ". Utilization: " + fmt(box.fill_percent()) + "%");
    return lines;
}

}  // namespace shippack
