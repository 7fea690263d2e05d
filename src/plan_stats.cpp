#include "shippack/plan_stats.hpp"

#include <algorithm>
#include <sstream>

namespace shippack {
namespace {

bool intervals_overlap(double a0, double a1, double b0, double b1, double eps) {
    return a0 < b1 - eps && b0 < a1 - eps;
}

bool placements_intersect(const Placement& a, const Placement& b, double eps) {
    return intervals_overlap(a.x, a.x + a.orient.width, b.x, b.x + b.orient.width, eps) &&
           intervals_overlap(a.y, a.y + a.orient.length, b.y, b.y + b.orient.length, eps) &&
           intervals_overlap(a.z, a.z + a.orient.height, b.z, b.z + b.orient.height, eps);
}

}  // namespace

double BoxPacking::box_volume() const {
    return volume(box.inner);
}

double BoxPacking::fill_percent() const {
    const double v = box_volume();
    return (v > 0.0) ? (used_volume / v) * 100.0 : 0.0;
}

PlanSummary summarize_plan(const std::vector<BoxPacking>& boxes, double baseline_cost) {
    PlanSummary st;
    double fill_sum = 0.0;
    for (const auto& b : boxes) {
        st.total_boxes += 1;
        st.total_cost += b.box.cost;
        st.total_actual_weight += b.packed_weight;
        st.total_chargeable_weight += b.dim_weight;
        fill_sum += b.fill_percent();
    }
    st.baseline_cost = baseline_cost;
    st.savings = std::max(0.0, baseline_cost - st.total_cost);
    st.average_fill_percent = boxes.empty() ? 0.0 : fill_sum / static_cast<double>(boxes.size());
    return st;
}

std::map<std::string, int> count_placed_units(const ShipmentPlan& plan) {
    std::map<std::string, int> counts;
    for (const auto& b : plan.boxes) {
        for (const auto& p : b.placements) {
            const bool known = p.item >= 0 && p.item < static_cast<int>(plan.items.size());
            if (known && !plan.items[static_cast<size_t>(p.item)].contents.empty()) {
                for (const auto& c : plan.items[static_cast<size_t>(p.item)].contents) {
                    counts[c.id] += c.units;
                }
            } else {
                counts[p.id] += 1;
            }
        }
    }
    return counts;
}

std::vector<std::string> plan_violations(const ShipmentPlan& plan, const std::vector<Item>& requested, double eps) {
    std::vector<std::string> out;
    auto report = [&](size_t box_idx, const std::string& msg) {
        std::ostringstream oss;
        oss << "box " << box_idx + 1 << " (" << plan.boxes[box_idx].box.id << "): " << msg;
        out.push_back(oss.str());
    };

    for (size_t bi = 0; bi < plan.boxes.size(); ++bi) {
        const BoxPacking& b = plan.boxes[bi];
        const Dims& in = b.box.inner;

        if (b.packed_weight > b.box.max_weight + eps) {
            report(bi, "packed weight exceeds max weight");
        }
        if (b.used_volume > b.box_volume() + eps) {
            report(bi, "used volume exceeds box volume");
        }
        if (b.void_ratio < -eps || b.void_ratio > 1.0 + eps) {
            report(bi, "void ratio outside [0, 1]");
        }

        for (size_t i = 0; i < b.placements.size(); ++i) {
            const Placement& p = b.placements[i];
            if (p.x < -eps || p.y < -eps || p.z < -eps || p.x + p.orient.width > in.width + eps ||
                p.y + p.orient.length > in.length + eps || p.z + p.orient.height > in.height + eps) {
                report(bi, "placement of '" + p.id + "' lies outside the box");
            }
            for (size_t j = i + 1; j < b.placements.size(); ++j) {
                if (placements_intersect(p, b.placements[j], eps)) {
                    report(bi, "placements of '" + p.id + "' and '" + b.placements[j].id + "' intersect");
                }
            }
        }
    }

    std::map<std::string, int> want;
    for (const auto& it : requested) {
        want[it.id] += it.units();
    }
    const auto got = count_placed_units(plan);
    for (const auto& [id, n] : want) {
        const auto pos = got.find(id);
        const int placed = (pos == got.end()) ? 0 : pos->second;
        if (placed != n) {
            out.push_back("item '" + id + "': requested " + std::to_string(n) + ", placed " + std::to_string(placed));
        }
    }
    for (const auto& [id, n] : got) {
        if (want.find(id) == want.end()) {
            out.push_back("item '" + id + "': placed " + std::to_string(n) + " but never requested");
        }
    }
    return out;
}

}  // namespace shippack
