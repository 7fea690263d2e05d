#include "shippack/guillotine.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace shippack {

GuillotineResult guillotine_pack(double sheet_w, double sheet_l, const std::vector<SheetRect>& rects, double eps) {
    if (!std::isfinite(sheet_w) || !std::isfinite(sheet_l) || sheet_w < 0.0 || sheet_l < 0.0) {
        throw std::invalid_argument("guillotine_pack: sheet dimensions must be finite and >= 0");
    }

    GuillotineResult out;
    out.placed.reserve(rects.size());

    std::vector<FreeRect> free{FreeRect{0.0, 0.0, sheet_w, sheet_l}};
    if (!(sheet_w > eps) || !(sheet_l > eps)) {
        free.clear();
    }

    for (const auto& r : rects) {
        int best = -1;
        double best_waste = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < free.size(); ++i) {
            const FreeRect& fr = free[i];
            if (r.w <= fr.w + eps && r.l <= fr.l + eps) {
                const double waste = fr.w * fr.l - r.w * r.l;
                if (waste < best_waste) {
                    best_waste = waste;
                    best = static_cast<int>(i);
                }
            }
        }
        if (best < 0) {
            out.failed.push_back(r.tag);
            continue;
        }

        const FreeRect fr = free[static_cast<size_t>(best)];
        out.placed.push_back(PlacedRect{r.tag, fr.x, fr.y, r.w, r.l});
        out.used_area += r.w * r.l;

        const FreeRect right{fr.x + r.w, fr.y, fr.w - r.w, r.l};
        const FreeRect bottom{fr.x, fr.y + r.l, fr.w, fr.l - r.l};

        free.erase(free.begin() + best);
        if (right.w > eps && right.l > eps) {
            free.push_back(right);
        }
        if (bottom.w > eps && bottom.l > eps) {
            free.push_back(bottom);
        }
    }
    return out;
}

}  // namespace shippack
