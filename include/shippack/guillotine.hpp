#pragma once

#include <vector>

namespace shippack {

// Footprint to place on a layer sheet. `tag` is caller-owned and echoed back.
struct SheetRect {
    int tag = -1;
    double w = 0.0;
    double l = 0.0;
};

struct PlacedRect {
    int tag = -1;
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double l = 0.0;
};

struct FreeRect {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double l = 0.0;
};

struct GuillotineResult {
    std::vector<PlacedRect> placed;
    std::vector<int> failed;  // tags, input order
    double used_area = 0.0;
};

// Best-area-fit guillotine packing of `rects` (in the given order, no rotation) onto a
// sheet_w x sheet_l sheet. Each placement replaces its free rectangle with a right split
// (freeW - w by l) and a bottom split (freeW by freeL - l). Free rectangles are never
// merged, so late rects can fail on a fragmented sheet with enough total free area.
GuillotineResult guillotine_pack(double sheet_w, double sheet_l, const std::vector<SheetRect>& rects, double eps = 1e-9);

}  // namespace shippack
