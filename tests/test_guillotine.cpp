#include <catch2/catch.hpp>

#include <stdexcept>

#include "shippack/guillotine.hpp"

using namespace shippack;

TEST_CASE("guillotine places into the best-fitting free rectangle", "[guillotine]") {
    // 10x10 sheet: first 6x10 leaves a 4x10 right split; the 4x4 goes there.
    const auto res = guillotine_pack(10.0, 10.0, {{0, 6.0, 10.0}, {1, 4.0, 4.0}});
    REQUIRE(res.failed.empty());
    REQUIRE(res.placed.size() == 2);
    REQUIRE(res.placed[1].x == Approx(6.0));
    REQUIRE(res.placed[1].y == Approx(0.0));
    REQUIRE(res.used_area == Approx(76.0));
}

TEST_CASE("guillotine reports rectangles that do not fit", "[guillotine]") {
    const auto res = guillotine_pack(18.0, 24.0, {{0, 15.0, 12.0}, {1, 15.0, 12.0}, {2, 15.0, 12.0}});
    REQUIRE(res.placed.size() == 2);
    REQUIRE(res.failed.size() == 1);
    REQUIRE(res.failed[0] == 2);
}

TEST_CASE("guillotine placements never overlap and stay on the sheet", "[guillotine]") {
    std::vector<SheetRect> rects;
    for (int i = 0; i < 12; ++i) {
        rects.push_back(SheetRect{i, 2.0 + (i % 3), 1.0 + (i % 4)});
    }
    const auto res = guillotine_pack(9.0, 8.0, rects);
    for (size_t i = 0; i < res.placed.size(); ++i) {
        const auto& a = res.placed[i];
        REQUIRE(a.x >= 0.0);
        REQUIRE(a.y >= 0.0);
        REQUIRE(a.x + a.w <= 9.0 + 1e-9);
        REQUIRE(a.y + a.l <= 8.0 + 1e-9);
        for (size_t j = i + 1; j < res.placed.size(); ++j) {
            const auto& b = res.placed[j];
            const bool apart = a.x + a.w <= b.x + 1e-9 || b.x + b.w <= a.x + 1e-9 || a.y + a.l <= b.y + 1e-9 ||
                               b.y + b.l <= a.y + 1e-9;
            REQUIRE(apart);
        }
    }
    REQUIRE(res.placed.size() + res.failed.size() == rects.size());
}

TEST_CASE("guillotine handles degenerate sheets", "[guillotine]") {
    const auto res = guillotine_pack(0.0, 5.0, {{7, 1.0, 1.0}});
    REQUIRE(res.placed.empty());
    REQUIRE(res.failed == std::vector<int>{7});
    REQUIRE_THROWS_AS(guillotine_pack(-1.0, 5.0, {}), std::invalid_argument);
}
