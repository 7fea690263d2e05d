#include <catch2/catch.hpp>

#include <limits>

#include "shippack/box_catalog.hpp"
#include "shippack/errors.hpp"
#include "shippack/geometry.hpp"
#include "shippack/model.hpp"
#include "shippack/orientation.hpp"

using namespace shippack;

TEST_CASE("fits_rotated compares sorted extents", "[geometry]") {
    const Dims box{10.0, 7.0, 4.0};
    REQUIRE(fits_rotated(Dims{4.0, 10.0, 7.0}, box));
    REQUIRE(fits_rotated(Dims{7.0, 4.0, 10.0}, box));
    REQUIRE_FALSE(fits_rotated(Dims{10.5, 1.0, 1.0}, box));
    REQUIRE_FALSE(fits_rotated(Dims{8.0, 8.0, 1.0}, box));
}

TEST_CASE("orientations enumerate the six axis permutations", "[geometry]") {
    const auto os = orientations(Dims{3.0, 2.0, 1.0});
    REQUIRE(os.size() == 6);
    REQUIRE(os[0].length == 3.0);
    REQUIRE(os[0].width == 2.0);
    REQUIRE(os[0].height == 1.0);
    REQUIRE(os[5].length == 1.0);
    REQUIRE(os[5].width == 2.0);
    REQUIRE(os[5].height == 3.0);
    for (const auto& o : os) {
        REQUIRE(o.volume() == Approx(6.0));
    }
}

TEST_CASE("grow and sorted_desc", "[geometry]") {
    const Dims g = grow(Dims{30.0, 20.0, 10.0}, 2.0);
    REQUIRE(g.length == 32.0);
    REQUIRE(g.width == 22.0);
    REQUIRE(g.height == 12.0);

    const auto s = sorted_desc(Dims{1.0, 5.0, 3.0});
    REQUIRE(s[0] == 5.0);
    REQUIRE(s[1] == 3.0);
    REQUIRE(s[2] == 1.0);
}

TEST_CASE("validate_items names the offending field", "[model]") {
    std::vector<Item> items(2);
    items[0].id = "a";
    items[0].dims = Dims{1.0, 1.0, 1.0};
    items[0].weight = 1.0;
    items[1].id = "b";
    items[1].dims = Dims{1.0, 0.0, 1.0};
    items[1].weight = 1.0;

    REQUIRE_THROWS_WITH(validate_items(items), Catch::Contains("items[1].dimensions.width"));

    items[1].dims.width = 2.0;
    items[1].quantity = 0;
    REQUIRE_THROWS_AS(validate_items(items), ValidationError);
}

TEST_CASE("validate_items caps the total quantity", "[model]") {
    std::vector<Item> items(2);
    for (auto& it : items) {
        it.id = "bulk";
        it.dims = Dims{1.0, 1.0, 1.0};
        it.weight = 0.1;
    }
    items[0].quantity = kMaxTotalUnits;
    items[1].quantity = std::numeric_limits<int>::max();
    REQUIRE_THROWS_WITH(validate_items(items), Catch::Contains("items: total quantity exceeds"));

    items[1].quantity = 1;
    REQUIRE_THROWS_AS(validate_items(items), ValidationError);

    items[0].quantity = kMaxTotalUnits - 1;
    REQUIRE_NOTHROW(validate_items(items));
}

TEST_CASE("validate_catalog rejects duplicates and empty catalogs", "[model]") {
    REQUIRE_THROWS_AS(validate_catalog({}), ValidationError);

    BoxType b{"x", "X", 1.0, Dims{1.0, 1.0, 1.0}, 1.0, false};
    REQUIRE_NOTHROW(validate_catalog({b}));
    REQUIRE_THROWS_WITH(validate_catalog({b, b}), Catch::Contains("duplicate"));
}

TEST_CASE("expand_instances orders items by total volume", "[model]") {
    std::vector<Item> items(2);
    items[0].id = "small";
    items[0].dims = Dims{1.0, 1.0, 1.0};
    items[0].weight = 1.0;
    items[0].quantity = 2;
    items[1].id = "big";
    items[1].dims = Dims{2.0, 2.0, 2.0};
    items[1].weight = 1.0;

    const auto arena = expand_instances(items);
    REQUIRE(arena.size() == 3);
    REQUIRE(arena[0].item == 1);
    REQUIRE(arena[1].item == 0);
    REQUIRE(arena[1].unit == 0);
    REQUIRE(arena[2].item == 0);
    REQUIRE(arena[2].unit == 1);
}

TEST_CASE("standard catalog tiers grow in size and cost", "[model]") {
    const auto catalog = standard_box_catalog();
    REQUIRE(catalog.size() == 7);
    REQUIRE_NOTHROW(validate_catalog(catalog));
    for (size_t i = 1; i < catalog.size(); ++i) {
        REQUIRE(catalog[i].cost > catalog[i - 1].cost);
    }

    const BoxType* medium = find_box(catalog, "medium");
    REQUIRE(medium != nullptr);
    REQUIRE(medium->max_weight == 10.0);
    REQUIRE(volume(medium->inner) == Approx(840.0));
    REQUIRE(find_box(catalog, "pallet") == nullptr);
}
