#include <catch2/catch.hpp>

#include <numeric>

#include "shippack/box_catalog.hpp"
#include "shippack/layer_packer.hpp"

using namespace shippack;

namespace {

Item make_item(const std::string& id, Dims d, double weight, int qty = 1) {
    Item it;
    it.id = id;
    it.dims = d;
    it.weight = weight;
    it.quantity = qty;
    return it;
}

std::vector<int> all_of(const std::vector<ItemInstance>& arena) {
    std::vector<int> idx(arena.size());
    std::iota(idx.begin(), idx.end(), 0);
    return idx;
}

}  // namespace

TEST_CASE("preferred_orientation picks the lowest height with the widest base", "[layer_packer]") {
    const BoxType box{"large", "Large", 9.0, Dims{18.0, 14.0, 8.0}, 20.0, false};
    const auto o = preferred_orientation(Dims{15.0, 12.0, 6.0}, box, 8.0);
    REQUIRE(o);
    REQUIRE(o->height == 6.0);
    REQUIRE(o->length == 15.0);
    REQUIRE(o->width == 12.0);

    REQUIRE_FALSE(preferred_orientation(Dims{15.0, 12.0, 6.0}, box, 5.0));
}

TEST_CASE("preferred_orientation breaks base ties by floor tiling", "[layer_packer]") {
    const BoxType box{"xl", "XL", 14.0, Dims{24.0, 18.0, 12.0}, 40.0, false};
    const auto o = preferred_orientation(Dims{15.0, 12.0, 6.0}, box, 12.0);
    REQUIRE(o);
    REQUIRE(o->length == 12.0);
    REQUIRE(o->width == 15.0);
}

TEST_CASE("pack_box stacks layers by height", "[layer_packer]") {
    const BoxType box{"xl", "XL", 14.0, Dims{24.0, 18.0, 12.0}, 40.0, false};
    const std::vector<Item> items{make_item("tote", Dims{15.0, 12.0, 6.0}, 0.8, 3),
                                  make_item("lego", Dims{18.0, 14.0, 3.0}, 2.5)};
    const auto arena = expand_instances(items);
    const auto res = pack_box(box, items, arena, all_of(arena));

    REQUIRE(res.ok);
    REQUIRE(res.layers == 2);
    REQUIRE(res.placements.size() == 3);
    REQUIRE(res.placements[0].id == "lego");
    REQUIRE(res.placements[0].z == 0.0);
    REQUIRE(res.placements[1].z == Approx(3.0));
    REQUIRE(res.placements[2].z == Approx(3.0));
    REQUIRE(res.used_volume == Approx(756.0 + 2.0 * 1080.0));
    REQUIRE(res.total_weight == Approx(4.1));
    REQUIRE(res.void_ratio == Approx(1.0 - 2916.0 / 5184.0));
}

TEST_CASE("pack_box starts the next layer above the tallest member within height_tol", "[layer_packer]") {
    const BoxType box{"cube", "Cube", 5.0, Dims{10.0, 10.0, 10.0}, 20.0, false};
    const std::vector<Item> items{make_item("d", Dims{10.0, 10.0, 4.0}, 1.0),
                                  make_item("c", Dims{10.0, 6.0, 3.0}, 1.0),
                                  make_item("b", Dims{10.0, 4.0, 3.2}, 1.0)};
    const auto arena = expand_instances(items);
    LayerPackOptions opt;
    opt.height_tol = 0.25;
    const auto res = pack_box(box, items, arena, all_of(arena), opt);

    REQUIRE(res.ok);
    REQUIRE(res.layers == 2);
    REQUIRE(res.placements.size() == 3);
    REQUIRE(res.placements[0].id == "c");
    REQUIRE(res.placements[1].id == "b");
    REQUIRE(res.placements[1].z == 0.0);
    REQUIRE(res.placements[2].id == "d");
    REQUIRE(res.placements[2].z == Approx(3.2));
    REQUIRE(res.placements[2].z >= res.placements[1].z + res.placements[1].orient.height - 1e-9);
}

TEST_CASE("pack_box stops at max_layers", "[layer_packer]") {
    const BoxType box{"xl", "XL", 14.0, Dims{24.0, 18.0, 12.0}, 40.0, false};
    const std::vector<Item> items{make_item("tote", Dims{15.0, 12.0, 6.0}, 0.8, 3),
                                  make_item("lego", Dims{18.0, 14.0, 3.0}, 2.5)};
    const auto arena = expand_instances(items);
    LayerPackOptions opt;
    opt.max_layers = 1;
    const auto res = pack_box(box, items, arena, all_of(arena), opt);

    REQUIRE(res.ok);
    REQUIRE(res.layers == 1);
    REQUIRE(res.placements.size() == 1);
    REQUIRE(res.placements[0].id == "lego");
    REQUIRE(res.placements[0].z == 0.0);
    REQUIRE(res.used_volume == Approx(756.0));
}

TEST_CASE("pack_box aborts the trial when the weight limit is exceeded", "[layer_packer]") {
    const BoxType box{"small-envelope", "Small Envelope", 1.5, Dims{9.0, 6.0, 0.5}, 0.5, false};
    const std::vector<Item> items{make_item("card", Dims{9.0, 6.0, 0.5}, 0.6)};
    const auto arena = expand_instances(items);

    const auto res = pack_box(box, items, arena, all_of(arena));
    REQUIRE_FALSE(res.ok);
    REQUIRE(res.reason == "weight_exceeded");

    LayerPackOptions skip;
    skip.weight_policy = WeightPolicy::kSkipOverweight;
    const auto partial = pack_box(box, items, arena, all_of(arena), skip);
    REQUIRE(partial.ok);
    REQUIRE(partial.placements.empty());
    REQUIRE(partial.void_ratio == 1.0);
}

TEST_CASE("pack_box keeps every placement inside the box and apart", "[layer_packer]") {
    const BoxType box = standard_box_catalog().back();
    const std::vector<Item> items{make_item("a", Dims{5.0, 4.0, 3.0}, 0.5, 20),
                                  make_item("b", Dims{7.0, 2.0, 2.0}, 0.2, 15),
                                  make_item("c", Dims{10.0, 9.0, 4.0}, 1.0, 4)};
    const auto arena = expand_instances(items);
    const auto res = pack_box(box, items, arena, all_of(arena));
    REQUIRE(res.ok);
    REQUIRE_FALSE(res.placements.empty());

    double used = 0.0;
    for (size_t i = 0; i < res.placements.size(); ++i) {
        const auto& p = res.placements[i];
        REQUIRE(p.x + p.orient.width <= box.inner.width + 1e-9);
        REQUIRE(p.y + p.orient.length <= box.inner.length + 1e-9);
        REQUIRE(p.z + p.orient.height <= box.inner.height + 1e-9);
        used += p.orient.volume();
        for (size_t j = i + 1; j < res.placements.size(); ++j) {
            const auto& q = res.placements[j];
            const bool apart = p.x + p.orient.width <= q.x + 1e-9 || q.x + q.orient.width <= p.x + 1e-9 ||
                               p.y + p.orient.length <= q.y + 1e-9 || q.y + q.orient.length <= p.y + 1e-9 ||
                               p.z + p.orient.height <= q.z + 1e-9 || q.z + q.orient.height <= p.z + 1e-9;
            REQUIRE(apart);
        }
    }
    REQUIRE(used == Approx(res.used_volume));
    REQUIRE(res.used_volume <= volume(box.inner) + 1e-9);
    REQUIRE(res.total_weight <= box.max_weight + 1e-9);
}

TEST_CASE("pack_box validates candidate indices", "[layer_packer]") {
    const BoxType box = standard_box_catalog().back();
    const std::vector<Item> items{make_item("a", Dims{1.0, 1.0, 1.0}, 0.1)};
    const auto arena = expand_instances(items);
    REQUIRE_THROWS_AS(pack_box(box, items, arena, {5}), std::out_of_range);

    LayerPackOptions bad;
    bad.max_layers = 0;
    REQUIRE_THROWS_AS(pack_box(box, items, arena, {0}, bad), std::invalid_argument);
}
