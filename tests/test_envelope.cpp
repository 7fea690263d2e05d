#include <catch2/catch.hpp>

#include "shippack/envelope.hpp"

using namespace shippack;

namespace {

Item card(const std::string& id, int qty, double weight = 0.2) {
    Item it;
    it.id = id;
    it.name = "Greeting Card";
    it.dims = Dims{9.0, 6.0, 0.3};
    it.weight = weight;
    it.quantity = qty;
    return it;
}

}  // namespace

TEST_CASE("three flat cards collapse into one envelope item", "[envelope]") {
    const auto g = group_for_envelopes({card("card", 3)});
    REQUIRE(g.items.size() == 1);
    REQUIRE(g.clusters.size() == 1);
    REQUIRE(g.passthrough == 0);

    const Item& env = g.items.front();
    REQUIRE(env.id == "envelope_group_1");
    REQUIRE(env.name == "Greeting Card (Envelope)");
    REQUIRE(env.quantity == 1);
    REQUIRE(env.weight == Approx(0.6));
    REQUIRE(env.dims.length == 9.0);
    REQUIRE(env.dims.width == 6.0);
    REQUIRE(env.dims.height == 0.5);
    REQUIRE(env.units() == 3);
    REQUIRE(env.contents.size() == 1);
    REQUIRE(env.contents[0].id == "card");
    REQUIRE(env.contents[0].units == 3);
}

TEST_CASE("envelope clusters respect the weight cap", "[envelope]") {
    // 0.5 lb each: at most 4 per 2 lb cluster.
    const auto g = group_for_envelopes({card("heavy", 6, 0.5)});
    REQUIRE(g.clusters.size() == 2);
    REQUIRE(g.clusters[0].contents[0].units == 4);
    REQUIRE(g.clusters[1].contents[0].units == 2);
    for (const auto& cl : g.clusters) {
        REQUIRE(cl.weight <= 2.0 + 1e-9);
    }
}

TEST_CASE("different items share a cluster when thickness matches", "[envelope]") {
    Item sticker = card("sticker", 2, 0.1);
    sticker.name = "Sticker";
    sticker.dims = Dims{4.0, 3.0, 0.1};
    const auto g = group_for_envelopes({card("card", 1), sticker});
    REQUIRE(g.items.size() == 1);
    REQUIRE(g.items[0].name == "Multiple Small Items (Envelope)");
    REQUIRE(g.items[0].units() == 3);
}

TEST_CASE("bulky and fragile items pass through unchanged", "[envelope]") {
    Item mug;
    mug.id = "mug";
    mug.dims = Dims{4.0, 4.0, 4.0};
    mug.weight = 0.8;

    Item glass_print = card("print", 1);
    glass_print.material = "glass";

    const auto g = group_for_envelopes({mug, glass_print, card("card", 1)});
    REQUIRE(g.clusters.size() == 1);
    REQUIRE(g.passthrough == 2);
    REQUIRE(g.items.size() == 3);
    REQUIRE(g.items[0].id == "envelope_group_1");
    REQUIRE(g.items[1].id == "mug");
    REQUIRE(g.items[2].id == "print");

    REQUIRE_FALSE(envelope_eligible(mug));
    REQUIRE_FALSE(envelope_eligible(glass_print));
}

TEST_CASE("items much thicker than a cluster open their own", "[envelope]") {
    Item pad = card("pad", 1);
    pad.dims = Dims{9.0, 6.0, 0.9};
    const auto g = group_for_envelopes({card("card", 1), pad});
    REQUIRE(g.clusters.size() == 2);
    REQUIRE(g.clusters[1].dims.height == Approx(0.9));
}

TEST_CASE("invalid envelope options are rejected", "[envelope]") {
    EnvelopeOptions opt;
    opt.max_cluster_weight = 0.0;
    REQUIRE_THROWS_AS(group_for_envelopes({card("card", 1)}, opt), std::invalid_argument);
}
