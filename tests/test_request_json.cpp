#include <catch2/catch.hpp>

#include <sstream>

#include <boost/property_tree/json_parser.hpp>

#include "shippack/errors.hpp"
#include "shippack/request_json.hpp"

using namespace shippack;

namespace {

PackRequest parse(const std::string& json) {
    std::istringstream in(json);
    return parse_request(in);
}

}  // namespace

TEST_CASE("missing boxes select the standard catalog", "[request_json]") {
    const auto req = parse(R"({"products": [
        {"id": "tote", "dimensions": {"length": 15, "width": 12, "height": 6}, "weight": 0.8, "quantity": 3}
    ]})");
    REQUIRE(req.boxes.size() == 7);
    REQUIRE(req.boxes.front().id == "small-envelope");
    REQUIRE(req.products.size() == 1);
    REQUIRE(req.products[0].quantity == 3);
    REQUIRE(req.products[0].dims.length == Approx(15.0));
    REQUIRE_FALSE(req.destination);
}

TEST_CASE("numeric strings and metric units are accepted", "[request_json]") {
    const auto req = parse(R"({"products": [
        {"id": "p", "name": "Vase", "dimensions": {"length": "25.4", "width": "12.7", "height": 2.54},
         "weight": "1", "units": {"length": "cm", "weight": "kg"}, "fragile": true, "material": "glass"}
    ]})");
    const Item& it = req.products[0];
    REQUIRE(it.dims.length == Approx(10.0));
    REQUIRE(it.dims.width == Approx(5.0));
    REQUIRE(it.dims.height == Approx(1.0));
    REQUIRE(it.weight == Approx(2.2046226218));
    REQUIRE(it.quantity == 1);
    REQUIRE(it.fragile);
    REQUIRE(it.material == "glass");
    REQUIRE(it.name == "Vase");
}

TEST_CASE("validation errors name the offending field", "[request_json]") {
    const std::string ok = R"({"id": "a", "dimensions": {"length": 1, "width": 1, "height": 1}, "weight": 1})";

    REQUIRE_THROWS_WITH(
        parse(R"({"products": [)" + ok + R"(, {"id": "b", "dimensions": {"length": 1, "height": 1}, "weight": 1}]})"),
        "products[1].dimensions.width: missing");
    REQUIRE_THROWS_WITH(
        parse(R"({"products": [{"id": "a", "dimensions": {"length": 1, "width": "wide", "height": 1}, "weight": 1}]})"),
        "products[0].dimensions.width: must be a number");
    REQUIRE_THROWS_WITH(
        parse(R"({"products": [{"id": "a", "dimensions": {"length": 1, "width": 1, "height": 1}, "weight": -2}]})"),
        "products[0].weight: must be a positive number");
    REQUIRE_THROWS_WITH(
        parse(R"({"products": [{"id": "a", "dimensions": {"length": 1, "width": 1, "height": 1}, "weight": 1, "quantity": 0}]})"),
        "products[0].quantity: must be a positive integer");
    REQUIRE_THROWS_WITH(parse(R"({"products": []})"), "products: must be a non-empty array");
    REQUIRE_THROWS_WITH(
        parse(R"({"products": [)" + ok + R"(], "boxes": [{"id": "b", "cost": 1, "innerDims": {"length": 1, "width": 1, "height": 1}}]})"),
        "boxes[0].maxWeight: missing");
    REQUIRE_THROWS_AS(
        parse(R"({"products": [{"id": "a", "dimensions": {"length": 1, "width": 1, "height": 1}, "weight": 1, "units": {"length": "furlong"}}]})"),
        ValidationError);
}

TEST_CASE("malformed JSON surfaces the parser error", "[request_json]") {
    REQUIRE_THROWS_AS(parse(R"({"products": [)"), boost::property_tree::json_parser_error);
}

TEST_CASE("options, destination and rates are read", "[request_json]") {
    const auto req = parse(R"({
        "products": [{"id": "a", "dimensions": {"length": 1, "width": 1, "height": 1}, "weight": 1}],
        "boxes": [{"id": "b", "name": "Cube", "cost": "4.5", "innerDims": {"length": 2, "width": 2, "height": 2}, "maxWeight": 5}],
        "options": {"dimDivisor": 166, "weights": {"cost": 1, "void": 0, "dim": 0, "count": 0},
                    "shipTogether": "if_possible", "costBasis": "box", "customBoxBaseCost": 3.5,
                    "customBoxMargin": 1, "envelopeGrouping": false, "baselineUnitCost": 7, "maxRounds": 50},
        "destination": {"country": "CA", "postal_code": "M5V 2T6", "province": "ON", "city": "Toronto"},
        "rates": {"provider": "static", "baseUrl": "https://rates.shipping.test", "path": "/v2/shipments"}
    })");

    REQUIRE(req.boxes.size() == 1);
    REQUIRE(req.boxes[0].name == "Cube");
    REQUIRE(req.boxes[0].cost == Approx(4.5));

    const OptimizerOptions& o = req.options;
    REQUIRE(o.dim_divisor == Approx(166.0));
    REQUIRE(o.weights.cost == Approx(1.0));
    REQUIRE(o.weights.void_ratio == Approx(0.0));
    REQUIRE(o.ship_together == ShipTogether::kIfPossible);
    REQUIRE(o.cost_basis == CostBasis::kPerBox);
    REQUIRE(o.custom_box.base_cost == Approx(3.5));
    REQUIRE(o.custom_box.margin == Approx(1.0));
    REQUIRE_FALSE(o.envelope_grouping);
    REQUIRE(o.baseline_unit_cost == Approx(7.0));
    REQUIRE(o.max_rounds == 50);

    REQUIRE(req.destination);
    REQUIRE(req.destination->country == "CA");
    REQUIRE(req.destination->postal_code == "M5V 2T6");
    REQUIRE(req.rates.kind == RateProviderKind::kStaticTable);
    REQUIRE(req.rates.service.base_url == "https://rates.shipping.test");
    REQUIRE(req.rates.service.path == "/v2/shipments");
}

TEST_CASE("unknown option values are rejected", "[request_json]") {
    REQUIRE_THROWS_WITH(parse_ship_together("sometimes"), Catch::Contains("options.shipTogether"));
    REQUIRE_THROWS_WITH(parse_cost_basis("weight"), Catch::Contains("options.costBasis"));
    REQUIRE(length_to_inches(5.08, "CM") == Approx(2.0));
    REQUIRE(weight_to_pounds(3.0, "lb") == 3.0);
}

TEST_CASE("unreadable files raise", "[request_json]") {
    REQUIRE_THROWS_AS(load_request_file("/nonexistent/request.json"), std::runtime_error);
}
