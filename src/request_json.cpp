#include "shippack/request_json.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "shippack/box_catalog.hpp"
#include "shippack/errors.hpp"

namespace shippack {
namespace {

namespace pt = boost::property_tree;

std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string index_path(const std::string& array, size_t i) {
    return array + "[" + std::to_string(i) + "]";
}

// Arrays read back as children with empty keys.
bool is_array(const pt::ptree& node) {
    return std::all_of(node.begin(), node.end(), [](const pt::ptree::value_type& kv) {
        return kv.first.empty();
    });
}

// Scalar text of node[key] ("" when absent); JSON null reads back as "null".
std::string text(const pt::ptree& node, const std::string& key) {
    const auto child = node.get_child_optional(key);
    if (!child || !child->empty()) {
        return std::string();
    }
    const std::string v = child->data();
    return (v == "null") ? std::string() : v;
}

// JSON numbers and numeric strings both arrive as text; both are accepted.
double number(const pt::ptree& node, const std::string& key, const std::string& where) {
    const auto child = node.get_child_optional(key);
    if (!child || child->data() == "null") {
        throw ValidationError(where + ": missing");
    }
    const auto v = child->empty() ? child->get_value_optional<double>() : boost::optional<double>();
    if (!v || !std::isfinite(*v)) {
        throw ValidationError(where + ": must be a number");
    }
    return *v;
}

double positive_number(const pt::ptree& node, const std::string& key, const std::string& where) {
    const double v = number(node, key, where);
    if (!(v > 0.0)) {
        throw ValidationError(where + ": must be a positive number");
    }
    return v;
}

double optional_number(const pt::ptree& node, const std::string& key, const std::string& where, double fallback) {
    const auto child = node.get_child_optional(key);
    if (!child || child->data() == "null") {
        return fallback;
    }
    return number(node, key, where);
}

int optional_int(const pt::ptree& node, const std::string& key, const std::string& where, int fallback) {
    const auto child = node.get_child_optional(key);
    if (!child || child->data() == "null") {
        return fallback;
    }
    const auto v = child->empty() ? child->get_value_optional<int>() : boost::optional<int>();
    if (!v) {
        throw ValidationError(where + ": must be an integer");
    }
    return *v;
}

bool optional_bool(const pt::ptree& node, const std::string& key, const std::string& where, bool fallback) {
    const auto child = node.get_child_optional(key);
    if (!child || child->data() == "null") {
        return fallback;
    }
    const auto v = child->empty() ? child->get_value_optional<bool>() : boost::optional<bool>();
    if (!v) {
        throw ValidationError(where + ": must be true or false");
    }
    return *v;
}

Dims read_dims(const pt::ptree& node, const std::string& key, const std::string& where, double to_inches) {
    const auto child = node.get_child_optional(key);
    if (!child || child->empty()) {
        throw ValidationError(where + ": missing");
    }
    Dims d;
    d.length = positive_number(*child, "length", where + ".length") * to_inches;
    d.width = positive_number(*child, "width", where + ".width") * to_inches;
    d.height = positive_number(*child, "height", where + ".height") * to_inches;
    return d;
}

BoxType read_box(const pt::ptree& node, const std::string& where) {
    BoxType b;
    b.id = text(node, "id");
    if (b.id.empty()) {
        throw ValidationError(where + ".id: missing");
    }
    b.name = text(node, "name");
    if (b.name.empty()) {
        b.name = b.id;
    }
    b.cost = number(node, "cost", where + ".cost");
    if (b.cost < 0.0) {
        throw ValidationError(where + ".cost: must be >= 0");
    }
    b.inner = read_dims(node, "innerDims", where + ".innerDims", 1.0);
    b.max_weight = positive_number(node, "maxWeight", where + ".maxWeight");
    return b;
}

Item read_product(const pt::ptree& node, const std::string& where) {
    Item it;
    it.id = text(node, "id");
    if (it.id.empty()) {
        throw ValidationError(where + ".id: missing");
    }
    it.name = text(node, "name");

    std::string length_unit = "in";
    std::string weight_unit = "lb";
    if (const auto units = node.get_child_optional("units")) {
        const std::string l = text(*units, "length");
        const std::string w = text(*units, "weight");
        length_unit = l.empty() ? length_unit : l;
        weight_unit = w.empty() ? weight_unit : w;
    }

    double to_inches = 1.0;
    double to_pounds = 1.0;
    try {
        to_inches = length_to_inches(1.0, length_unit);
        to_pounds = weight_to_pounds(1.0, weight_unit);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(where + ".units: " + e.what());
    }
    it.dims = read_dims(node, "dimensions", where + ".dimensions", to_inches);
    it.weight = positive_number(node, "weight", where + ".weight") * to_pounds;

    it.quantity = optional_int(node, "quantity", where + ".quantity", 1);
    if (it.quantity <= 0) {
        throw ValidationError(where + ".quantity: must be a positive integer");
    }
    it.fragile = optional_bool(node, "fragile", where + ".fragile", false);
    it.material = text(node, "material");
    return it;
}

void read_options(const pt::ptree& node, OptimizerOptions& opt) {
    opt.dim_divisor = optional_number(node, "dimDivisor", "options.dimDivisor", opt.dim_divisor);

    if (const auto w = node.get_child_optional("weights")) {
        opt.weights.cost = optional_number(*w, "cost", "options.weights.cost", opt.weights.cost);
        opt.weights.void_ratio = optional_number(*w, "void", "options.weights.void", opt.weights.void_ratio);
        opt.weights.dim = optional_number(*w, "dim", "options.weights.dim", opt.weights.dim);
        opt.weights.count = optional_number(*w, "count", "options.weights.count", opt.weights.count);
    }

    const std::string together = text(node, "shipTogether");
    if (!together.empty()) {
        opt.ship_together = parse_ship_together(together);
    }
    const std::string basis = text(node, "costBasis");
    if (!basis.empty()) {
        opt.cost_basis = parse_cost_basis(basis);
    }

    opt.custom_box.base_cost =
        optional_number(node, "customBoxBaseCost", "options.customBoxBaseCost", opt.custom_box.base_cost);
    opt.custom_box.margin = optional_number(node, "customBoxMargin", "options.customBoxMargin", opt.custom_box.margin);
    opt.envelope_grouping = optional_bool(node, "envelopeGrouping", "options.envelopeGrouping", opt.envelope_grouping);
    opt.baseline_unit_cost =
        optional_number(node, "baselineUnitCost", "options.baselineUnitCost", opt.baseline_unit_cost);
    opt.max_rounds = optional_int(node, "maxRounds", "options.maxRounds", opt.max_rounds);
    opt.log_every = optional_int(node, "logEvery", "options.logEvery", opt.log_every);
    opt.envelope.verbose = opt.log_every > 0;
}

Destination read_destination(const pt::ptree& node) {
    Destination d;
    const std::string country = text(node, "country");
    if (!country.empty()) {
        d.country = country;
    }
    d.postal_code = text(node, "postal_code");
    d.province = text(node, "province");
    d.city = text(node, "city");
    d.name = text(node, "name");
    d.address1 = text(node, "address1");
    return d;
}

RateProviderConfig read_rates(const pt::ptree& node) {
    RateProviderConfig cfg;
    cfg.kind = parse_rate_provider_kind(text(node, "provider"));
    cfg.service.api_token = text(node, "apiToken");
    const std::string path = text(node, "path");
    if (!path.empty()) {
        cfg.service.path = path;
    }
    const std::string base_url = text(node, "baseUrl");
    if (!base_url.empty()) {
        cfg.service.base_url = base_url;
    }
    if (const auto o = node.get_child_optional("origin")) {
        OriginAddress& origin = cfg.service.origin;
        const std::string name = text(*o, "name");
        origin.name = name.empty() ? origin.name : name;
        origin.address1 = text(*o, "address1");
        origin.city = text(*o, "city");
        origin.state = text(*o, "state");
        origin.postal_code = text(*o, "postal_code");
        const std::string country = text(*o, "country");
        origin.country = country.empty() ? origin.country : country;
        const std::string phone = text(*o, "phone");
        origin.phone = phone.empty() ? origin.phone : phone;
    }
    cfg.verbose = optional_bool(node, "verbose", "rates.verbose", false);
    return cfg;
}

}  // namespace

double length_to_inches(double v, const std::string& unit) {
    const std::string u = lower_copy(unit);
    if (u.empty() || u == "in") {
        return v;
    }
    if (u == "cm") {
        return v / 2.54;
    }
    throw std::invalid_argument("length_to_inches: unknown length unit: " + unit);
}

double weight_to_pounds(double v, const std::string& unit) {
    const std::string u = lower_copy(unit);
    if (u.empty() || u == "lb") {
        return v;
    }
    if (u == "kg") {
        return v * 2.2046226218;
    }
    throw std::invalid_argument("weight_to_pounds: unknown weight unit: " + unit);
}

ShipTogether parse_ship_together(const std::string& s) {
    const std::string v = lower_copy(s);
    if (v == "auto") {
        return ShipTogether::kAuto;
    }
    if (v == "if_possible") {
        return ShipTogether::kIfPossible;
    }
    if (v == "always") {
        return ShipTogether::kAlways;
    }
    throw ValidationError("options.shipTogether: expected auto|if_possible|always, got: " + s);
}

CostBasis parse_cost_basis(const std::string& s) {
    const std::string v = lower_copy(s);
    if (v == "volume") {
        return CostBasis::kPerPackedVolume;
    }
    if (v == "box") {
        return CostBasis::kPerBox;
    }
    throw ValidationError("options.costBasis: expected volume|box, got: " + s);
}

PackRequest parse_request(std::istream& in) {
    pt::ptree root;
    pt::read_json(in, root);

    PackRequest req;

    const auto products = root.get_child_optional("products");
    if (!products || products->empty() || !is_array(*products)) {
        throw ValidationError("products: must be a non-empty array");
    }
    size_t i = 0;
    for (const auto& kv : *products) {
        req.products.push_back(read_product(kv.second, index_path("products", i)));
        ++i;
    }

    if (const auto boxes = root.get_child_optional("boxes")) {
        if (boxes->empty() || !is_array(*boxes)) {
            throw ValidationError("boxes: must be a non-empty array");
        }
        size_t b = 0;
        for (const auto& kv : *boxes) {
            req.boxes.push_back(read_box(kv.second, index_path("boxes", b)));
            ++b;
        }
    } else {
        req.boxes = standard_box_catalog();
    }

    if (const auto options = root.get_child_optional("options")) {
        read_options(*options, req.options);
    }
    if (const auto dest = root.get_child_optional("destination")) {
        if (!dest->empty()) {
            req.destination = read_destination(*dest);
        }
    }
    if (const auto rates = root.get_child_optional("rates")) {
        req.rates = read_rates(*rates);
    }
    return req;
}

PackRequest load_request_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("load_request_file: cannot open " + path);
    }
    return parse_request(f);
}

}  // namespace shippack
