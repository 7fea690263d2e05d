#include "shippack/rate_quote.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "shippack/logging.hpp"
#include "shippack/plan_json.hpp"

namespace shippack {
namespace {

namespace pt = boost::property_tree;

std::string upper_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

std::string trim_copy(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

// JSON null reads back as the literal "null".
std::string text_or_empty(const pt::ptree& node, const std::string& path) {
    const std::string v = node.get<std::string>(path, std::string());
    return (v == "null") ? std::string() : v;
}

void sort_by_total(std::vector<RateQuote>& quotes) {
    std::stable_sort(quotes.begin(), quotes.end(), [](const RateQuote& a, const RateQuote& b) {
        return a.total < b.total;
    });
}

std::string format_number(double v) {
    std::ostringstream oss;
    oss << round_to(v, 2);
    return oss.str();
}

}  // namespace

std::string missing_service_field(const RateServiceConfig& config) {
    const std::pair<const char*, const std::string*> fields[] = {
        {"api_token", &config.api_token},
        {"origin.address1", &config.origin.address1},
        {"origin.city", &config.origin.city},
        {"origin.postal_code", &config.origin.postal_code},
        {"origin.country", &config.origin.country},
    };
    for (const auto& f : fields) {
        if (f.second->empty()) {
            return f.first;
        }
    }
    return std::string();
}

std::vector<Parcel> parcels_from_plan(const ShipmentPlan& plan) {
    std::vector<Parcel> out;
    out.reserve(plan.boxes.size());
    for (const auto& b : plan.boxes) {
        out.push_back(Parcel{b.box.id, b.box.inner, b.packed_weight});
    }
    return out;
}

std::string currency_for_country(const std::string& country) {
    static const std::set<std::string> kEuro = {"DE", "FR", "ES", "IT", "NL", "SE", "DK", "IE", "PT",
                                                "FI", "BE", "AT", "LU", "GR", "CY", "MT", "SI", "SK",
                                                "LV", "LT", "EE", "CZ", "PL", "HU", "RO", "BG", "HR"};
    const std::string c = upper_copy(country.empty() ? std::string("US") : country);
    if (c == "US") {
        return "USD";
    }
    if (c == "CA") {
        return "CAD";
    }
    if (c == "GB" || c == "UK") {
        return "GBP";
    }
    if (kEuro.count(c) != 0) {
        return "EUR";
    }
    return "USD";
}

// ---------------------------------------------------------------------------------------------
// StaticRateTable

StaticRateTable::StaticRateTable() : StaticRateTable(default_tables()) {}

StaticRateTable::StaticRateTable(std::map<std::string, std::vector<CarrierRate>> tables, double dim_divisor, double oversize_side)
    : tables_(std::move(tables)), dim_divisor_(dim_divisor), oversize_side_(oversize_side) {
    if (!(dim_divisor_ > 0.0)) {
        throw std::invalid_argument("StaticRateTable: dim_divisor must be > 0");
    }
    if (!(oversize_side_ > 0.0)) {
        throw std::invalid_argument("StaticRateTable: oversize_side must be > 0");
    }
}

std::map<std::string, std::vector<CarrierRate>> StaticRateTable::default_tables() {
    return {
        {"US",
         {
             {"UPS_GROUND", "UPS Ground", 6.5, 0.7, 4.0},
             {"USPS_PRIORITY", "USPS Priority", 5.2, 0.9, 3.0},
             {"FEDEX_HOME", "FedEx Home Delivery", 7.0, 0.8, 4.5},
         }},
        {"CA",
         {
             {"CANADA_POST_EXPEDITED", "Canada Post Expedited", 9.0, 1.2, 5.0},
             {"PUROLATOR_GROUND", "Purolator Ground", 10.0, 1.1, 6.0},
         }},
        {"GB",
         {
             {"ROYAL_MAIL_TRACKED_48", "Royal Mail Tracked 48", 4.2, 1.0, 3.5},
             {"DPD_LOCAL", "DPD Local", 5.0, 1.1, 4.0},
         }},
    };
}

std::vector<RateQuote> StaticRateTable::quote(const std::vector<Parcel>& parcels, const Destination& dest) const {
    std::string country = upper_copy(dest.country.empty() ? std::string("US") : dest.country);
    auto table = tables_.find(country);
    if (table == tables_.end()) {
        country = "US";
        table = tables_.find(country);
    }
    if (table == tables_.end()) {
        throw std::runtime_error("StaticRateTable: no table for " + upper_copy(dest.country) + " and no US fallback");
    }

    std::vector<RateQuote> out;
    out.reserve(table->second.size());
    for (const auto& carrier : table->second) {
        RateQuote q;
        q.service_code = carrier.code;
        q.service_name = carrier.name;
        q.currency = currency_for_country(country);

        double total = 0.0;
        for (const auto& p : parcels) {
            const double actual = (p.weight > 0.0) ? p.weight : 1.0;
            const double billed = std::max(actual, volume(p.dims) / dim_divisor_);
            const bool oversize = max_dim(p.dims) > oversize_side_;
            const double cost = carrier.base + carrier.per_lb * billed + (oversize ? carrier.oversize_surcharge : 0.0);
            total += cost;
            q.breakdown.push_back(BoxCharge{p.box_id, round_to(billed, 2), round_to(cost, 2)});
        }
        q.total = round_to(total, 2);
        out.push_back(std::move(q));
    }
    sort_by_total(out);
    return out;
}

// ---------------------------------------------------------------------------------------------
// ExternalRateProvider

ExternalRateProvider::ExternalRateProvider(RateServiceConfig config, RateTransport transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    const std::string missing = missing_service_field(config_);
    if (!missing.empty()) {
        throw std::invalid_argument("ExternalRateProvider: missing required config: " + missing);
    }
    if (!transport_) {
        throw std::invalid_argument("ExternalRateProvider: transport must be set");
    }
}

std::string ExternalRateProvider::build_request(const std::vector<Parcel>& parcels, const Destination& dest) const {
    pt::ptree root;

    const OriginAddress& o = config_.origin;
    root.put("address_from.name", o.name);
    root.put("address_from.street1", o.address1);
    root.put("address_from.city", o.city);
    root.put("address_from.state", o.state);
    root.put("address_from.zip", o.postal_code);
    root.put("address_from.country", upper_copy(o.country));
    root.put("address_from.phone", o.phone);

    root.put("address_to.name", dest.name.empty() ? std::string("Customer") : dest.name);
    root.put("address_to.street1", dest.address1.empty() ? std::string("Address Provided At Checkout") : dest.address1);
    root.put("address_to.city", dest.city);
    root.put("address_to.state", dest.province);
    root.put("address_to.zip", dest.postal_code);
    root.put("address_to.country", upper_copy(dest.country.empty() ? std::string("US") : dest.country));

    pt::ptree list;
    for (const auto& p : parcels) {
        pt::ptree node;
        node.put("length", format_number(p.dims.length));
        node.put("width", format_number(p.dims.width));
        node.put("height", format_number(p.dims.height));
        node.put("distance_unit", "in");
        node.put("weight", format_number(std::max(p.weight, 0.1)));
        node.put("mass_unit", "lb");
        list.push_back(std::make_pair(std::string(), node));
    }
    root.add_child("parcels", list);
    root.put("async", "false");

    std::ostringstream oss;
    pt::write_json(oss, root, false);
    return oss.str();
}

std::vector<RateQuote> ExternalRateProvider::parse_response(const std::string& body, const Destination& dest) {
    pt::ptree root;
    std::istringstream iss(body);
    pt::read_json(iss, root);

    std::vector<RateQuote> out;
    const auto rates = root.get_child_optional("rates");
    if (!rates) {
        return out;
    }
    for (const auto& kv : *rates) {
        const pt::ptree& r = kv.second;
        const std::string provider = text_or_empty(r, "provider");
        const std::string token = text_or_empty(r, "servicelevel.token");
        const std::string level = text_or_empty(r, "servicelevel.name");

        const auto amount = r.get_optional<double>("amount");
        if (!amount) {
            throw std::runtime_error("ExternalRateProvider: rate from '" + provider + "' has no numeric amount");
        }

        RateQuote q;
        q.service_code = upper_copy(provider + "_" + (token.empty() ? level : token));
        q.service_name = trim_copy(provider + " " + (level.empty() ? token : level));
        const std::string currency = text_or_empty(r, "currency");
        q.currency = currency.empty() ? currency_for_country(dest.country) : currency;
        q.total = *amount;
        if (const auto eta = r.get_optional<int>("estimated_days")) {
            q.eta_days = *eta;
        }
        out.push_back(std::move(q));
    }
    sort_by_total(out);
    return out;
}

std::vector<RateQuote> ExternalRateProvider::quote(const std::vector<Parcel>& parcels, const Destination& dest) const {
    const std::string body = build_request(parcels, dest);
    const std::string response = transport_(config_.path, config_.api_token, body);
    return parse_response(response, dest);
}

// ---------------------------------------------------------------------------------------------

RateProviderKind parse_rate_provider_kind(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (v.empty() || v == "auto") {
        return RateProviderKind::kAuto;
    }
    if (v == "static") {
        return RateProviderKind::kStaticTable;
    }
    if (v == "external") {
        return RateProviderKind::kExternal;
    }
    throw std::invalid_argument("parse_rate_provider_kind: expected auto|static|external, got: " + s);
}

std::unique_ptr<RateProvider> make_rate_provider(const RateProviderConfig& config, RateTransport transport) {
    if (config.kind == RateProviderKind::kStaticTable) {
        return std::make_unique<StaticRateTable>();
    }

    std::string why;
    const std::string missing = missing_service_field(config.service);
    if (!missing.empty()) {
        why = "missing " + missing;
    } else if (!transport) {
        why = "no transport";
    }

    if (why.empty()) {
        return std::make_unique<ExternalRateProvider>(config.service, std::move(transport));
    }
    // auto without a token is the ordinary offline case and stays quiet.
    const bool asked = config.kind == RateProviderKind::kExternal || !config.service.api_token.empty();
    if (asked && config.verbose) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << config.log_prefix << " external rate service unavailable (" << why << "), using static table\n";
    }
    return std::make_unique<StaticRateTable>();
}

std::future<std::vector<RateQuote>> quote_plan_async(
    std::shared_ptr<const RateProvider> provider,
    const ShipmentPlan& plan,
    Destination dest
) {
    if (!provider) {
        throw std::invalid_argument("quote_plan_async: provider must not be null");
    }
    std::vector<Parcel> parcels = parcels_from_plan(plan);
    return std::async(std::launch::async,
                      [provider = std::move(provider), parcels = std::move(parcels), dest = std::move(dest)]() {
                          return provider->quote(parcels, dest);
                      });
}

}  // namespace shippack
