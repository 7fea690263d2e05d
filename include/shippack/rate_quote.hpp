#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "shippack/geometry.hpp"
#include "shippack/plan_stats.hpp"

namespace shippack {

struct Destination {
    std::string country = "US";
    std::string postal_code;
    std::string province;
    std::string city;
    std::string name;
    std::string address1;
};

// One finished box as the carrier sees it.
struct Parcel {
    std::string box_id;
    Dims dims;
    double weight = 0.0;
};

struct BoxCharge {
    std::string box_id;
    double weight = 0.0;  // billed pounds
    double cost = 0.0;
};

struct RateQuote {
    std::string service_code;
    std::string service_name;
    std::string currency;
    double total = 0.0;
    std::vector<BoxCharge> breakdown;
    int eta_days = -1;  // -1 = unknown
};

std::vector<Parcel> parcels_from_plan(const ShipmentPlan& plan);

// ISO country -> ISO currency (USD for unknown countries).
std::string currency_for_country(const std::string& country);

class RateProvider {
public:
    virtual ~RateProvider() = default;

    virtual std::string name() const = 0;

    // Quotes sorted by total ascending.
    virtual std::vector<RateQuote> quote(const std::vector<Parcel>& parcels, const Destination& dest) const = 0;
};

struct CarrierRate {
    std::string code;
    std::string name;
    double base = 0.0;
    double per_lb = 0.0;
    double oversize_surcharge = 0.0;
};

// No-network estimate: base + per_lb * billed weight (+ surcharge past the oversize side).
class StaticRateTable final : public RateProvider {
public:
    StaticRateTable();
    explicit StaticRateTable(
        std::map<std::string, std::vector<CarrierRate>> tables,
        double dim_divisor = 139.0,
        double oversize_side = 22.0
    );

    std::string name() const override { return "static"; }
    std::vector<RateQuote> quote(const std::vector<Parcel>& parcels, const Destination& dest) const override;

    static std::map<std::string, std::vector<CarrierRate>> default_tables();

private:
    std::map<std::string, std::vector<CarrierRate>> tables_;
    double dim_divisor_ = 139.0;
    double oversize_side_ = 22.0;
};

struct OriginAddress {
    std::string name = "Warehouse";
    std::string address1;
    std::string city;
    std::string state;
    std::string postal_code;
    std::string country = "US";
    std::string phone = "0000000000";
};

struct RateServiceConfig {
    std::string api_token;
    std::string base_url = "https://api.goshippo.com";
    std::string path = "/shipments";
    std::string auth_scheme = "ShippoToken";  // Authorization: <scheme> <token>
    long timeout_s = 30;
    OriginAddress origin;
};

// Name of the first required field that is empty ("" when the config is complete).
std::string missing_service_field(const RateServiceConfig& config);

// Sends `body` (JSON) to `path` with the bearer token and returns the JSON response body.
// Transport failures are reported by throwing.
using RateTransport = std::function<std::string(const std::string& path, const std::string& token, const std::string& body)>;

// External rate service speaking a shipments/rates JSON API through an injected transport.
class ExternalRateProvider final : public RateProvider {
public:
    ExternalRateProvider(RateServiceConfig config, RateTransport transport);

    std::string name() const override { return "external"; }
    std::vector<RateQuote> quote(const std::vector<Parcel>& parcels, const Destination& dest) const override;

    std::string build_request(const std::vector<Parcel>& parcels, const Destination& dest) const;
    static std::vector<RateQuote> parse_response(const std::string& body, const Destination& dest);

private:
    RateServiceConfig config_;
    RateTransport transport_;
};

enum class RateProviderKind {
    kAuto = 0,  // external when a token and a transport are available
    kStaticTable = 1,
    kExternal = 2,
};

struct RateProviderConfig {
    RateProviderKind kind = RateProviderKind::kAuto;
    RateServiceConfig service;
    bool verbose = false;
    std::string log_prefix = "[rates]";
};

RateProviderKind parse_rate_provider_kind(const std::string& s);

// Falls back to the static table whenever the external service cannot be used: an
// incomplete RateServiceConfig or no transport. Never throws for a missing field.
std::unique_ptr<RateProvider> make_rate_provider(const RateProviderConfig& config, RateTransport transport = {});

// Quotes `plan` on its own thread; packing never waits on it.
std::future<std::vector<RateQuote>> quote_plan_async(
    std::shared_ptr<const RateProvider> provider,
    const ShipmentPlan& plan,
    Destination dest
);

}  // namespace shippack
