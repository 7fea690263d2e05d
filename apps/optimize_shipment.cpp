#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "shippack/box_selector.hpp"
#include "shippack/http_transport.hpp"
#include "shippack/plan_json.hpp"
#include "shippack/plan_stats.hpp"
#include "shippack/rate_quote.hpp"
#include "shippack/request_json.hpp"
#include "utils/cli_parse.hpp"

namespace {

struct Args {
    std::string input;
    bool pretty = false;
    std::string quote_country;
    std::optional<double> dim_divisor;
    std::vector<double> weights;
    std::string cost_basis;
    std::string ship_together;
    bool no_envelopes = false;
    std::optional<int> max_rounds;
    std::optional<int> log_every;
    bool verify = false;
};

void print_usage() {
    std::cout
        << "Usage: optimize_shipment [--input] FILE [--pretty] [--quote COUNTRY] [--dim-divisor D]\n"
        << "                         [--weights c,v,d,n] [--cost-basis box|volume]\n"
        << "                         [--ship-together auto|if_possible|always] [--no-envelopes]\n"
        << "                         [--max-rounds N] [--log-every N] [--verify]\n";
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const char* flag) {
            return utils::require_arg(i, argc, argv, flag);
        };

        if (a == "--input") {
            args.input = need("--input");
        } else if (a == "--pretty") {
            args.pretty = true;
        } else if (a == "--quote") {
            args.quote_country = need("--quote");
        } else if (a == "--dim-divisor") {
            args.dim_divisor = utils::parse_double(need("--dim-divisor"), "--dim-divisor");
        } else if (a == "--weights") {
            args.weights = utils::parse_double_list(need("--weights"), "--weights");
            if (args.weights.size() != 4) {
                throw std::runtime_error("--weights: expected 4 values (cost,void,dim,count)");
            }
        } else if (a == "--cost-basis") {
            args.cost_basis = need("--cost-basis");
        } else if (a == "--ship-together") {
            args.ship_together = need("--ship-together");
        } else if (a == "--no-envelopes") {
            args.no_envelopes = true;
        } else if (a == "--max-rounds") {
            args.max_rounds = utils::parse_int(need("--max-rounds"), "--max-rounds");
        } else if (a == "--log-every") {
            args.log_every = utils::parse_int(need("--log-every"), "--log-every");
        } else if (a == "--verify") {
            args.verify = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            std::exit(0);
        } else if (!a.empty() && a[0] != '-' && args.input.empty()) {
            args.input = a;
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    if (args.input.empty()) {
        throw std::runtime_error("missing input file (see --help)");
    }
    return args;
}

// Command line overrides the request's options block.
void apply_overrides(const Args& args, shippack::OptimizerOptions& opt) {
    if (args.dim_divisor) {
        opt.dim_divisor = *args.dim_divisor;
    }
    if (!args.weights.empty()) {
        opt.weights.cost = args.weights[0];
        opt.weights.void_ratio = args.weights[1];
        opt.weights.dim = args.weights[2];
        opt.weights.count = args.weights[3];
    }
    if (!args.cost_basis.empty()) {
        opt.cost_basis = shippack::parse_cost_basis(args.cost_basis);
    }
    if (!args.ship_together.empty()) {
        opt.ship_together = shippack::parse_ship_together(args.ship_together);
    }
    if (args.no_envelopes) {
        opt.envelope_grouping = false;
    }
    if (args.max_rounds) {
        opt.max_rounds = *args.max_rounds;
    }
    if (args.log_every) {
        opt.log_every = *args.log_every;
        opt.envelope.verbose = opt.log_every > 0;
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        shippack::PackRequest req = shippack::load_request_file(args.input);
        apply_overrides(args, req.options);

        const shippack::ShipmentPlan plan = shippack::optimize_shipment(req.products, req.boxes, req.options);

        if (args.verify) {
            const auto problems = shippack::plan_violations(plan, req.products);
            if (!problems.empty()) {
                for (const auto& p : problems) {
                    std::cerr << "verify: " << p << "\n";
                }
                return 2;
            }
        }

        std::optional<shippack::Destination> dest = req.destination;
        if (!args.quote_country.empty()) {
            if (!dest) {
                dest = shippack::Destination{};
            }
            dest->country = args.quote_country;
        }

        if (!dest) {
            shippack::write_plan_json(std::cout, plan, args.pretty);
            return 0;
        }

        req.rates.verbose = req.rates.verbose || req.options.log_every > 0;
        shippack::RateTransport transport;
        if (req.rates.kind != shippack::RateProviderKind::kStaticTable && !req.rates.service.api_token.empty()) {
            transport = shippack::make_curl_transport(req.rates.service);
        }
        std::shared_ptr<const shippack::RateProvider> provider =
            shippack::make_rate_provider(req.rates, std::move(transport));
        auto pending = shippack::quote_plan_async(provider, plan, *dest);
        const std::vector<shippack::RateQuote> quotes = pending.get();
        shippack::write_plan_json(std::cout, plan, args.pretty, &quotes);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
