#include "shippack/plan_json.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include "shippack/packing_instructions.hpp"

namespace shippack {
namespace {

// Minimal streaming writer: tracks commas and indentation, nothing else.
class JsonOut {
public:
    JsonOut(std::ostream& out, bool pretty) : out_(out), pretty_(pretty) {}

    void begin_object() { open('{'); }
    void end_object() { close('}'); }
    void begin_array() { open('['); }
    void end_array() { close(']'); }

    void key(std::string_view k) {
        separate();
        out_ << '"' << json_escape(k) << "\":" << (pretty_ ? " " : "");
        after_key_ = true;
    }

    void value(std::string_view s) {
        separate();
        out_ << '"' << json_escape(s) << '"';
    }
    void value(const char* s) { value(std::string_view(s)); }
    void value(bool b) {
        separate();
        out_ << (b ? "true" : "false");
    }
    void value(int v) {
        separate();
        out_ << v;
    }
    void number(double v, int digits) {
        separate();
        if (!std::isfinite(v)) {
            out_ << "null";
            return;
        }
        double r = round_to(v, digits);
        if (r == 0.0) {
            r = 0.0;  // no "-0"
        }
        std::ostringstream oss;
        oss << std::setprecision(15) << r;
        out_ << oss.str();
    }
    void null() {
        separate();
        out_ << "null";
    }

    template <class T>
    void field(std::string_view k, const T& v) {
        key(k);
        value(v);
    }
    void field(std::string_view k, double v, int digits) {
        key(k);
        number(v, digits);
    }

private:
    void open(char c) {
        separate();
        out_ << c;
        first_.push_back(true);
    }
    void close(char c) {
        const bool empty = first_.back();
        first_.pop_back();
        if (!empty) {
            newline();
        }
        out_ << c;
    }
    void separate() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (first_.empty()) {
            return;
        }
        if (!first_.back()) {
            out_ << ',';
        }
        first_.back() = false;
        newline();
    }
    void newline() {
        if (pretty_) {
            out_ << '\n' << std::string(2 * first_.size(), ' ');
        }
    }

    std::ostream& out_;
    bool pretty_ = false;
    bool after_key_ = false;
    std::vector<bool> first_;
};

void write_dims(JsonOut& j, std::string_view k, double length, double width, double height) {
    j.key(k);
    j.begin_object();
    j.field("length", length, 2);
    j.field("width", width, 2);
    j.field("height", height, 2);
    j.end_object();
}

void write_shipment(JsonOut& j, const ShipmentPlan& plan, size_t index) {
    const BoxPacking& b = plan.boxes[index];
    j.begin_object();
    j.field("boxId", b.box.id);
    j.field("boxName", b.box.name.empty() ? b.box.id : b.box.name);
    j.field("custom", b.box.custom);
    j.field("cost", b.box.cost, 2);
    write_dims(j, "innerDims", b.box.inner.length, b.box.inner.width, b.box.inner.height);
    j.field("boxVolume", b.box_volume(), 2);
    j.field("usedVolume", b.used_volume, 2);
    j.field("fillPercent", b.fill_percent(), 2);
    j.field("voidRatio", b.void_ratio, 4);
    j.field("packedWeight", b.packed_weight, 2);
    j.field("dimChargeableWeight", b.dim_weight, 2);
    j.field("layers", b.layers);

    j.key("items");
    j.begin_array();
    for (const auto& p : b.placements) {
        const Item* it = (p.item >= 0 && p.item < static_cast<int>(plan.items.size()))
                             ? &plan.items[static_cast<size_t>(p.item)]
                             : nullptr;
        j.begin_object();
        j.field("id", p.id);
        if (it && !it->name.empty()) {
            j.field("name", it->name);
        }
        j.key("pos");
        j.begin_object();
        j.field("x", p.x, 2);
        j.field("y", p.y, 2);
        j.field("z", p.z, 2);
        j.end_object();
        write_dims(j, "dims", p.orient.length, p.orient.width, p.orient.height);
        if (it && !it->contents.empty()) {
            j.key("contents");
            j.begin_array();
            for (const auto& c : it->contents) {
                j.begin_object();
                j.field("id", c.id);
                j.field("units", c.units);
                j.end_object();
            }
            j.end_array();
        }
        j.end_object();
    }
    j.end_array();

    j.key("instructions");
    j.begin_array();
    for (const auto& line : packing_instructions(b, plan.items, static_cast<int>(index) + 1)) {
        j.value(line);
    }
    j.end_array();
    j.end_object();
}

void write_quote(JsonOut& j, const RateQuote& q) {
    j.begin_object();
    j.field("serviceCode", q.service_code);
    j.field("serviceName", q.service_name);
    j.field("currency", q.currency);
    j.field("total", q.total, 2);
    j.key("etaDays");
    if (q.eta_days >= 0) {
        j.value(q.eta_days);
    } else {
        j.null();
    }
    j.key("breakdown");
    j.begin_array();
    for (const auto& c : q.breakdown) {
        j.begin_object();
        j.field("boxId", c.box_id);
        j.field("weight", c.weight, 2);
        j.field("cost", c.cost, 2);
        j.end_object();
    }
    j.end_array();
    j.end_object();
}

}  // namespace

std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (const char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

double round_to(double v, int digits) {
    if (!std::isfinite(v)) {
        return v;
    }
    const double p = std::pow(10.0, digits);
    return std::round(v * p) / p;
}

void write_plan_json(std::ostream& out, const ShipmentPlan& plan, bool pretty, const std::vector<RateQuote>* quotes) {
    JsonOut j(out, pretty);
    const PlanSummary& s = plan.summary;

    j.begin_object();
    j.key("summary");
    j.begin_object();
    j.field("totalBoxes", s.total_boxes);
    j.field("totalCost", s.total_cost, 2);
    j.field("totalActualWeight", s.total_actual_weight, 2);
    j.field("totalChargeableWeight", s.total_chargeable_weight, 2);
    j.field("baselineCost", s.baseline_cost, 2);
    j.field("savings", s.savings, 2);
    j.field("averageFillPercent", s.average_fill_percent, 2);
    j.end_object();

    j.key("shipments");
    j.begin_array();
    for (size_t i = 0; i < plan.boxes.size(); ++i) {
        write_shipment(j, plan, i);
    }
    j.end_array();

    if (quotes != nullptr) {
        j.key("quotes");
        j.begin_array();
        for (const auto& q : *quotes) {
            write_quote(j, q);
        }
        j.end_array();
    }
    j.end_object();
    out << "\n";
}

}  // namespace shippack
