#include "shippack/scoring.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace shippack {

void validate_weights(const ScoreWeights& w) {
    for (const double v : {w.cost, w.void_ratio, w.dim, w.count}) {
        if (!std::isfinite(v) || v < 0.0) {
            throw std::invalid_argument("validate_weights: score weights must be finite and >= 0");
        }
    }
}

double dimensional_weight(double box_volume, double packed_weight, double divisor) {
    if (!(divisor > 0.0)) {
        throw std::invalid_argument("dimensional_weight: divisor must be > 0");
    }
    return std::max(box_volume / divisor, packed_weight);
}

double min_max_scale(double v, double lo, double hi) {
    return (v - lo) / std::max(1e-9, hi - lo);
}

std::vector<double> score_trials(const std::vector<TrialFeatures>& trials, const ScoreWeights& w) {
    std::vector<double> scores;
    if (trials.empty()) {
        return scores;
    }

    double min_cost = std::numeric_limits<double>::infinity();
    double max_cost = -std::numeric_limits<double>::infinity();
    double min_dim = std::numeric_limits<double>::infinity();
    double max_dim = -std::numeric_limits<double>::infinity();
    for (const auto& t : trials) {
        min_cost = std::min(min_cost, t.cost);
        max_cost = std::max(max_cost, t.cost);
        min_dim = std::min(min_dim, t.dim_weight);
        max_dim = std::max(max_dim, t.dim_weight);
    }

    scores.reserve(trials.size());
    for (const auto& t : trials) {
        const double c = min_max_scale(t.cost, min_cost, max_cost);
        const double d = min_max_scale(t.dim_weight, min_dim, max_dim);
        scores.push_back(w.cost * c + w.void_ratio * t.void_ratio + w.dim * d + w.count * t.box_count);
    }
    return scores;
}

int best_trial(const std::vector<double>& scores) {
    int best = -1;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (best < 0 || scores[i] < scores[static_cast<size_t>(best)]) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

}  // namespace shippack
