#pragma once

#include <vector>

namespace shippack {

// Non-negative; higher = more important.
struct ScoreWeights {
    double cost = 0.6;
    double void_ratio = 0.25;
    double dim = 0.1;
    double count = 0.05;
};

// Cost feature of a trial. Raw box cost makes a small box look cheapest every round,
// so with every unit packed exactly once the greedy loop ends up with many small
// boxes (four large boxes where one extra-large and one large would do). Dividing by
// the packed volume prices what the box actually carries and is the default.
enum class CostBasis {
    kPerPackedVolume = 0,  // box cost / packed volume
    kPerBox = 1,           // raw box cost
};

struct TrialFeatures {
    double cost = 0.0;
    double void_ratio = 0.0;
    double dim_weight = 0.0;
    double box_count = 1.0;
};

void validate_weights(const ScoreWeights& w);

// Chargeable weight: max(box volume / divisor, actual weight).
double dimensional_weight(double box_volume, double packed_weight, double divisor);

// (v - lo) / max(1e-9, hi - lo); all-equal inputs scale to 0.
double min_max_scale(double v, double lo, double hi);

// Min-max scales cost and dim_weight across `trials`, then returns
// w.cost*cost + w.void*void_ratio + w.dim*dim + w.count*box_count per trial. Lower wins.
std::vector<double> score_trials(const std::vector<TrialFeatures>& trials, const ScoreWeights& w);

// Index of the lowest score (earliest on ties), -1 when empty.
int best_trial(const std::vector<double>& scores);

}  // namespace shippack
