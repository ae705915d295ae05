#include "core/TmrCaller.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Methodical {

namespace {

struct Candidate {
    TmrDirection direction;
    size_t first;  ///< Index of the first member site
    size_t last;   ///< Index of the last member site
};

/**
 * @brief +1 positive-significant, -1 negative-significant, 0 otherwise.
 */
int classify(const std::optional<double>& score, double threshold) {
    if (!score || std::isnan(*score)) return 0;
    if (*score >= threshold) return 1;
    if (*score <= -threshold) return -1;
    return 0;
}

}  // namespace

double score_threshold(double p_value_threshold) {
    if (!(p_value_threshold > 0.0 && p_value_threshold <= 1.0)) {
        throw std::invalid_argument("p_value_threshold must be within (0, 1], got " +
                                    std::to_string(p_value_threshold));
    }
    return -std::log10(p_value_threshold);
}

std::vector<Tmr> call_tmrs(const ScoreSeries& series, const TmrParams& params) {
    const double threshold = score_threshold(params.p_value_threshold);
    if (params.min_gapwidth < 0) {
        throw std::invalid_argument("min_gapwidth must be >= 0");
    }

    std::vector<Tmr> tmrs;
    const size_t n = series.sites.size();
    if (n == 0) {
        return tmrs;
    }

    // 1. Scores to threshold
    std::vector<std::optional<double>> scores(n);
    for (size_t i = 0; i < n; ++i) {
        scores[i] = series.sites[i].raw_score;
    }
    if (params.smooth) {
        scores = smooth_scores(scores, params.offset_length, params.smoothing_factor);
    }

    std::vector<int> sig(n);
    for (size_t i = 0; i < n; ++i) {
        sig[i] = classify(scores[i], threshold);
    }

    // 2. Maximal runs of same-direction significant sites
    std::vector<Candidate> candidates;
    size_t i = 0;
    while (i < n) {
        if (sig[i] == 0) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j + 1 < n && sig[j + 1] == sig[i]) ++j;
        candidates.push_back({sig[i] > 0 ? TmrDirection::POSITIVE : TmrDirection::NEGATIVE, i, j});
        i = j + 1;
    }

    // 3. Merge same-direction candidates separated by <= min_gapwidth bp (chained).
    //    Each direction is merged on its own, so an opposite-direction
    //    candidate lying in the gap does not prevent the merge.
    std::vector<Candidate> merged;
    for (TmrDirection direction : {TmrDirection::POSITIVE, TmrDirection::NEGATIVE}) {
        const size_t first_of_direction = merged.size();
        for (const auto& cand : candidates) {
            if (cand.direction != direction) continue;
            if (merged.size() > first_of_direction) {
                Candidate& prev = merged.back();
                int64_t gap = series.sites[cand.first].coord.pos - series.sites[prev.last].coord.pos;
                if (gap <= params.min_gapwidth) {
                    prev.last = cand.last;
                    continue;
                }
            }
            merged.push_back(cand);
        }
    }
    std::sort(merged.begin(), merged.end(),
              [](const Candidate& a, const Candidate& b) { return a.first < b.first; });

    // 4./5. Summarise and filter by site count
    for (const auto& region : merged) {
        Tmr tmr;
        tmr.seqname = series.sites[region.first].coord.seqname;
        tmr.start = series.sites[region.first].coord.pos;
        tmr.end = series.sites[region.last].coord.pos;
        tmr.direction = region.direction;
        tmr.anchor = series.anchor;
        tmr.feature = series.feature;

        int site_count = 0;
        for (const auto& site : series.sites) {
            if (site.coord.pos >= tmr.start && site.coord.pos <= tmr.end) ++site_count;
        }
        tmr.site_count = site_count;

        const int wanted = region.direction == TmrDirection::POSITIVE ? 1 : -1;
        bool have_distance = false;
        double score_sum = 0.0;
        for (size_t k = region.first; k <= region.last; ++k) {
            if (sig[k] != wanted) continue;
            int64_t d = series.sites[k].distance_to_anchor;
            if (!have_distance) {
                tmr.distance_to_anchor = d;
                have_distance = true;
            } else if (region.direction == TmrDirection::NEGATIVE) {
                tmr.distance_to_anchor = std::min(tmr.distance_to_anchor, d);
            } else {
                tmr.distance_to_anchor = std::max(tmr.distance_to_anchor, d);
            }
            score_sum += *scores[k];
            tmr.significant_sites++;
        }
        tmr.mean_score = tmr.significant_sites > 0 ? score_sum / tmr.significant_sites : 0.0;

        if (tmr.site_count >= params.min_meth_sites) {
            tmrs.push_back(tmr);
        }
    }

    return tmrs;
}

} // namespace Methodical
