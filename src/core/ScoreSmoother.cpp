#include "core/ScoreSmoother.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace Methodical {

const double kMaxScore = -std::log10(std::numeric_limits<double>::denorm_min());

std::optional<double> methodical_score(const std::optional<double>& correlation, const std::optional<double>& p_value) {
    if (!correlation || !p_value || std::isnan(*correlation) || std::isnan(*p_value)) {
        return std::nullopt;
    }

    double r = *correlation;
    double sign = (r > 0.0) ? 1.0 : ((r < 0.0) ? -1.0 : 0.0);
    if (sign == 0.0) {
        return 0.0;
    }

    double p = std::min(1.0, std::max(0.0, *p_value));
    double magnitude = (p > 0.0) ? -std::log10(p) : kMaxScore;
    return sign * std::min(magnitude, kMaxScore);
}

std::vector<std::optional<double>> compute_scores(const std::vector<CorrelationRecord>& records) {
    std::vector<std::optional<double>> scores;
    scores.reserve(records.size());
    for (const auto& record : records) {
        scores.push_back(methodical_score(record.correlation, record.p_value));
    }
    return scores;
}

std::vector<std::optional<double>> smooth_scores(const std::vector<std::optional<double>>& raw_scores,
                                                 int offset_length, double smoothing_factor) {
    if (offset_length < 0) {
        throw std::invalid_argument("offset_length must be >= 0, got " + std::to_string(offset_length));
    }
    if (!(smoothing_factor >= 0.0 && smoothing_factor <= 1.0)) {
        throw std::invalid_argument("smoothing_factor must be within [0, 1], got " + std::to_string(smoothing_factor));
    }

    const int n = static_cast<int>(raw_scores.size());

    // weights[d] = smoothing_factor^d; pow(0, 0) == 1 keeps the centre site
    std::vector<double> weights(static_cast<size_t>(offset_length) + 1);
    for (int d = 0; d <= offset_length; ++d) {
        weights[d] = std::pow(smoothing_factor, d);
    }

    std::vector<std::optional<double>> smoothed(raw_scores.size());
    for (int i = 0; i < n; ++i) {
        int lo = std::max(0, i - offset_length);
        int hi = std::min(n - 1, i + offset_length);

        double num = 0.0;
        double den = 0.0;
        bool any = false;
        for (int j = lo; j <= hi; ++j) {
            if (!raw_scores[j]) continue;
            any = true;
            double w = weights[std::abs(i - j)];
            num += w * *raw_scores[j];
            den += w;
        }

        if (any && den > 0.0) {
            smoothed[i] = num / den;
        }
    }
    return smoothed;
}

ScoreSeries build_score_series(const AnchorCorrelations& correlations, int offset_length, double smoothing_factor) {
    ScoreSeries series;
    series.anchor = correlations.anchor.coord;
    series.feature = correlations.anchor.name;

    auto raw = compute_scores(correlations.records);
    auto smoothed = smooth_scores(raw, offset_length, smoothing_factor);

    series.sites.reserve(correlations.records.size());
    for (size_t k = 0; k < correlations.records.size(); ++k) {
        ScoredSite site;
        site.coord = correlations.records[k].coord;
        site.distance_to_anchor = correlations.records[k].distance_to_anchor;
        site.raw_score = raw[k];
        site.smoothed_score = smoothed[k];
        series.sites.push_back(site);
    }
    return series;
}

} // namespace Methodical
