#include "core/Statistics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>

#include "core/Errors.hpp"

namespace Methodical {
namespace Stats {

namespace {

constexpr double kPi = 3.14159265358979323846;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

/**
 * @brief Indices of the defined p-values sorted by value (stable).
 */
std::vector<size_t> order_defined(const std::vector<std::optional<double>>& p, bool decreasing) {
    std::vector<size_t> idx;
    idx.reserve(p.size());
    for (size_t i = 0; i < p.size(); ++i) {
        if (p[i].has_value()) idx.push_back(i);
    }
    std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        return decreasing ? *p[a] > *p[b] : *p[a] < *p[b];
    });
    return idx;
}

std::vector<double> hommel_sorted(const std::vector<double>& p) {
    // p is sorted ascending, n >= 3
    const size_t n = p.size();
    double init = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < n; ++i) {
        init = std::min(init, static_cast<double>(n) * p[i] / static_cast<double>(i + 1));
    }
    std::vector<double> q(n, init);
    std::vector<double> pa(n, init);

    for (size_t m = n - 1; m >= 2; --m) {
        double q1 = std::numeric_limits<double>::infinity();
        for (size_t k = 0; k + 1 < m; ++k) {
            q1 = std::min(q1, static_cast<double>(m) * p[n - m + 1 + k] / static_cast<double>(k + 2));
        }
        for (size_t i = 0; i <= n - m; ++i) {
            q[i] = std::min(static_cast<double>(m) * p[i], q1);
        }
        for (size_t i = n - m + 1; i < n; ++i) {
            q[i] = q[n - m];
        }
        for (size_t i = 0; i < n; ++i) {
            pa[i] = std::max(pa[i], q[i]);
        }
    }

    for (size_t i = 0; i < n; ++i) {
        pa[i] = std::max(pa[i], p[i]);
    }
    return pa;
}

}  // namespace

// ============================================================================
// Special functions
// ============================================================================

double log_gamma(double x) {
    static constexpr double LANCZOS_G = 7.0;
    static constexpr double LANCZOS_COEFF[9] = {
        0.99999999999980993,  676.5203681218851,     -1259.1392167224028,
        771.32342877765313,   -176.61502916214059,   12.507343278686905,
        -0.13857109526572012, 9.9843695780195716e-6, 1.5056327351493116e-7};

    if (x < 0.5) {
        // Reflection formula
        return std::log(kPi / std::abs(std::sin(kPi * x))) - log_gamma(1.0 - x);
    }

    x -= 1.0;
    double a = LANCZOS_COEFF[0];
    for (int i = 1; i < 9; ++i) {
        a += LANCZOS_COEFF[i] / (x + i);
    }

    double t = x + LANCZOS_G + 0.5;
    return 0.5 * std::log(2.0 * kPi) + (x + 0.5) * std::log(t) - t + std::log(a);
}

double beta_inc(double a, double b, double x) {
    if (std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    // I_x(a,b) = 1 - I_{1-x}(b,a), pick the side where the fraction converges fast
    bool flip = x > (a + 1.0) / (a + b + 2.0);
    if (flip) {
        std::swap(a, b);
        x = 1.0 - x;
    }

    constexpr double TINY = 1e-300;
    constexpr double EPS = 1e-15;
    constexpr int MAX_ITER = 10000;

    double qab = a + b;
    double qap = a + 1.0;
    double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < TINY) d = TINY;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= MAX_ITER; ++m) {
        int m2 = 2 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < TINY) d = TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < TINY) d = TINY;
        c = 1.0 + aa / c;
        if (std::abs(c) < TINY) c = TINY;
        d = 1.0 / d;
        double del = d * c;
        h *= del;

        if (std::abs(del - 1.0) < EPS) break;
    }

    double front = std::exp(log_gamma(a + b) - log_gamma(a) - log_gamma(b) + a * std::log(x) +
                            b * std::log1p(-x));

    double result = front * h / a;
    result = flip ? 1.0 - result : result;
    return std::min(1.0, std::max(0.0, result));
}

std::optional<double> student_t_two_sided_p(double t, double df) {
    if (!(df > 0.0) || std::isnan(t)) {
        return std::nullopt;
    }
    if (std::isinf(t)) {
        return 0.0;
    }
    // 2·P(T > |t|) = I_{df/(df+t²)}(df/2, 1/2)
    double x = df / (df + t * t);
    return beta_inc(0.5 * df, 0.5, x);
}

// ============================================================================
// Correlation helpers
// ============================================================================

std::vector<double> average_ranks(const std::vector<double>& values) {
    const size_t n = values.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(n);
    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n && values[order[j]] == values[order[i]]) ++j;
        double avg_rank = 0.5 * (static_cast<double>(i + 1) + static_cast<double>(j));
        for (size_t k = i; k < j; ++k) {
            ranks[order[k]] = avg_rank;
        }
        i = j;
    }
    return ranks;
}

std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = x.size();
    if (n != y.size() || n < 2) {
        return std::nullopt;
    }

    double mean_x = std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(n);
    double mean_y = std::accumulate(y.begin(), y.end(), 0.0) / static_cast<double>(n);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t k = 0; k < n; ++k) {
        double dx = x[k] - mean_x;
        double dy = y[k] - mean_y;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (!(sxx > 0.0) || !(syy > 0.0)) {
        return std::nullopt;
    }

    double r = sxy / std::sqrt(sxx * syy);
    return std::max(-1.0, std::min(1.0, r));
}

// ============================================================================
// Multiple testing
// ============================================================================

std::vector<std::optional<double>> p_adjust(const std::vector<std::optional<double>>& p_values,
                                            PAdjustMethod method) {
    std::vector<std::optional<double>> adjusted = p_values;
    if (method == PAdjustMethod::NONE) {
        return adjusted;
    }

    size_t n = 0;
    for (const auto& p : p_values) {
        if (p.has_value()) ++n;
    }
    if (n <= 1) {
        return adjusted;
    }
    if (n == 2 && method == PAdjustMethod::HOMMEL) {
        method = PAdjustMethod::HOCHBERG;
    }

    const double n_real = static_cast<double>(n);

    switch (method) {
        case PAdjustMethod::BONFERRONI: {
            for (auto& p : adjusted) {
                if (p) p = std::min(1.0, *p * n_real);
            }
            break;
        }
        case PAdjustMethod::HOLM: {
            // Step-down: cumulative max of (n - rank + 1)·p in ascending order
            auto order = order_defined(p_values, false);
            double running_max = 0.0;
            for (size_t rank = 0; rank < order.size(); ++rank) {
                double value = static_cast<double>(n - rank) * *p_values[order[rank]];
                running_max = std::max(running_max, value);
                adjusted[order[rank]] = std::min(1.0, running_max);
            }
            break;
        }
        case PAdjustMethod::HOCHBERG:
        case PAdjustMethod::BH:
        case PAdjustMethod::BY: {
            // Step-up: cumulative min in descending order, i runs n..1
            double c_n = 1.0;
            if (method == PAdjustMethod::BY) {
                c_n = 0.0;
                for (size_t k = 1; k <= n; ++k) c_n += 1.0 / static_cast<double>(k);
            }
            auto order = order_defined(p_values, true);
            double running_min = std::numeric_limits<double>::infinity();
            for (size_t pos = 0; pos < order.size(); ++pos) {
                double i = static_cast<double>(n - pos);
                double p = *p_values[order[pos]];
                double value = method == PAdjustMethod::HOCHBERG ? (n_real - i + 1.0) * p : c_n * n_real / i * p;
                running_min = std::min(running_min, value);
                adjusted[order[pos]] = std::min(1.0, running_min);
            }
            break;
        }
        case PAdjustMethod::HOMMEL: {
            auto order = order_defined(p_values, false);
            std::vector<double> sorted(order.size());
            for (size_t k = 0; k < order.size(); ++k) sorted[k] = *p_values[order[k]];
            auto result = hommel_sorted(sorted);
            for (size_t k = 0; k < order.size(); ++k) adjusted[order[k]] = std::min(1.0, result[k]);
            break;
        }
        default:
            break;
    }

    return adjusted;
}

// ============================================================================
// Method names
// ============================================================================

CorrelationMethod parse_correlation_method(const std::string& name) {
    std::string lower = to_lower(name);
    if (!lower.empty()) {
        if (std::string("pearson").compare(0, lower.size(), lower) == 0) return CorrelationMethod::PEARSON;
        if (std::string("spearman").compare(0, lower.size(), lower) == 0) return CorrelationMethod::SPEARMAN;
    }
    throw InvalidMethodError("Unknown correlation method '" + name + "' (expected pearson or spearman)");
}

PAdjustMethod parse_p_adjust_method(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "none") return PAdjustMethod::NONE;
    if (lower == "holm") return PAdjustMethod::HOLM;
    if (lower == "hochberg") return PAdjustMethod::HOCHBERG;
    if (lower == "hommel") return PAdjustMethod::HOMMEL;
    if (lower == "bonferroni") return PAdjustMethod::BONFERRONI;
    if (lower == "bh" || lower == "fdr") return PAdjustMethod::BH;
    if (lower == "by") return PAdjustMethod::BY;
    throw InvalidMethodError("Unknown p-value adjustment method '" + name +
                             "' (expected holm, hochberg, hommel, bonferroni, BH, BY, fdr or none)");
}

std::string correlation_method_to_string(CorrelationMethod method) {
    return method == CorrelationMethod::SPEARMAN ? "spearman" : "pearson";
}

std::string p_adjust_method_to_string(PAdjustMethod method) {
    switch (method) {
        case PAdjustMethod::NONE: return "none";
        case PAdjustMethod::HOLM: return "holm";
        case PAdjustMethod::HOCHBERG: return "hochberg";
        case PAdjustMethod::HOMMEL: return "hommel";
        case PAdjustMethod::BONFERRONI: return "bonferroni";
        case PAdjustMethod::BH: return "BH";
        case PAdjustMethod::BY: return "BY";
        default: return "unknown";
    }
}

} // namespace Stats
} // namespace Methodical
