#pragma once

#include <cstdint>
#include <string>

namespace Methodical {

/**
 * @brief Correlation coefficient used by the correlation engine.
 */
enum class CorrelationMethod {
    PEARSON,
    SPEARMAN
};

/**
 * @brief Multiple-testing adjustment applied to a flattened set of p-values.
 *
 * Mirrors the methods accepted by R's p.adjust.
 */
enum class PAdjustMethod {
    NONE,
    HOLM,
    HOCHBERG,
    HOMMEL,
    BONFERRONI,
    BH,  ///< Benjamini-Hochberg (alias "fdr")
    BY   ///< Benjamini-Yekutieli
};

/**
 * @brief Strand of an anchor or site.
 *
 * UNKNOWN ('*') is treated like FORWARD for windowing.
 */
enum class Strand : uint8_t {
    FORWARD = 0,  ///< Forward strand (+)
    REVERSE = 1,  ///< Reverse strand (-)
    UNKNOWN = 2   ///< Unstranded (*)
};

/**
 * @brief Direction of a called TMR.
 *
 * NEGATIVE: methylation anti-correlates with expression (score <= -T).
 * POSITIVE: methylation correlates with expression (score >= +T).
 */
enum class TmrDirection : uint8_t {
    NEGATIVE = 0,
    POSITIVE = 1
};

/**
 * @brief Outcome of processing a single anchor.
 */
enum class AnchorStatus : uint8_t {
    OK = 0,
    NO_SITES_IN_WINDOW,
    INSUFFICIENT_SAMPLES,
    MISSING_FEATURE,  ///< Anchor feature absent from the expression table
    FAILED            ///< Unexpected error (I/O, malformed window)
};

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Per-anchor detail
};

inline std::string strand_to_string(Strand s) {
    switch (s) {
        case Strand::FORWARD: return "+";
        case Strand::REVERSE: return "-";
        default: return "*";
    }
}

inline Strand strand_from_char(char c) {
    if (c == '+') return Strand::FORWARD;
    if (c == '-') return Strand::REVERSE;
    return Strand::UNKNOWN;
}

inline std::string direction_to_string(TmrDirection d) {
    return d == TmrDirection::POSITIVE ? "Positive" : "Negative";
}

inline std::string anchor_status_to_string(AnchorStatus status) {
    switch (status) {
        case AnchorStatus::OK: return "OK";
        case AnchorStatus::NO_SITES_IN_WINDOW: return "NO_SITES_IN_WINDOW";
        case AnchorStatus::INSUFFICIENT_SAMPLES: return "INSUFFICIENT_SAMPLES";
        case AnchorStatus::MISSING_FEATURE: return "MISSING_FEATURE";
        case AnchorStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace Methodical
