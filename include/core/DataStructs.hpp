#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Types.hpp"

namespace Methodical {

/**
 * @brief A single genomic coordinate.
 */
struct GenomicCoordinate {
    std::string seqname;             ///< Sequence (chromosome) name
    int64_t pos = 0;                 ///< 1-based position
    Strand strand = Strand::UNKNOWN; ///< Strand orientation

    /**
     * @brief Formats as "chr:pos:strand", used as the anchor location column.
     */
    std::string to_string() const {
        return seqname + ":" + std::to_string(pos) + ":" + strand_to_string(strand);
    }
};

/**
 * @brief Reference point (e.g. a TSS) around which sites are analysed.
 */
struct Anchor {
    int anchor_id = -1;          ///< Index in the anchor table
    std::string name;            ///< Feature (transcript) identifier
    GenomicCoordinate coord;     ///< TSS location with strand
    int64_t upstream = -1;       ///< Per-anchor upstream extent (bp), -1 = use default
    int64_t downstream = -1;     ///< Per-anchor downstream extent (bp), -1 = use default
};

/**
 * @brief Correlation of one site with the anchor's feature.
 *
 * Missing statistics are empty optionals; they are never coerced to zero.
 */
struct CorrelationRecord {
    GenomicCoordinate coord;
    std::optional<double> correlation;
    std::optional<double> p_value;
    std::optional<double> q_value;
    int64_t distance_to_anchor = 0;  ///< Negative = upstream on the anchor strand
};

/**
 * @brief One row of the flat correlation-engine output.
 */
struct CorrelationPair {
    std::string feature1;
    std::string feature2;
    int n_obs = 0;  ///< Complete paired observations
    std::optional<double> correlation;
    std::optional<double> p_value;
    std::optional<double> q_value;
};

/**
 * @brief Score of one site in a ScoreSeries.
 */
struct ScoredSite {
    GenomicCoordinate coord;
    int64_t distance_to_anchor = 0;
    std::optional<double> raw_score;
    std::optional<double> smoothed_score;
};

/**
 * @brief A called TMR.
 */
struct Tmr {
    std::string seqname;
    int64_t start = 0;              ///< Position of the first member site
    int64_t end = 0;                ///< Position of the last member site
    TmrDirection direction = TmrDirection::NEGATIVE;
    int site_count = 0;             ///< Sites of the series inside [start, end]
    int significant_sites = 0;      ///< Member sites breaching the threshold
    int64_t distance_to_anchor = 0; ///< Min (negative) or max (positive) member distance
    double mean_score = 0.0;        ///< Mean score of significant member sites
    GenomicCoordinate anchor;       ///< Anchor the region was called for
    std::string feature;            ///< Anchor feature name
};

}  // namespace Methodical
