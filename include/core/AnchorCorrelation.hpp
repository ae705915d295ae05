#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "CorrelationEngine.hpp"
#include "DataStructs.hpp"
#include "MethylationMatrix.hpp"

namespace Methodical {

/**
 * @brief Window extents around an anchor, in bp.
 */
struct WindowParams {
    int64_t upstream = 5000;
    int64_t downstream = 5000;

    /**
     * @brief Extents for a given anchor: its own values where set, else these.
     */
    WindowParams for_anchor(const Anchor& anchor) const {
        WindowParams p = *this;
        if (anchor.upstream >= 0) p.upstream = anchor.upstream;
        if (anchor.downstream >= 0) p.downstream = anchor.downstream;
        return p;
    }
};

/**
 * @brief One scalar per sample for the anchor's feature (e.g. transcript expression).
 */
struct FeatureVector {
    std::string name;
    std::vector<std::string> sample_names;
    std::vector<double> values;  ///< NaN for missing
};

/**
 * @brief Site correlations for one anchor, ordered by position.
 *
 * The anchor travels with the records as provenance.
 */
struct AnchorCorrelations {
    Anchor anchor;
    std::vector<CorrelationRecord> records;
    int num_samples = 0;        ///< Samples shared by methylation and feature
    bool has_q_values = false;
};

/**
 * @brief Correlates every site in the anchor window with the anchor's feature.
 *
 * Samples are matched by name; the window's sites form table1 (one column
 * per site) and the feature forms a single-column table2.
 *
 * @param window Methylation values covering at least the anchor window.
 * @param feature Per-sample feature values.
 * @param anchor Anchor whose window is analysed.
 * @param params Default window extents (overridden per anchor).
 * @param config Correlation settings.
 *
 * @throws NoSitesInWindowError when no site falls inside the window.
 * @throws InsufficientSamplesError when fewer than 3 samples are shared.
 */
AnchorCorrelations compute_anchor_correlations(const MethylationWindow& window, const FeatureVector& feature,
                                               const Anchor& anchor, const WindowParams& params,
                                               const CorrelationConfig& config);

} // namespace Methodical
