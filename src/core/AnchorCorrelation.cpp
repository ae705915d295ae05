#include "core/AnchorCorrelation.hpp"

#include <unordered_map>

#include "core/Errors.hpp"
#include "core/SiteSelector.hpp"

namespace Methodical {

namespace {

constexpr int kMinSharedSamples = 3;

}  // namespace

AnchorCorrelations compute_anchor_correlations(const MethylationWindow& window, const FeatureVector& feature,
                                               const Anchor& anchor, const WindowParams& params,
                                               const CorrelationConfig& config) {
    WindowParams extents = params.for_anchor(anchor);

    // 1. Sites inside the anchor window
    SiteIndex index(window.seqname, window.positions);
    std::vector<WindowSite> sites = index.select_window(anchor, extents.upstream, extents.downstream);
    if (sites.empty()) {
        throw NoSitesInWindowError("No methylation sites within " + std::to_string(extents.upstream) + " bp upstream/" +
                                   std::to_string(extents.downstream) + " bp downstream of " +
                                   anchor.coord.to_string());
    }

    // 2. Align samples by name, keeping methylation column order
    std::unordered_map<std::string, size_t> feature_index;
    for (size_t k = 0; k < feature.sample_names.size() && k < feature.values.size(); ++k) {
        feature_index.emplace(feature.sample_names[k], k);
    }

    std::vector<int> meth_cols;
    std::vector<double> feature_vals;
    std::vector<std::string> shared_samples;
    for (int j = 0; j < window.num_samples(); ++j) {
        auto it = feature_index.find(window.sample_names[j]);
        if (it == feature_index.end()) continue;
        meth_cols.push_back(j);
        feature_vals.push_back(feature.values[it->second]);
        shared_samples.push_back(window.sample_names[j]);
    }

    if (static_cast<int>(shared_samples.size()) < kMinSharedSamples) {
        throw InsufficientSamplesError("Only " + std::to_string(shared_samples.size()) +
                                       " samples shared between methylation data and feature " + feature.name);
    }

    // 3. Build table1 (samples x sites) and table2 (samples x 1)
    const int n_samples = static_cast<int>(shared_samples.size());
    const int n_sites = static_cast<int>(sites.size());

    LabeledMatrix site_table;
    site_table.row_names = shared_samples;
    site_table.col_names.reserve(n_sites);
    site_table.values.resize(n_samples, n_sites);
    for (int s = 0; s < n_sites; ++s) {
        site_table.col_names.push_back(window.seqname + ":" + std::to_string(sites[s].position));
        for (int r = 0; r < n_samples; ++r) {
            site_table.values(r, s) = window.values(sites[s].index, meth_cols[r]);
        }
    }

    LabeledMatrix feature_table;
    feature_table.row_names = shared_samples;
    feature_table.col_names = {feature.name};
    feature_table.values.resize(n_samples, 1);
    for (int r = 0; r < n_samples; ++r) {
        feature_table.values(r, 0) = feature_vals[r];
    }

    // 4. Correlate and attach coordinates
    CorrelationTable table = CorrelationEngine(config).compute(site_table, feature_table);

    AnchorCorrelations result;
    result.anchor = anchor;
    result.num_samples = n_samples;
    result.has_q_values = table.has_q_values;
    result.records.reserve(n_sites);
    for (int s = 0; s < n_sites; ++s) {
        const CorrelationPair& pair = table.at(s, 0);

        CorrelationRecord record;
        record.coord.seqname = window.seqname;
        record.coord.pos = sites[s].position;
        record.coord.strand = Strand::UNKNOWN;
        record.correlation = pair.correlation;
        record.p_value = pair.p_value;
        record.q_value = pair.q_value;
        record.distance_to_anchor = sites[s].distance;
        result.records.push_back(record);
    }

    return result;
}

} // namespace Methodical
