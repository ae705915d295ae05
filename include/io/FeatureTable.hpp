#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/AnchorCorrelation.hpp"
#include "core/MethylationMatrix.hpp"

namespace Methodical {

/**
 * @brief Per-sample feature values (e.g. transcript expression), one row per feature.
 *
 * File layout:
 *   feature_id  sample1  sample2 ...
 *   ENST0001    12.3     NA      ...
 */
class FeatureTable {
public:
    FeatureTable() = default;
    explicit FeatureTable(LabeledMatrix matrix);

    /**
     * @brief Loads a TSV (plain or gzip) feature table.
     * @throws std::runtime_error on I/O or parse errors, or duplicate feature ids.
     */
    static FeatureTable load(const std::string& path);

    /**
     * @brief Values of one feature, or empty if the feature is unknown.
     */
    std::optional<FeatureVector> get(const std::string& name) const;

    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    size_t size() const { return matrix_.row_names.size(); }
    const std::vector<std::string>& sample_names() const { return matrix_.col_names; }
    const std::vector<std::string>& feature_names() const { return matrix_.row_names; }

private:
    LabeledMatrix matrix_;
    std::unordered_map<std::string, int> index_;
};

} // namespace Methodical
