#include "io/FeatureTable.hpp"

#include <stdexcept>

#include "io/TableReader.hpp"
#include "utils/Logger.hpp"

namespace Methodical {

FeatureTable::FeatureTable(LabeledMatrix matrix) : matrix_(std::move(matrix)) {
    for (size_t i = 0; i < matrix_.row_names.size(); ++i) {
        if (!index_.emplace(matrix_.row_names[i], static_cast<int>(i)).second) {
            throw std::runtime_error("Duplicate feature id: " + matrix_.row_names[i]);
        }
    }
}

FeatureTable FeatureTable::load(const std::string& path) {
    FeatureTable table(read_labeled_matrix(path));
    LOG_INFO("Loaded " + std::to_string(table.size()) + " features x " +
             std::to_string(table.sample_names().size()) + " samples from " + path);
    return table;
}

std::optional<FeatureVector> FeatureTable::get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    FeatureVector feature;
    feature.name = name;
    feature.sample_names = matrix_.col_names;
    feature.values.resize(matrix_.col_names.size());
    for (int c = 0; c < matrix_.num_cols(); ++c) {
        feature.values[c] = matrix_.values(it->second, c);
    }
    return feature;
}

} // namespace Methodical
