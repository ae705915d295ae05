#include "core/MethylationMatrix.hpp"

#include <algorithm>
#include <stdexcept>

namespace Methodical {

void MethylationWindow::check_consistency() const {
    if (values.rows() != static_cast<Eigen::Index>(positions.size())) {
        throw std::runtime_error("MethylationWindow: " + std::to_string(values.rows()) + " value rows for " +
                                 std::to_string(positions.size()) + " positions");
    }
    if (values.cols() != static_cast<Eigen::Index>(sample_names.size())) {
        throw std::runtime_error("MethylationWindow: " + std::to_string(values.cols()) + " value columns for " +
                                 std::to_string(sample_names.size()) + " samples");
    }
    if (!std::is_sorted(positions.begin(), positions.end())) {
        throw std::runtime_error("MethylationWindow: positions on " + seqname + " are not sorted");
    }
}

} // namespace Methodical
