#pragma once

#include <string>
#include <vector>

#include "core/DataStructs.hpp"

namespace Methodical {

/**
 * @brief Container for all loaded anchors.
 *
 * Two file layouts are accepted (plain or gzip):
 *  - BED6: chr, start (0-based), end, name, score, strand. The anchor is the
 *    5' end of the record: start + 1 on '+' (or unstranded), end on '-'.
 *    "track"/"browser"/'#' lines are skipped.
 *  - TSV with header "chr pos strand name [upstream downstream]", 1-based
 *    positions; the optional columns give per-anchor window extents.
 *
 * Files ending in ".bed" or ".bed.gz" are read as BED6, anything else as TSV.
 */
class AnchorTable {
public:
    /**
     * @brief Adds an anchor; its anchor_id is set to its index.
     * @return The assigned anchor ID.
     */
    int add_anchor(const Anchor& anchor);

    size_t size() const { return anchors_.size(); }
    bool empty() const { return anchors_.empty(); }
    const std::vector<Anchor>& all() const { return anchors_; }

    /**
     * @brief Loads anchors, picking the layout from the file name.
     * @throws std::runtime_error on I/O errors or malformed records.
     */
    static AnchorTable load(const std::string& path);

    static AnchorTable load_bed(const std::string& path);
    static AnchorTable load_tsv(const std::string& path);

private:
    std::vector<Anchor> anchors_;
};

} // namespace Methodical
