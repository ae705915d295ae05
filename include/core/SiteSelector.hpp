#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "DataStructs.hpp"

namespace Methodical {

/**
 * @brief A site selected inside an anchor window.
 */
struct WindowSite {
    int index;          ///< Row index in the indexed site list
    int64_t position;   ///< 1-based site position
    int64_t distance;   ///< Signed distance to the anchor, negative = upstream
};

/**
 * @brief Ordered site positions of one sequence.
 *
 * Answers strand-aware window queries around an anchor by binary search.
 */
class SiteIndex {
public:
    SiteIndex() = default;

    /**
     * @param seqname Sequence the positions belong to.
     * @param positions 1-based positions, sorted ascending.
     * @throws std::invalid_argument if positions are not sorted.
     */
    SiteIndex(std::string seqname, std::vector<int64_t> positions);

    const std::string& seqname() const { return seqname_; }
    const std::vector<int64_t>& positions() const { return positions_; }
    size_t size() const { return positions_.size(); }

    /**
     * @brief Sites within [upstream, downstream] of the anchor on its strand.
     *
     * For a minus-strand anchor upstream lies at higher coordinates. Sites are
     * returned in ascending coordinate order. An anchor on another sequence
     * yields an empty result.
     */
    std::vector<WindowSite> select_window(const Anchor& anchor, int64_t upstream, int64_t downstream) const;

private:
    std::string seqname_;
    std::vector<int64_t> positions_;
};

/**
 * @brief Genomic interval [start, end] covered by an anchor window, start clamped to 1.
 */
std::pair<int64_t, int64_t> genomic_range(const Anchor& anchor, int64_t upstream, int64_t downstream);

/**
 * @brief Signed distance of a site to the anchor, negative = upstream.
 */
int64_t signed_distance(const GenomicCoordinate& anchor, int64_t site_position);

} // namespace Methodical
