#include "core/SiteSelector.hpp"

#include <algorithm>
#include <stdexcept>

namespace Methodical {

SiteIndex::SiteIndex(std::string seqname, std::vector<int64_t> positions)
    : seqname_(std::move(seqname)), positions_(std::move(positions)) {
    if (!std::is_sorted(positions_.begin(), positions_.end())) {
        throw std::invalid_argument("SiteIndex: positions on " + seqname_ + " must be sorted");
    }
}

std::pair<int64_t, int64_t> genomic_range(const Anchor& anchor, int64_t upstream, int64_t downstream) {
    int64_t start;
    int64_t end;
    if (anchor.coord.strand == Strand::REVERSE) {
        start = anchor.coord.pos - downstream;
        end = anchor.coord.pos + upstream;
    } else {
        start = anchor.coord.pos - upstream;
        end = anchor.coord.pos + downstream;
    }
    return {std::max<int64_t>(1, start), end};
}

int64_t signed_distance(const GenomicCoordinate& anchor, int64_t site_position) {
    if (anchor.strand == Strand::REVERSE) {
        return anchor.pos - site_position;
    }
    return site_position - anchor.pos;
}

std::vector<WindowSite> SiteIndex::select_window(const Anchor& anchor, int64_t upstream, int64_t downstream) const {
    std::vector<WindowSite> sites;
    if (anchor.coord.seqname != seqname_ || upstream < 0 || downstream < 0) {
        return sites;
    }

    auto range = genomic_range(anchor, upstream, downstream);
    auto first = std::lower_bound(positions_.begin(), positions_.end(), range.first);
    auto last = std::upper_bound(positions_.begin(), positions_.end(), range.second);

    sites.reserve(static_cast<size_t>(std::distance(first, last)));
    for (auto it = first; it != last; ++it) {
        WindowSite site;
        site.index = static_cast<int>(it - positions_.begin());
        site.position = *it;
        site.distance = signed_distance(anchor.coord, *it);
        sites.push_back(site);
    }
    return sites;
}

} // namespace Methodical
