#include "core/MethylationSource.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <htslib/kstring.h>

#include "io/TableReader.hpp"

namespace Methodical {

// ==================================================
// InMemoryMethylationSource Implementation
// ==================================================

InMemoryMethylationSource::InMemoryMethylationSource(std::vector<std::string> sample_names)
    : sample_names_(std::move(sample_names)), sequences_(std::make_shared<std::map<std::string, MethylationWindow>>()) {}

void InMemoryMethylationSource::add_sequence(MethylationWindow window) {
    window.check_consistency();
    if (window.sample_names != sample_names_) {
        throw std::runtime_error("Samples of sequence " + window.seqname + " differ from the source samples");
    }
    if (sequences_->count(window.seqname)) {
        throw std::runtime_error("Sequence added twice: " + window.seqname);
    }
    std::string seqname = window.seqname;
    sequences_->emplace(std::move(seqname), std::move(window));
}

MethylationWindow InMemoryMethylationSource::fetch(const std::string& seqname, int64_t start, int64_t end) {
    MethylationWindow out;
    out.seqname = seqname;
    out.sample_names = sample_names_;
    out.values.resize(0, static_cast<Eigen::Index>(sample_names_.size()));

    auto it = sequences_->find(seqname);
    if (it == sequences_->end() || end < start) {
        return out;
    }

    const MethylationWindow& all = it->second;
    auto lo = std::lower_bound(all.positions.begin(), all.positions.end(), start);
    auto hi = std::upper_bound(all.positions.begin(), all.positions.end(), end);
    const Eigen::Index first = lo - all.positions.begin();
    const Eigen::Index count = hi - lo;

    out.positions.assign(lo, hi);
    out.values = all.values.middleRows(first, count);
    return out;
}

SourceFactory InMemoryMethylationSource::factory() const {
    InMemoryMethylationSource shared = *this;
    return [shared]() -> std::unique_ptr<MethylationSource> {
        return std::make_unique<InMemoryMethylationSource>(shared);
    };
}

// ==================================================
// TabixMethylationReader Implementation
// ==================================================

TabixMethylationReader::TabixMethylationReader(const std::string& path) : path_(path), fp_(nullptr), tbx_(nullptr) {
    fp_ = hts_open(path.c_str(), "r");
    if (!fp_) {
        throw std::runtime_error("Failed to open methylation file: " + path);
    }

    tbx_ = tbx_index_load(path.c_str());
    if (!tbx_) {
        hts_close(fp_);
        fp_ = nullptr;
        throw std::runtime_error("Failed to load tabix index (.tbi/.csi): " + path);
    }

    try {
        read_header();
    } catch (...) {
        tbx_destroy(tbx_);
        hts_close(fp_);
        tbx_ = nullptr;
        fp_ = nullptr;
        throw;
    }
}

TabixMethylationReader::~TabixMethylationReader() {
    if (tbx_) tbx_destroy(tbx_);
    if (fp_) hts_close(fp_);
}

TabixMethylationReader::TabixMethylationReader(TabixMethylationReader&& other) noexcept
    : path_(std::move(other.path_)),
      fp_(other.fp_),
      tbx_(other.tbx_),
      sample_names_(std::move(other.sample_names_)) {
    other.fp_ = nullptr;
    other.tbx_ = nullptr;
}

TabixMethylationReader& TabixMethylationReader::operator=(TabixMethylationReader&& other) noexcept {
    if (this != &other) {
        if (tbx_) tbx_destroy(tbx_);
        if (fp_) hts_close(fp_);

        path_ = std::move(other.path_);
        fp_ = other.fp_;
        tbx_ = other.tbx_;
        sample_names_ = std::move(other.sample_names_);

        other.fp_ = nullptr;
        other.tbx_ = nullptr;
    }
    return *this;
}

void TabixMethylationReader::read_header() {
    // The last meta line is the column header: #chr pos sample1 sample2 ...
    kstring_t str = {0, 0, nullptr};
    std::string header;
    while (hts_getline(fp_, '\n', &str) >= 0) {
        if (str.l == 0 || str.s[0] != tbx_->conf.meta_char) break;
        header.assign(str.s, str.l);
    }
    ks_free(&str);

    auto fields = split_tabs(header);
    if (header.empty() || fields.size() < 3) {
        throw std::runtime_error("Missing '#chr<TAB>pos<TAB>samples...' header in " + path_);
    }
    sample_names_.assign(fields.begin() + 2, fields.end());
}

MethylationWindow TabixMethylationReader::fetch(const std::string& seqname, int64_t start, int64_t end) {
    MethylationWindow out;
    out.seqname = seqname;
    out.sample_names = sample_names_;
    const size_t n_samples = sample_names_.size();

    if (!fp_ || !tbx_ || end < start) {
        out.values.resize(0, static_cast<Eigen::Index>(n_samples));
        return out;
    }

    int tid = tbx_name2id(tbx_, seqname.c_str());
    if (tid < 0) {
        out.values.resize(0, static_cast<Eigen::Index>(n_samples));
        return out;
    }

    // tabix intervals are 0-based half-open
    hts_itr_t* itr = tbx_itr_queryi(tbx_, tid, std::max<int64_t>(start - 1, 0), end);
    if (!itr) {
        throw std::runtime_error("Failed to query " + seqname + ":" + std::to_string(start) + "-" +
                                 std::to_string(end) + " in " + path_);
    }

    std::vector<double> flat;
    kstring_t str = {0, 0, nullptr};
    int ret;
    try {
        while ((ret = tbx_itr_next(fp_, tbx_, itr, &str)) >= 0) {
            auto fields = split_tabs(std::string(str.s, str.l));
            if (fields.size() != n_samples + 2) {
                throw std::runtime_error(path_ + ": record at " + seqname + " has " + std::to_string(fields.size()) +
                                         " fields, expected " + std::to_string(n_samples + 2));
            }
            char* pos_end = nullptr;
            long long pos = std::strtoll(fields[1].c_str(), &pos_end, 10);
            if (pos_end == fields[1].c_str() || *pos_end != '\0') {
                throw std::runtime_error(path_ + ": invalid position '" + fields[1] + "' on " + seqname);
            }
            if (pos < start || pos > end) continue;

            out.positions.push_back(pos);
            for (size_t s = 0; s < n_samples; ++s) {
                flat.push_back(parse_numeric_field(fields[s + 2]));
            }
        }
    } catch (...) {
        ks_free(&str);
        hts_itr_destroy(itr);
        throw;
    }
    ks_free(&str);
    hts_itr_destroy(itr);

    if (ret < -1) {
        throw std::runtime_error("Read error while querying " + seqname + " in " + path_);
    }

    out.values.resize(static_cast<Eigen::Index>(out.positions.size()), static_cast<Eigen::Index>(n_samples));
    for (size_t r = 0; r < out.positions.size(); ++r) {
        for (size_t s = 0; s < n_samples; ++s) {
            out.values(r, s) = flat[r * n_samples + s];
        }
    }
    out.check_consistency();
    return out;
}

std::vector<std::string> TabixMethylationReader::seqnames() const {
    std::vector<std::string> names;
    if (!tbx_) return names;
    int n = 0;
    const char** raw = tbx_seqnames(tbx_, &n);
    if (!raw) return names;
    for (int i = 0; i < n; ++i) {
        names.emplace_back(raw[i]);
    }
    free(raw);
    return names;
}

} // namespace Methodical
