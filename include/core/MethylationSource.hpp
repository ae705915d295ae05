#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <htslib/hts.h>
#include <htslib/tbx.h>

#include "MethylationMatrix.hpp"

namespace Methodical {

/**
 * @brief Windowed read access to a Sites x Samples methylation store.
 *
 * fetch() may use per-instance file state, so an instance must not be used
 * by two threads at once; open one per thread instead (see SourceFactory).
 */
class MethylationSource {
public:
    virtual ~MethylationSource() = default;

    /**
     * @brief Sample names in column order.
     */
    virtual const std::vector<std::string>& sample_names() const = 0;

    /**
     * @brief Sites of one sequence with start <= position <= end (1-based).
     *
     * @return Window ordered by position; empty if the sequence is unknown.
     */
    virtual MethylationWindow fetch(const std::string& seqname, int64_t start, int64_t end) = 0;
};

/**
 * @brief Creates one MethylationSource per worker thread.
 */
using SourceFactory = std::function<std::unique_ptr<MethylationSource>()>;

/**
 * @brief Methylation data held in memory, one window per sequence.
 *
 * Copies share the underlying data read-only, so a factory can hand out
 * cheap copies to every thread.
 */
class InMemoryMethylationSource : public MethylationSource {
public:
    explicit InMemoryMethylationSource(std::vector<std::string> sample_names);

    /**
     * @brief Adds all sites of one sequence.
     *
     * @throws std::runtime_error if the window is inconsistent, its samples
     * differ from this source's samples or the sequence was already added.
     */
    void add_sequence(MethylationWindow window);

    const std::vector<std::string>& sample_names() const override { return sample_names_; }

    MethylationWindow fetch(const std::string& seqname, int64_t start, int64_t end) override;

    /**
     * @brief Factory handing out copies that share this source's data.
     */
    SourceFactory factory() const;

private:
    std::vector<std::string> sample_names_;
    std::shared_ptr<std::map<std::string, MethylationWindow>> sequences_;
};

/**
 * @brief RAII reader for a bgzip-compressed, tabix-indexed methylation table.
 *
 * Layout (tabix -s1 -b2 -e2 -c '#'):
 *   #chr   pos     sample1 sample2 ...
 *   chr1   10468   0.81    NA      ...
 *
 * Missing values are "NA", "." or empty. Each thread should own its reader.
 *
 * Usage:
 *   TabixMethylationReader reader("meth.tsv.gz");
 *   MethylationWindow w = reader.fetch("chr1", 10000, 20000);
 */
class TabixMethylationReader : public MethylationSource {
public:
    /**
     * @param path Path to the .gz table (index expected at path + ".tbi" or ".csi").
     * @throws std::runtime_error if the file, index or header cannot be read.
     */
    explicit TabixMethylationReader(const std::string& path);

    ~TabixMethylationReader() override;

    TabixMethylationReader(const TabixMethylationReader&) = delete;
    TabixMethylationReader& operator=(const TabixMethylationReader&) = delete;
    TabixMethylationReader(TabixMethylationReader&&) noexcept;
    TabixMethylationReader& operator=(TabixMethylationReader&&) noexcept;

    const std::vector<std::string>& sample_names() const override { return sample_names_; }

    /**
     * @throws std::runtime_error on malformed records or read errors.
     */
    MethylationWindow fetch(const std::string& seqname, int64_t start, int64_t end) override;

    /**
     * @brief Sequence names present in the index.
     */
    std::vector<std::string> seqnames() const;

    const std::string& get_path() const { return path_; }

private:
    std::string path_;
    htsFile* fp_;
    tbx_t* tbx_;
    std::vector<std::string> sample_names_;

    void read_header();
};

} // namespace Methodical
