#include "io/AnchorTable.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include "io/TableReader.hpp"
#include "utils/Logger.hpp"

namespace Methodical {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int64_t parse_coordinate(const std::string& field, const std::string& path, int line) {
    char* end = nullptr;
    long long value = std::strtoll(field.c_str(), &end, 10);
    if (field.empty() || *end != '\0') {
        throw std::runtime_error(path + ":" + std::to_string(line) + ": invalid coordinate '" + field + "'");
    }
    return value;
}

Strand parse_strand(const std::string& field, const std::string& path, int line) {
    if (field == "+" || field == "-" || field == "." || field == "*") {
        return strand_from_char(field[0]);
    }
    throw std::runtime_error(path + ":" + std::to_string(line) + ": invalid strand '" + field + "'");
}

int find_column(const std::vector<std::string>& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    return it == header.end() ? -1 : static_cast<int>(it - header.begin());
}

}  // namespace

int AnchorTable::add_anchor(const Anchor& anchor) {
    int id = static_cast<int>(anchors_.size());
    Anchor copy = anchor;
    copy.anchor_id = id;
    anchors_.push_back(copy);
    return id;
}

AnchorTable AnchorTable::load(const std::string& path) {
    if (ends_with(path, ".bed") || ends_with(path, ".bed.gz")) {
        return load_bed(path);
    }
    return load_tsv(path);
}

AnchorTable AnchorTable::load_bed(const std::string& path) {
    TextLineReader reader(path);
    AnchorTable table;
    std::string line;
    int unstranded = 0;

    while (reader.next(line)) {
        if (line.empty() || line[0] == '#' || line.rfind("track", 0) == 0 || line.rfind("browser", 0) == 0) {
            continue;
        }
        auto fields = split_tabs(line);
        if (fields.size() < 6) {
            throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) +
                                     ": BED6 record needs 6 fields, found " + std::to_string(fields.size()));
        }

        Anchor anchor;
        anchor.name = fields[3];
        anchor.coord.seqname = fields[0];
        const long long start = parse_coordinate(fields[1], path, reader.line_number());
        const long long end = parse_coordinate(fields[2], path, reader.line_number());
        if (start < 0 || end <= start) {
            throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) + ": invalid interval " +
                                     fields[1] + "-" + fields[2]);
        }
        anchor.coord.strand = parse_strand(fields[5], path, reader.line_number());
        // 5' end of the record in 1-based coordinates
        anchor.coord.pos = anchor.coord.strand == Strand::REVERSE ? end : start + 1;
        if (anchor.coord.strand == Strand::UNKNOWN) unstranded++;
        table.add_anchor(anchor);
    }

    if (unstranded > 0) {
        LOG_WARNING(std::to_string(unstranded) + " unstranded anchors in " + path + " are windowed as '+'");
    }
    LOG_INFO("Loaded " + std::to_string(table.size()) + " anchors from BED: " + path);
    return table;
}

AnchorTable AnchorTable::load_tsv(const std::string& path) {
    TextLineReader reader(path);
    AnchorTable table;
    std::string line;

    std::vector<std::string> header;
    while (reader.next(line)) {
        if (line.empty()) continue;
        header = split_tabs(line);
        break;
    }

    const int col_chr = find_column(header, "chr");
    const int col_pos = find_column(header, "pos");
    const int col_strand = find_column(header, "strand");
    const int col_name = find_column(header, "name");
    const int col_up = find_column(header, "upstream");
    const int col_down = find_column(header, "downstream");
    if (col_chr < 0 || col_pos < 0 || col_strand < 0 || col_name < 0) {
        throw std::runtime_error("Anchor table " + path + " needs header columns chr, pos, strand and name");
    }

    while (reader.next(line)) {
        if (line.empty() || line[0] == '#') continue;
        auto fields = split_tabs(line);
        if (fields.size() != header.size()) {
            throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) + ": expected " +
                                     std::to_string(header.size()) + " fields, found " +
                                     std::to_string(fields.size()));
        }

        Anchor anchor;
        anchor.name = fields[col_name];
        anchor.coord.seqname = fields[col_chr];
        anchor.coord.pos = parse_coordinate(fields[col_pos], path, reader.line_number());
        anchor.coord.strand = parse_strand(fields[col_strand], path, reader.line_number());
        if (col_up >= 0) anchor.upstream = parse_coordinate(fields[col_up], path, reader.line_number());
        if (col_down >= 0) anchor.downstream = parse_coordinate(fields[col_down], path, reader.line_number());
        if (anchor.coord.pos < 1) {
            throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) + ": positions are 1-based");
        }
        if ((col_up >= 0 && anchor.upstream < 0) || (col_down >= 0 && anchor.downstream < 0)) {
            throw std::runtime_error(path + ":" + std::to_string(reader.line_number()) +
                                     ": window extents must be >= 0");
        }
        table.add_anchor(anchor);
    }

    LOG_INFO("Loaded " + std::to_string(table.size()) + " anchors from TSV: " + path);
    return table;
}

} // namespace Methodical
