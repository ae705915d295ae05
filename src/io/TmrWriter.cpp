#include "io/TmrWriter.hpp"

#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace Methodical {

namespace {

// Full double precision so p-values near underflow survive a round trip
void write_value(std::ostream& os, const std::optional<double>& value) {
    if (value) {
        os << std::setprecision(std::numeric_limits<double>::max_digits10) << *value;
    } else {
        os << "NA";
    }
}

std::string safe_file_name(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        if (c == '/' || c == '\\' || c == ':' || c == ' ' || c == '\t') c = '_';
    }
    return out;
}

}  // namespace

TmrWriter::TmrWriter(const std::string& output_dir) : output_dir_(output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + output_dir_ + ": " + ec.message());
    }
}

std::ofstream TmrWriter::open_output(const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    return ofs;
}

std::string TmrWriter::write_cor_test(const CorrelationTable& table, const std::string& table1_name,
                                      const std::string& table2_name) {
    std::string path = output_dir_ + "/cor_test.tsv";
    std::ofstream ofs = open_output(path);

    ofs << table1_name << "\t" << table2_name << "\tcor\tp_val";
    if (table.has_q_values) ofs << "\tq_val";
    ofs << "\n";

    for (const auto& pair : table.pairs) {
        ofs << pair.feature1 << "\t" << pair.feature2 << "\t";
        write_value(ofs, pair.correlation);
        ofs << "\t";
        write_value(ofs, pair.p_value);
        if (table.has_q_values) {
            ofs << "\t";
            write_value(ofs, pair.q_value);
        }
        ofs << "\n";
    }

    if (!ofs) {
        throw std::runtime_error("Write error: " + path);
    }
    return path;
}

std::string TmrWriter::anchor_correlation_path(const Anchor& anchor) const {
    std::ostringstream oss;
    oss << output_dir_ << "/correlations/" << safe_file_name(anchor.name) << "_" << safe_file_name(anchor.coord.seqname)
        << "_" << anchor.coord.pos << ".tsv";
    return oss.str();
}

std::string TmrWriter::write_anchor_correlations(const AnchorCorrelations& correlations) {
    std::filesystem::create_directories(output_dir_ + "/correlations");
    std::string path = anchor_correlation_path(correlations.anchor);
    std::ofstream ofs = open_output(path);

    ofs << "#anchor=" << correlations.anchor.coord.to_string() << "\tfeature=" << correlations.anchor.name << "\n";
    ofs << "seqname\tposition\tcor\tp_val";
    if (correlations.has_q_values) ofs << "\tq_val";
    ofs << "\tdistance_to_anchor\n";

    for (const auto& record : correlations.records) {
        ofs << record.coord.seqname << "\t" << record.coord.pos << "\t";
        write_value(ofs, record.correlation);
        ofs << "\t";
        write_value(ofs, record.p_value);
        if (correlations.has_q_values) {
            ofs << "\t";
            write_value(ofs, record.q_value);
        }
        ofs << "\t" << record.distance_to_anchor << "\n";
    }

    if (!ofs) {
        throw std::runtime_error("Write error: " + path);
    }
    return path;
}

std::string TmrWriter::write_tmrs(const std::vector<Tmr>& tmrs) {
    std::string path = output_dir_ + "/tmrs.tsv";
    std::ofstream ofs = open_output(path);

    ofs << "seqname\tstart\tend\tdirection\tsite_count\tdistance_to_anchor\tanchor_location\tfeature"
        << "\tsignificant_sites\tmean_score\n";
    for (const auto& tmr : tmrs) {
        ofs << tmr.seqname << "\t" << tmr.start << "\t" << tmr.end << "\t" << direction_to_string(tmr.direction)
            << "\t" << tmr.site_count << "\t" << tmr.distance_to_anchor << "\t" << tmr.anchor.to_string() << "\t"
            << tmr.feature << "\t" << tmr.significant_sites << "\t" << std::fixed << std::setprecision(4)
            << tmr.mean_score << "\n";
        ofs.unsetf(std::ios_base::floatfield);
    }

    if (!ofs) {
        throw std::runtime_error("Write error: " + path);
    }
    return path;
}

std::string TmrWriter::write_anchor_summary(const std::vector<Anchor>& anchors,
                                            const std::vector<AnchorResult>& results) {
    if (anchors.size() != results.size()) {
        throw std::invalid_argument("write_anchor_summary: " + std::to_string(anchors.size()) + " anchors but " +
                                    std::to_string(results.size()) + " results");
    }

    std::string path = output_dir_ + "/anchor_summary.tsv";
    std::ofstream ofs = open_output(path);

    ofs << "anchor_id\tfeature\tanchor_location\tstatus\tnum_sites\tnum_samples\tnum_tmrs\telapsed_ms\tmessage\n";
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        ofs << anchors[i].anchor_id << "\t" << anchors[i].name << "\t" << anchors[i].coord.to_string() << "\t"
            << anchor_status_to_string(r.status) << "\t" << r.num_sites << "\t" << r.num_samples << "\t"
            << r.num_tmrs << "\t" << std::fixed << std::setprecision(2) << r.elapsed_ms << "\t"
            << (r.error_message.empty() ? "." : r.error_message) << "\n";
    }

    if (!ofs) {
        throw std::runtime_error("Write error: " + path);
    }
    return path;
}

}  // namespace Methodical
