#include "core/Config.hpp"

#include <sstream>
#include <htslib/hts.h>
#include <htslib/tbx.h>

#include "core/Statistics.hpp"
#include "utils/Logger.hpp"

namespace Methodical {

namespace {

bool check_readable(const std::string& path, const std::string& label) {
    if (path.empty()) {
        LOG_ERROR(label + " path is required.");
        return false;
    }
    htsFile* fp = hts_open(path.c_str(), "r");
    if (fp == nullptr) {
        LOG_ERROR("Cannot open " + label + ": " + path);
        return false;
    }
    hts_close(fp);
    return true;
}

bool check_tabix(const std::string& path) {
    if (path.empty()) {
        LOG_ERROR("methylation table path is required.");
        return false;
    }
    htsFile* fp = hts_open(path.c_str(), "r");
    if (fp == nullptr) {
        LOG_ERROR("Cannot open methylation table: " + path);
        return false;
    }
    bool valid = true;
    const htsFormat* fmt = hts_get_format(fp);
    if (fmt->compression != bgzf) {
        LOG_ERROR("Methylation table must be bgzip-compressed: " + path);
        valid = false;
    }
    hts_close(fp);

    tbx_t* tbx = tbx_index_load(path.c_str());
    if (tbx == nullptr) {
        LOG_ERROR("Cannot load tabix index (.tbi/.csi) for methylation table: " + path);
        valid = false;
    } else {
        tbx_destroy(tbx);
    }
    return valid;
}

}  // namespace

bool Config::validate() const {
    bool valid = true;

    if (command == Command::FIND_TMRS) {
        valid &= check_tabix(methylation_path);
        valid &= check_readable(expression_path, "expression table");
        valid &= check_readable(anchors_path, "anchor file");

        if (expand_upstream < 0 || expand_downstream < 0) {
            LOG_ERROR("Upstream and downstream extents must be >= 0.");
            valid = false;
        }
        if (!(p_value_threshold > 0.0 && p_value_threshold <= 1.0)) {
            LOG_ERROR("p_value_threshold must be within (0, 1].");
            valid = false;
        }
        if (offset_length < 0) {
            LOG_ERROR("offset_length must be >= 0.");
            valid = false;
        }
        if (smoothing_factor < 0.0 || smoothing_factor > 1.0) {
            LOG_ERROR("smoothing_factor must be between 0.0 and 1.0.");
            valid = false;
        }
        if (min_meth_sites < 1) {
            LOG_ERROR("min_meth_sites must be >= 1.");
            valid = false;
        }
        if (min_gapwidth < 0) {
            LOG_ERROR("min_gapwidth must be >= 0.");
            valid = false;
        }
    } else {
        valid &= check_readable(table1_path, "table1");
        valid &= check_readable(table2_path, "table2");
        if (table1_name.empty() || table2_name.empty()) {
            LOG_ERROR("Table names must not be empty.");
            valid = false;
        }
    }

    if (n_covariates < 0) {
        LOG_ERROR("n_covariates must be >= 0.");
        valid = false;
    }
    if (threads < 1) {
        LOG_ERROR("threads must be >= 1.");
        valid = false;
    }

    return valid;
}

void Config::print() const {
    std::stringstream ss;
    ss << "--- Configuration ---\n";
    if (command == Command::FIND_TMRS) {
        ss << "Command: find-tmrs\n"
           << "Methylation: " << methylation_path << "\n"
           << "Expression: " << expression_path << "\n"
           << "Anchors: " << anchors_path << "\n"
           << "Window: -" << expand_upstream << " / +" << expand_downstream << " bp\n"
           << "p-value threshold: " << p_value_threshold << "\n"
           << "Smoothing: " << (smooth ? "on" : "off") << " (offset_length=" << offset_length
           << ", smoothing_factor=" << smoothing_factor << ")\n"
           << "Min sites: " << min_meth_sites << ", min gap width: " << min_gapwidth << " bp\n"
           << "Write correlations: " << (write_correlations ? "yes" : "no") << "\n";
    } else {
        ss << "Command: cor-test\n"
           << "Table1: " << table1_path << " (" << table1_name << ")\n"
           << "Table2: " << table2_path << " (" << table2_name << ")\n";
    }
    ss << "Correlation: " << Stats::correlation_method_to_string(cor_method) << ", covariates=" << n_covariates
       << ", p.adjust=" << Stats::p_adjust_method_to_string(p_adjust_method) << "\n"
       << "Output Dir: " << output_dir << "\n"
       << "Threads: " << threads << "\n"
       << "---------------------";
    LOG_INFO(ss.str());
}

WindowParams Config::window_params() const {
    WindowParams params;
    params.upstream = expand_upstream;
    params.downstream = expand_downstream;
    return params;
}

CorrelationConfig Config::correlation_config() const {
    CorrelationConfig cfg;
    cfg.method = cor_method;
    cfg.n_covariates = n_covariates;
    cfg.p_adjust = p_adjust_method;
    cfg.num_threads = threads;
    return cfg;
}

TmrParams Config::tmr_params() const {
    TmrParams params;
    params.p_value_threshold = p_value_threshold;
    params.smooth = smooth;
    params.offset_length = offset_length;
    params.smoothing_factor = smoothing_factor;
    params.min_meth_sites = min_meth_sites;
    params.min_gapwidth = min_gapwidth;
    return params;
}

} // namespace Methodical
