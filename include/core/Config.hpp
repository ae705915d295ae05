#pragma once

#include <cstdint>
#include <string>

#include "AnchorCorrelation.hpp"
#include "CorrelationEngine.hpp"
#include "TmrCaller.hpp"
#include "Types.hpp"

namespace Methodical {

/**
 * @brief Subcommand selected on the command line.
 */
enum class Command {
    FIND_TMRS,  ///< Anchor-windowed correlation and TMR calling
    COR_TEST    ///< All-pairs correlation of two tables
};

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Populated by Utils::ArgParser (basic checks by CLI11) and checked by
 * validate() for logical relationships and input file formats.
 */
struct Config {
    Command command = Command::FIND_TMRS;

    // find-tmrs inputs
    std::string methylation_path;  ///< bgzip + tabix methylation table (Required)
    std::string expression_path;   ///< Feature x Sample expression TSV (Required)
    std::string anchors_path;      ///< BED6 or anchor TSV (Required)

    // cor-test inputs
    std::string table1_path;                 ///< Samples x features TSV
    std::string table2_path;                 ///< Samples x features TSV
    std::string table1_name = "feature1";    ///< Column header for table1 feature names
    std::string table2_name = "feature2";    ///< Column header for table2 feature names

    std::string output_dir = "output";

    // Window
    int64_t expand_upstream = 5000;    ///< Default bp upstream of each anchor
    int64_t expand_downstream = 5000;  ///< Default bp downstream of each anchor

    // Correlation
    CorrelationMethod cor_method = CorrelationMethod::PEARSON;
    PAdjustMethod p_adjust_method = PAdjustMethod::NONE;  ///< cor-test defaults to BH on the command line
    int n_covariates = 0;

    // TMR calling
    double p_value_threshold = 0.005;
    bool smooth = true;
    int offset_length = 10;
    double smoothing_factor = 0.75;
    int min_meth_sites = 5;
    int64_t min_gapwidth = 150;

    bool write_correlations = false;  ///< Write correlations/<anchor>.tsv for every anchor
    int threads = 1;

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;
    std::string log_file;  ///< Optional log file (appended)

    /**
     * @brief Validates configuration logic and input files.
     *
     * Checks parameter ranges and tries to open the inputs of the selected command
     * with htslib (the methylation table must carry a tabix index).
     * Problems are logged with LOG_ERROR.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Logs the effective configuration.
     */
    void print() const;

    WindowParams window_params() const;
    CorrelationConfig correlation_config() const;
    TmrParams tmr_params() const;

    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace Methodical
