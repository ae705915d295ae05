#pragma once

#include <CLI/CLI.hpp>
#include <string>

#include "core/Config.hpp"
#include "core/Statistics.hpp"
#include "utils/Logger.hpp"

namespace Methodical {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 *
 * Subcommands:
 *   methodical find-tmrs -m meth.tsv.gz -e expression.tsv -a anchors.bed [options]
 *   methodical cor-test --table1 a.tsv --table2 b.tsv [options]
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"Methodical - methylation sites whose level tracks transcript expression (TMRs)"};
        app.require_subcommand(1);

        std::string method_str = "pearson";
        std::string find_adjust_str = "none";
        std::string cor_adjust_str = "BH";
        std::string log_level_str = "info";

        const std::vector<std::string> methods = {"pearson", "spearman"};
        const std::vector<std::string> adjust_methods = {"holm", "hochberg", "hommel", "bonferroni",
                                                         "BH",   "BY",       "fdr",    "none"};
        const std::vector<std::string> log_levels = {"error", "warn", "warning", "info", "debug"};

        // Options shared by both subcommands
        auto add_common = [&](CLI::App* sub, std::string& adjust_str) {
            sub->add_option("-o,--output-dir", config.output_dir, "Output directory (Default: output)");
            sub->add_option("--method", method_str, "Correlation method: pearson, spearman (Default: pearson)")
                ->check(CLI::IsMember(methods, CLI::ignore_case));
            sub->add_option("--p-adjust", adjust_str,
                            "p-value adjustment: holm, hochberg, hommel, bonferroni, BH, BY, fdr, none (Default: " +
                                adjust_str + ")")
                ->check(CLI::IsMember(adjust_methods, CLI::ignore_case));
            sub->add_option("--n-covariates", config.n_covariates,
                            "Covariates subtracted from the degrees of freedom (Default: 0)")
                ->check(CLI::NonNegativeNumber);
            sub->add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
                ->check(CLI::PositiveNumber);
            sub->add_option("--log-level", log_level_str, "Logging level: error, warn, info, debug (Default: info)")
                ->check(CLI::IsMember(log_levels, CLI::ignore_case));
            sub->add_option("--log-file", config.log_file, "Also append log messages to this file");
        };

        // find-tmrs
        CLI::App* find = app.add_subcommand("find-tmrs", "Correlate sites around anchors with expression and call TMRs");
        find->add_option("-m,--methylation", config.methylation_path,
                         "bgzip-compressed, tabix-indexed methylation table (Required)")
            ->required()
            ->check(CLI::ExistingFile);
        find->add_option("-e,--expression", config.expression_path, "Feature x Sample expression table (Required)")
            ->required()
            ->check(CLI::ExistingFile);
        find->add_option("-a,--anchors", config.anchors_path, "Anchors as BED6 or TSV (Required)")
            ->required()
            ->check(CLI::ExistingFile);
        find->add_option("-u,--upstream", config.expand_upstream, "bp upstream of each anchor (Default: 5000)")
            ->check(CLI::NonNegativeNumber);
        find->add_option("-d,--downstream", config.expand_downstream, "bp downstream of each anchor (Default: 5000)")
            ->check(CLI::NonNegativeNumber);
        find->add_option("-p,--p-value-threshold", config.p_value_threshold,
                         "p-value defining significant sites (Default: 0.005)")
            ->check(CLI::Range(0.0, 1.0));
        find->add_flag("--smooth,!--no-smooth", config.smooth,
                       "Call TMRs on smoothed scores (Default: enabled)");
        find->add_option("--offset-length", config.offset_length, "Smoothing half-window in sites (Default: 10)")
            ->check(CLI::NonNegativeNumber);
        find->add_option("--smoothing-factor", config.smoothing_factor,
                         "Smoothing weight decay per site (Default: 0.75)")
            ->check(CLI::Range(0.0, 1.0));
        find->add_option("--min-meth-sites", config.min_meth_sites, "Minimum sites in a TMR (Default: 5)")
            ->check(CLI::PositiveNumber);
        find->add_option("--min-gapwidth", config.min_gapwidth,
                         "Merge same-direction TMRs at most this many bp apart (Default: 150)")
            ->check(CLI::NonNegativeNumber);
        find->add_flag("--write-correlations", config.write_correlations,
                       "Write correlations/<anchor>.tsv for every anchor");
        add_common(find, find_adjust_str);

        // cor-test
        CLI::App* cor = app.add_subcommand("cor-test", "Correlate every column of table1 with every column of table2");
        cor->add_option("--table1", config.table1_path, "Samples x features table (Required)")
            ->required()
            ->check(CLI::ExistingFile);
        cor->add_option("--table2", config.table2_path, "Samples x features table (Required)")
            ->required()
            ->check(CLI::ExistingFile);
        cor->add_option("--table1-name", config.table1_name, "Column header for table1 features (Default: feature1)");
        cor->add_option("--table2-name", config.table2_name, "Column header for table2 features (Default: feature2)");
        add_common(cor, cor_adjust_str);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // If help is requested (ret=0) or error occurs (ret>0), we print message and return false.
            app.exit(e);
            return false;
        }

        config.command = cor->parsed() ? Command::COR_TEST : Command::FIND_TMRS;
        config.cor_method = Stats::parse_correlation_method(method_str);
        config.p_adjust_method =
            Stats::parse_p_adjust_method(config.command == Command::COR_TEST ? cor_adjust_str : find_adjust_str);
        config.log_level = Logger::parse_log_level(log_level_str);

        return true;
    }
};

} // namespace Utils
} // namespace Methodical
