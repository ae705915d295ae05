#include <iostream>
#include <memory>

#include "core/AnchorProcessor.hpp"
#include "core/Config.hpp"
#include "core/CorrelationEngine.hpp"
#include "core/MethylationSource.hpp"
#include "io/AnchorTable.hpp"
#include "io/FeatureTable.hpp"
#include "io/TableReader.hpp"
#include "io/TmrWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

using namespace Methodical;

namespace {

int run_cor_test(const Config& config) {
    Utils::ScopedLogger scope("cor-test");

    LOG_INFO("[1] Loading tables...");
    LabeledMatrix table1 = read_labeled_matrix(config.table1_path);
    LabeledMatrix table2 = read_labeled_matrix(config.table2_path);
    LOG_INFO("table1: " + std::to_string(table1.num_rows()) + " samples x " + std::to_string(table1.num_cols()) +
             " features, table2: " + std::to_string(table2.num_rows()) + " samples x " +
             std::to_string(table2.num_cols()) + " features");
    if (table1.row_names != table2.row_names) {
        LOG_WARNING("Sample names of table1 and table2 differ; rows are paired by position");
    }

    LOG_INFO("[2] Correlating " + std::to_string(table1.num_cols() * static_cast<long>(table2.num_cols())) +
             " pairs...");
    CorrelationTable result = correlate_tables(table1, table2, config.correlation_config());

    TmrWriter writer(config.output_dir);
    std::string path = writer.write_cor_test(result, config.table1_name, config.table2_name);
    LOG_INFO("[3] Wrote " + std::to_string(result.size()) + " pairs to " + path);
    return 0;
}

int run_find_tmrs(const Config& config) {
    Utils::ScopedLogger scope("find-tmrs");

    LOG_INFO("[1] Loading inputs...");
    AnchorTable anchors = AnchorTable::load(config.anchors_path);
    FeatureTable features = FeatureTable::load(config.expression_path);
    if (anchors.empty()) {
        LOG_ERROR("No anchors loaded. Exiting.");
        return 1;
    }

    const std::string methylation_path = config.methylation_path;
    SourceFactory factory = [methylation_path]() -> std::unique_ptr<MethylationSource> {
        return std::make_unique<TabixMethylationReader>(methylation_path);
    };

    LOG_INFO("[2] Processing " + std::to_string(anchors.size()) + " anchors...");
    AnchorProcessor processor(config);
    auto results = processor.process_all(anchors.all(), features, factory);
    processor.print_summary(results);

    LOG_INFO("[3] Writing results...");
    TmrWriter writer(config.output_dir);
    std::vector<Tmr> tmrs = AnchorProcessor::collect_tmrs(results);
    writer.write_tmrs(tmrs);
    writer.write_anchor_summary(anchors.all(), results);
    if (config.write_correlations) {
        int written = 0;
        for (const auto& r : results) {
            if (r.status != AnchorStatus::OK) continue;
            writer.write_anchor_correlations(r.correlations);
            written++;
        }
        LOG_INFO("Wrote " + std::to_string(written) + " correlation tables to " + config.output_dir +
                 "/correlations");
    }

    LOG_INFO("Output directory: " + config.output_dir);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    Utils::ResourceMonitor monitor;

    Config config;
    try {
        if (!Utils::ArgParser::parse(argc, argv, config)) {
            return 1;  // Parse failed or help printed
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto& logger = Utils::Logger::instance();
    logger.set_log_level(config.log_level);

    int status = 0;
    try {
        if (!config.log_file.empty()) {
            logger.set_log_file(config.log_file);
        }

        if (!config.validate()) {
            LOG_ERROR("Configuration validation failed.");
            return 1;
        }
        config.print();

        status = config.command == Command::COR_TEST ? run_cor_test(config) : run_find_tmrs(config);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    long warnings = logger.count(LogLevel::LOG_WARN);
    long errors = logger.count(LogLevel::LOG_ERROR);
    if (warnings > 0 || errors > 0) {
        LOG_INFO("Finished with " + std::to_string(warnings) + " warnings and " + std::to_string(errors) +
                 " errors (see log above)");
    }
    LOG_INFO(monitor.format_stats("Total Execution"));
    return status;
}
