#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "core/Config.hpp"
#include "utils/ArgParser.hpp"

using namespace Methodical;

// Helper to create dummy files
void create_dummy_file(const std::string& path) {
    std::ofstream ofs(path);
    ofs << "dummy content";
    ofs.close();
}

TEST(ConfigTest, ValidationFailureMissingFiles) {
    Config config;
    // Missing paths are required, so validate should fail
    EXPECT_FALSE(config.validate());

    config.command = Command::COR_TEST;
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, ValidationRequiresIndexedMethylation) {
    create_dummy_file("meth.tsv");
    create_dummy_file("expr.tsv");
    create_dummy_file("anchors.bed");

    Config config;
    config.methylation_path = "meth.tsv";
    config.expression_path = "expr.tsv";
    config.anchors_path = "anchors.bed";

    // Plain text without a tabix index is rejected
    EXPECT_FALSE(config.validate());

    std::remove("meth.tsv");
    std::remove("expr.tsv");
    std::remove("anchors.bed");
}

TEST(ConfigTest, CorTestValidation) {
    create_dummy_file("t1.tsv");
    create_dummy_file("t2.tsv");

    Config config;
    config.command = Command::COR_TEST;
    config.table1_path = "t1.tsv";
    config.table2_path = "t2.tsv";
    EXPECT_TRUE(config.validate());

    config.table2_name = "";
    EXPECT_FALSE(config.validate());

    config.table2_name = "gene";
    config.threads = 0;
    EXPECT_FALSE(config.validate());

    config.threads = 2;
    config.n_covariates = -1;
    EXPECT_FALSE(config.validate());

    std::remove("t1.tsv");
    std::remove("t2.tsv");
}

TEST(ConfigTest, ValidationFailureInvalidTmrParameters) {
    Config config;

    config.p_value_threshold = 0.0;
    EXPECT_FALSE(config.validate());

    config.p_value_threshold = 0.005;
    config.smoothing_factor = 1.5;
    EXPECT_FALSE(config.validate());

    config.smoothing_factor = 0.75;
    config.min_gapwidth = -1;
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, DerivedParameters) {
    Config config;
    config.expand_upstream = 2000;
    config.expand_downstream = 300;
    config.cor_method = CorrelationMethod::SPEARMAN;
    config.p_adjust_method = PAdjustMethod::HOLM;
    config.n_covariates = 2;
    config.p_value_threshold = 0.01;
    config.smooth = false;
    config.min_meth_sites = 3;

    WindowParams window = config.window_params();
    EXPECT_EQ(window.upstream, 2000);
    EXPECT_EQ(window.downstream, 300);

    CorrelationConfig cor = config.correlation_config();
    EXPECT_EQ(cor.method, CorrelationMethod::SPEARMAN);
    EXPECT_EQ(cor.p_adjust, PAdjustMethod::HOLM);
    EXPECT_EQ(cor.n_covariates, 2);

    TmrParams tmr = config.tmr_params();
    EXPECT_DOUBLE_EQ(tmr.p_value_threshold, 0.01);
    EXPECT_FALSE(tmr.smooth);
    EXPECT_EQ(tmr.min_meth_sites, 3);
    EXPECT_EQ(tmr.min_gapwidth, 150);
}

TEST(ArgParserTest, ParseFindTmrsShortOptions) {
    Config config;
    // Create dummy files BEFORE parsing because CLI11::ExistingFile checks for them!
    create_dummy_file("m.tsv.gz");
    create_dummy_file("e.tsv");
    create_dummy_file("a.bed");

    const char* argv[] = {"program", "find-tmrs", "-m", "m.tsv.gz", "-e", "e.tsv", "-a", "a.bed",
                          "-u",      "2000",      "-d", "500",      "-p", "0.01", "-j", "4"};
    int argc = 16;

    bool result = Utils::ArgParser::parse(argc, const_cast<char**>(argv), config);

    EXPECT_TRUE(result);
    EXPECT_EQ(config.command, Command::FIND_TMRS);
    EXPECT_EQ(config.methylation_path, "m.tsv.gz");
    EXPECT_EQ(config.expression_path, "e.tsv");
    EXPECT_EQ(config.anchors_path, "a.bed");
    EXPECT_EQ(config.expand_upstream, 2000);
    EXPECT_EQ(config.expand_downstream, 500);
    EXPECT_DOUBLE_EQ(config.p_value_threshold, 0.01);
    EXPECT_EQ(config.threads, 4);
    EXPECT_TRUE(config.smooth);
    EXPECT_EQ(config.p_adjust_method, PAdjustMethod::NONE);

    std::remove("m.tsv.gz");
    std::remove("e.tsv");
    std::remove("a.bed");
}

TEST(ArgParserTest, ParseFindTmrsLongOptions) {
    Config config;
    create_dummy_file("long_m.tsv.gz");
    create_dummy_file("long_e.tsv");
    create_dummy_file("long_a.tsv");

    const char* argv[] = {"program",
                          "find-tmrs",
                          "--methylation",
                          "long_m.tsv.gz",
                          "--expression",
                          "long_e.tsv",
                          "--anchors",
                          "long_a.tsv",
                          "--no-smooth",
                          "--offset-length",
                          "5",
                          "--smoothing-factor",
                          "0.5",
                          "--min-meth-sites",
                          "3",
                          "--min-gapwidth",
                          "200",
                          "--method",
                          "spearman",
                          "--p-adjust",
                          "bonferroni",
                          "--n-covariates",
                          "2",
                          "--write-correlations",
                          "--log-level",
                          "debug",
                          "--output-dir",
                          "out_dir"};
    int argc = 28;

    bool result = Utils::ArgParser::parse(argc, const_cast<char**>(argv), config);

    EXPECT_TRUE(result);
    EXPECT_FALSE(config.smooth);
    EXPECT_EQ(config.offset_length, 5);
    EXPECT_DOUBLE_EQ(config.smoothing_factor, 0.5);
    EXPECT_EQ(config.min_meth_sites, 3);
    EXPECT_EQ(config.min_gapwidth, 200);
    EXPECT_EQ(config.cor_method, CorrelationMethod::SPEARMAN);
    EXPECT_EQ(config.p_adjust_method, PAdjustMethod::BONFERRONI);
    EXPECT_EQ(config.n_covariates, 2);
    EXPECT_TRUE(config.write_correlations);
    EXPECT_EQ(config.log_level, LogLevel::LOG_DEBUG);
    EXPECT_EQ(config.output_dir, "out_dir");

    std::remove("long_m.tsv.gz");
    std::remove("long_e.tsv");
    std::remove("long_a.tsv");
}

TEST(ArgParserTest, ParseCorTestDefaultsToBH) {
    Config config;
    create_dummy_file("cor1.tsv");
    create_dummy_file("cor2.tsv");

    const char* argv[] = {"program", "cor-test", "--table1", "cor1.tsv", "--table2", "cor2.tsv", "--table1-name",
                          "cpg"};
    int argc = 8;

    bool result = Utils::ArgParser::parse(argc, const_cast<char**>(argv), config);

    EXPECT_TRUE(result);
    EXPECT_EQ(config.command, Command::COR_TEST);
    EXPECT_EQ(config.table1_path, "cor1.tsv");
    EXPECT_EQ(config.table2_path, "cor2.tsv");
    EXPECT_EQ(config.table1_name, "cpg");
    EXPECT_EQ(config.table2_name, "feature2");
    EXPECT_EQ(config.p_adjust_method, PAdjustMethod::BH);
    EXPECT_EQ(config.cor_method, CorrelationMethod::PEARSON);

    std::remove("cor1.tsv");
    std::remove("cor2.tsv");
}

TEST(ArgParserTest, RejectsInvalidArguments) {
    create_dummy_file("bad1.tsv");
    create_dummy_file("bad2.tsv");

    {
        Config config;
        const char* argv[] = {"program", "cor-test", "--table1", "bad1.tsv", "--table2", "bad2.tsv", "--method",
                              "kendall"};
        EXPECT_FALSE(Utils::ArgParser::parse(8, const_cast<char**>(argv), config));
    }
    {
        // Missing required file
        Config config;
        const char* argv[] = {"program", "cor-test", "--table1", "bad1.tsv", "--table2", "no_such_file.tsv"};
        EXPECT_FALSE(Utils::ArgParser::parse(6, const_cast<char**>(argv), config));
    }
    {
        // A subcommand is required
        Config config;
        const char* argv[] = {"program"};
        EXPECT_FALSE(Utils::ArgParser::parse(1, const_cast<char**>(argv), config));
    }

    std::remove("bad1.tsv");
    std::remove("bad2.tsv");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(Utils::Logger::parse_log_level("error"), LogLevel::LOG_ERROR);
    EXPECT_EQ(Utils::Logger::parse_log_level("WARN"), LogLevel::LOG_WARN);
    EXPECT_EQ(Utils::Logger::parse_log_level("warning"), LogLevel::LOG_WARN);
    EXPECT_EQ(Utils::Logger::parse_log_level("Info"), LogLevel::LOG_INFO);
    EXPECT_EQ(Utils::Logger::parse_log_level("debug"), LogLevel::LOG_DEBUG);
    EXPECT_THROW(Utils::Logger::parse_log_level("verbose"), std::invalid_argument);
}

TEST(LoggerTest, ContextNestsPerThread) {
    EXPECT_TRUE(Utils::LogContext::current().empty());
    {
        Utils::LogContext outer("ENST0001 chr1:1500:+");
        EXPECT_EQ(Utils::LogContext::current(), "ENST0001 chr1:1500:+");
        {
            Utils::LogContext inner("fetch");
            EXPECT_EQ(Utils::LogContext::current(), "fetch");
        }
        EXPECT_EQ(Utils::LogContext::current(), "ENST0001 chr1:1500:+");
    }
    EXPECT_TRUE(Utils::LogContext::current().empty());
}

TEST(LoggerTest, CountsOnlyWrittenMessages) {
    auto& logger = Utils::Logger::instance();
    LogLevel saved = logger.get_log_level();
    logger.set_log_level(LogLevel::LOG_WARN);
    logger.reset_counts();

    EXPECT_TRUE(logger.enabled(LogLevel::LOG_ERROR));
    EXPECT_FALSE(logger.enabled(LogLevel::LOG_INFO));

    LOG_WARNING("expected warning from LoggerTest");
    LOG_INFO("suppressed");
    LOG_DEBUG("suppressed");
    EXPECT_EQ(logger.count(LogLevel::LOG_WARN), 1);
    EXPECT_EQ(logger.count(LogLevel::LOG_INFO), 0);
    EXPECT_EQ(logger.count(LogLevel::LOG_DEBUG), 0);

    logger.set_log_level(saved);
}
