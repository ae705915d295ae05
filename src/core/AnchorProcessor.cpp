#include "core/AnchorProcessor.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "core/Errors.hpp"
#include "core/SiteSelector.hpp"
#include "core/Statistics.hpp"
#include "utils/Logger.hpp"

namespace Methodical {

AnchorProcessor::AnchorProcessor(const WindowParams& window, const CorrelationConfig& correlation,
                                 const TmrParams& tmr, int num_threads, bool keep_correlations)
    : window_(window),
      correlation_(correlation),
      tmr_(tmr),
      num_threads_(std::max(1, num_threads)),
      keep_correlations_(keep_correlations) {
    // Anchors are the unit of parallelism; each anchor's table is small
    correlation_.num_threads = 1;
}

AnchorProcessor::AnchorProcessor(const Config& config)
    : AnchorProcessor(config.window_params(), config.correlation_config(), config.tmr_params(), config.threads,
                      config.write_correlations) {
    std::stringstream ss;
    ss << "AnchorProcessor initialized:\n"
       << "  Threads: " << num_threads_ << "\n"
       << "  Window: -" << window_.upstream << " / +" << window_.downstream << " bp\n"
       << "  Correlation: " << Stats::correlation_method_to_string(correlation_.method)
       << " (p.adjust=" << Stats::p_adjust_method_to_string(correlation_.p_adjust) << ")\n"
       << "  Score threshold: " << std::setprecision(4) << score_threshold(tmr_.p_value_threshold);
    LOG_INFO(ss.str());
}

std::vector<AnchorResult> AnchorProcessor::process_all(const std::vector<Anchor>& anchors,
                                                       const FeatureTable& features,
                                                       const SourceFactory& factory) const {
    const int num_anchors = static_cast<int>(anchors.size());
    std::vector<AnchorResult> results(num_anchors);

    // Open one source per thread up front: exceptions must not leave the parallel region
    const int num_workers = std::max(1, std::min(num_threads_, num_anchors));
    std::vector<std::unique_ptr<MethylationSource>> sources;
    sources.reserve(num_workers);
    for (int t = 0; t < num_workers; ++t) {
        sources.push_back(factory());
    }

    LOG_INFO("Starting processing of " + std::to_string(num_anchors) + " anchors with " +
             std::to_string(num_workers) + " threads...");
    auto t_start = std::chrono::high_resolution_clock::now();

#pragma omp parallel num_threads(num_workers)
    {
#ifdef _OPENMP
        MethylationSource& source = *sources[omp_get_thread_num()];
#else
        MethylationSource& source = *sources[0];
#endif

#pragma omp for schedule(dynamic)
        for (int i = 0; i < num_anchors; i++) {
            const Anchor& anchor = anchors[i];
            Utils::LogContext context(anchor.name + " " + anchor.coord.to_string());
            results[i] = process_single_anchor(anchor, features, source);
            const AnchorResult& r = results[i];

            if (r.status == AnchorStatus::FAILED) {
                LOG_ERROR("failed: " + r.error_message);
            } else if (Utils::Logger::instance().enabled(LogLevel::LOG_DEBUG)) {
                std::stringstream ss;
                if (r.status == AnchorStatus::OK) {
                    ss << r.num_sites << " sites, " << r.num_samples << " samples, " << r.num_tmrs << " TMRs, "
                       << std::fixed << std::setprecision(1) << r.elapsed_ms << " ms";
                } else {
                    ss << "skipped (" << anchor_status_to_string(r.status) << "): " << r.error_message;
                }
                LOG_DEBUG(ss.str());
            }
        }
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    double total_elapsed = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    LOG_INFO("All anchors processed in " + std::to_string(total_elapsed) + " ms");

    return results;
}

AnchorResult AnchorProcessor::process_single_anchor(const Anchor& anchor, const FeatureTable& features,
                                                    MethylationSource& source) const {
    AnchorResult result;
    result.anchor_id = anchor.anchor_id;
    auto t_start = std::chrono::high_resolution_clock::now();

    try {
        auto feature = features.get(anchor.name);
        if (!feature) {
            result.status = AnchorStatus::MISSING_FEATURE;
            result.error_message = "feature " + anchor.name + " not in expression table";
        } else {
            WindowParams params = window_.for_anchor(anchor);
            auto range = genomic_range(anchor, params.upstream, params.downstream);
            MethylationWindow window = source.fetch(anchor.coord.seqname, range.first, range.second);

            AnchorCorrelations correlations =
                compute_anchor_correlations(window, *feature, anchor, window_, correlation_);
            ScoreSeries series = build_score_series(correlations, tmr_.offset_length, tmr_.smoothing_factor);

            result.tmrs = call_tmrs(series, tmr_);
            result.num_sites = static_cast<int>(correlations.records.size());
            result.num_samples = correlations.num_samples;
            result.num_tmrs = static_cast<int>(result.tmrs.size());
            if (keep_correlations_) {
                result.correlations = std::move(correlations);
            }
            result.status = AnchorStatus::OK;
        }
    } catch (const NoSitesInWindowError& e) {
        result.status = AnchorStatus::NO_SITES_IN_WINDOW;
        result.error_message = e.what();
    } catch (const InsufficientSamplesError& e) {
        result.status = AnchorStatus::INSUFFICIENT_SAMPLES;
        result.error_message = e.what();
    } catch (const std::exception& e) {
        result.status = AnchorStatus::FAILED;
        result.error_message = e.what();
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    return result;
}

std::vector<Tmr> AnchorProcessor::collect_tmrs(const std::vector<AnchorResult>& results) {
    std::vector<Tmr> all;
    for (const auto& r : results) {
        if (r.status != AnchorStatus::OK) continue;
        all.insert(all.end(), r.tmrs.begin(), r.tmrs.end());
    }
    return all;
}

void AnchorProcessor::print_summary(const std::vector<AnchorResult>& results) const {
    int ok = 0;
    int no_sites = 0;
    int few_samples = 0;
    int missing_feature = 0;
    int failed = 0;
    int total_sites = 0;
    int total_positive = 0;
    int total_negative = 0;
    double total_time = 0.0;

    for (const auto& r : results) {
        total_time += r.elapsed_ms;
        switch (r.status) {
            case AnchorStatus::OK:
                ok++;
                total_sites += r.num_sites;
                for (const auto& tmr : r.tmrs) {
                    if (tmr.direction == TmrDirection::POSITIVE) {
                        total_positive++;
                    } else {
                        total_negative++;
                    }
                }
                break;
            case AnchorStatus::NO_SITES_IN_WINDOW: no_sites++; break;
            case AnchorStatus::INSUFFICIENT_SAMPLES: few_samples++; break;
            case AnchorStatus::MISSING_FEATURE: missing_feature++; break;
            default: failed++; break;
        }
    }

    std::stringstream ss;
    ss << "\n=== Processing Summary ===\n"
       << "Total anchors: " << results.size() << "\n"
       << "Successful: " << ok << "\n"
       << "No sites in window: " << no_sites << "\n"
       << "Insufficient samples: " << few_samples << "\n"
       << "Missing feature: " << missing_feature << "\n"
       << "Failed: " << failed << "\n"
       << "Total sites tested: " << total_sites << "\n"
       << "TMRs called: " << (total_positive + total_negative) << "\n"
       << "  Negative: " << total_negative << "\n"
       << "  Positive: " << total_positive << "\n"
       << "Average time per anchor: " << std::fixed << std::setprecision(2)
       << (results.empty() ? 0.0 : total_time / results.size()) << " ms\n"
       << "Average sites per anchor: " << (ok > 0 ? total_sites / static_cast<double>(ok) : 0.0);
    LOG_INFO(ss.str());
}

}  // namespace Methodical
