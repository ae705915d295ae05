#pragma once

#include <string>
#include <vector>

#include "core/AnchorCorrelation.hpp"
#include "core/Config.hpp"
#include "core/CorrelationEngine.hpp"
#include "core/MethylationSource.hpp"
#include "core/ScoreSmoother.hpp"
#include "core/TmrCaller.hpp"
#include "io/FeatureTable.hpp"

namespace Methodical {

/**
 * @brief 處理單個 anchor 的結果
 */
struct AnchorResult {
    int anchor_id;
    AnchorStatus status;
    std::string error_message;
    int num_sites;               ///< Sites inside the anchor window
    int num_samples;             ///< Samples shared by methylation and feature
    int num_tmrs;
    double elapsed_ms;
    std::vector<Tmr> tmrs;
    AnchorCorrelations correlations;  ///< Only filled when correlations are kept

    AnchorResult()
        : anchor_id(-1),
          status(AnchorStatus::FAILED),
          num_sites(0),
          num_samples(0),
          num_tmrs(0),
          elapsed_ms(0.0) {
    }
};

/**
 * @brief 平行化處理多個 anchors 的核心類別
 *
 * 每個 anchor：
 * 1. 依 strand 與 upstream/downstream 取得 window 內的 sites
 * 2. 與 anchor 對應的 feature 計算相關係數
 * 3. 轉換為 methodical score 並平滑
 * 4. 呼叫 TMR
 *
 * Thread-safety:
 * - 每個 thread 有自己的 MethylationSource（由 SourceFactory 建立）
 * - FeatureTable 唯讀共享
 * - 結果寫入以 anchor index 定位的 slot，不需要鎖
 */
class AnchorProcessor {
public:
    AnchorProcessor(const WindowParams& window, const CorrelationConfig& correlation, const TmrParams& tmr,
                    int num_threads = 1, bool keep_correlations = false);

    /**
     * @brief 使用 Config 建構（find-tmrs 子命令）
     */
    explicit AnchorProcessor(const Config& config);

    /**
     * @brief 處理所有 anchors（平行化）
     *
     * All sources are opened before the parallel region, so a failing
     * factory propagates its exception to the caller.
     *
     * @return One result per anchor, in input order.
     */
    std::vector<AnchorResult> process_all(const std::vector<Anchor>& anchors, const FeatureTable& features,
                                          const SourceFactory& factory) const;

    /**
     * @brief 處理單個 anchor
     *
     * Per-anchor errors are caught and recorded in the result status.
     */
    AnchorResult process_single_anchor(const Anchor& anchor, const FeatureTable& features,
                                       MethylationSource& source) const;

    /**
     * @brief All TMRs of successful anchors, in anchor order.
     */
    static std::vector<Tmr> collect_tmrs(const std::vector<AnchorResult>& results);

    /**
     * @brief 輸出處理摘要報告
     */
    void print_summary(const std::vector<AnchorResult>& results) const;

    int num_threads() const { return num_threads_; }

private:
    WindowParams window_;
    CorrelationConfig correlation_;
    TmrParams tmr_;
    int num_threads_;
    bool keep_correlations_;
};

}  // namespace Methodical
