#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "core/AnchorCorrelation.hpp"
#include "core/AnchorProcessor.hpp"
#include "core/CorrelationEngine.hpp"
#include "core/DataStructs.hpp"

namespace Methodical {

/**
 * @brief 負責將分析結果輸出到檔案
 *
 * 輸出目錄結構：
 * ```
 * output/
 *   cor_test.tsv                   # cor-test：所有欄位配對的相關係數
 *   tmrs.tsv                       # find-tmrs：所有 anchor 的 TMR
 *   anchor_summary.tsv             # 每個 anchor 的處理狀態
 *   correlations/                  # --write-correlations 時輸出
 *     <name>_<chr>_<pos>.tsv       # 單一 anchor 的 site 相關係數
 * ```
 *
 * 缺失值一律寫成 "NA"。
 */
class TmrWriter {
public:
    /**
     * @brief 建構 TmrWriter，必要時建立輸出目錄
     * @param output_dir 輸出根目錄
     * @throws std::runtime_error 無法建立目錄時
     */
    explicit TmrWriter(const std::string& output_dir);

    /**
     * @brief 寫出 cor_test.tsv
     *
     * 格式：
     * <table1_name>  <table2_name>  cor  p_val  [q_val]
     *
     * @return 寫出的檔案路徑
     */
    std::string write_cor_test(const CorrelationTable& table, const std::string& table1_name = "feature1",
                               const std::string& table2_name = "feature2");

    /**
     * @brief 寫出單一 anchor 的 correlations/<name>_<chr>_<pos>.tsv
     *
     * 格式：
     * #anchor=chr:pos:strand  feature=<name>
     * seqname  position  cor  p_val  [q_val]  distance_to_anchor
     */
    std::string write_anchor_correlations(const AnchorCorrelations& correlations);

    /**
     * @brief 寫出 tmrs.tsv
     *
     * 格式：
     * seqname  start  end  direction  site_count  distance_to_anchor
     * anchor_location  feature  significant_sites  mean_score
     */
    std::string write_tmrs(const std::vector<Tmr>& tmrs);

    /**
     * @brief 寫出 anchor_summary.tsv
     */
    std::string write_anchor_summary(const std::vector<Anchor>& anchors, const std::vector<AnchorResult>& results);

    /**
     * @brief 單一 anchor 相關係數檔案的路徑
     */
    std::string anchor_correlation_path(const Anchor& anchor) const;

    const std::string& get_output_dir() const { return output_dir_; }

private:
    std::string output_dir_;

    static std::ofstream open_output(const std::string& path);
};

}  // namespace Methodical
