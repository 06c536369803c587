#pragma once

#include <optional>
#include <string>
#include <vector>

#include "coloc/core/types/ColocParams.hpp"
#include "coloc/core/types/PairResult.hpp"
#include "coloc/core/types/RgbImageSet.hpp"
#include "coloc/core/util/Report.hpp"

namespace coloc {

// Outcome of one image set
struct ImageSetAnalysis {
    // Successful pairs in run order: Red vs Blue, Green vs Blue, Red vs Green
    std::vector<PairResult> pairs;
    // Blue vs the Red/Green colocalization mask, if all channels were present
    std::optional<PairResult> chain;
    // One message per pair that was skipped because of a dimension mismatch
    std::vector<std::string> failures;
};

/**
 * RGB colocalization workflow over one or more image sets.
 *
 * Each add() colocalizes the channel pairs that are present, merges their
 * report rows (left-to-right per slice in one-row mode, stacked
 * otherwise) and appends them to the pair table. With all three channels
 * present, blue is then colocalized against the Red vs Green mask and
 * the rows go to the three-channel table.
 *
 * A pair whose planes differ in size is logged and skipped; the other
 * pairs still run.
 */
class AnalysisRun
{
public:
    explicit AnalysisRun(ColocParams params);

    ImageSetAnalysis add(const RgbImageSet& set);

    [[nodiscard]] const ColocParams& params() const { return params_; }
    [[nodiscard]] const ReportTable& pairTable() const { return pairTable_; }
    [[nodiscard]] const ReportTable& chainTable() const { return chainTable_; }
    // Pairs and chained passes skipped so far, over all image sets
    [[nodiscard]] int failureCount() const { return failureCount_; }

private:
    ColocParams params_;
    ReportTable pairTable_;
    ReportTable chainTable_;
    int failureCount_{0};
};

}  // namespace coloc
