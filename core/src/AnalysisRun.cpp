#include "coloc/core/util/AnalysisRun.hpp"

#include <utility>

#include "coloc/core/types/Errors.hpp"
#include "coloc/core/util/Logging.hpp"
#include "coloc/core/util/PairAnalysis.hpp"

namespace coloc {

AnalysisRun::AnalysisRun(ColocParams params)
    : params_(std::move(params))
{
    chainTable_.header = pairReportHeader();
}

ImageSetAnalysis AnalysisRun::add(const RgbImageSet& set)
{
    ImageSetAnalysis out;
    std::vector<std::string> rows;
    std::optional<size_t> redGreen;

    auto runPair = [&](const std::optional<ChannelStack>& s1, const std::optional<ChannelStack>& s2,
                       const ChannelSpec& c1, const ChannelSpec& c2) -> bool {
        if (!s1 || !s2) {
            return false;
        }
        try {
            PairResult r = colocalizePair(*s1, *s2, c1, c2, params_);
            rows = appendRows(std::move(rows), toTextRows(r), params_.channelsInOneRow);
            out.pairs.push_back(std::move(r));
            return true;
        } catch (const DimensionMismatch& e) {
            Logger()->error("Skipping {} vs {}: {}", c1.label, c2.label, e.what());
            out.failures.emplace_back(e.what());
            return false;
        }
    };

    runPair(set.red, set.blue, params_.red(), params_.blue());
    runPair(set.green, set.blue, params_.green(), params_.blue());
    if (runPair(set.red, set.green, params_.red(), params_.green())) {
        redGreen = out.pairs.size() - 1;
    }

    if (!out.pairs.empty()) {
        const size_t repeats = params_.channelsInOneRow ? out.pairs.size() : 1;
        pairTable_.header.clear();
        for (size_t i = 0; i < repeats; i++) {
            pairTable_.header += pairReportHeader();
        }
        pairTable_.rows.insert(pairTable_.rows.end(), rows.begin(), rows.end());
    }

    if (set.red && set.green && set.blue) {
        if (!redGreen) {
            Logger()->warn("Red vs Green failed; skipping three-channel colocalization");
            failureCount_ += static_cast<int>(out.failures.size());
            return out;
        }
        try {
            PairResult chain = colocalizeWithMask(*set.blue, params_.blue(), out.pairs[*redGreen], params_);
            const auto chainRows = toTextRows(chain);
            chainTable_.rows.insert(chainTable_.rows.end(), chainRows.begin(), chainRows.end());
            out.chain = std::move(chain);
        } catch (const DimensionMismatch& e) {
            Logger()->error("Skipping three-channel colocalization: {}", e.what());
            out.failures.emplace_back(e.what());
        }
    }

    failureCount_ += static_cast<int>(out.failures.size());
    return out;
}

}  // namespace coloc
