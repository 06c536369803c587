#include "coloc/core/util/PairAnalysis.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include "coloc/core/types/Errors.hpp"
#include "coloc/core/util/Logging.hpp"
#include "coloc/core/util/SliceProcessor.hpp"

namespace coloc {

PairResult colocalizePair(const ChannelStack& stack1, const ChannelStack& stack2,
                          const ChannelSpec& channel1, const ChannelSpec& channel2,
                          const ColocParams& params)
{
    const int numSlices = std::min(stack1.numSlices(), stack2.numSlices());
    if (numSlices > 0) {
        requireSameSize(stack1.size(), stack2.size(), stack1.title() + " and " + stack2.title());
    }
    if (stack1.numSlices() != stack2.numSlices()) {
        Logger()->warn("{} has {} slices and {} has {}; using the first {}",
                       stack1.title(), stack1.numSlices(), stack2.title(), stack2.numSlices(), numSlices);
    }

    Logger()->info("Colocalizing {} vs {} ({} vs {}), {} slices, thresholds {}/{}",
                   stack1.title(), stack2.title(), channel1.label, channel2.label,
                   numSlices, channel1.threshold, channel2.threshold);

    std::vector<SliceOutput> outputs(static_cast<size_t>(numSlices));
    std::exception_ptr failure;

    #pragma omp parallel for schedule(dynamic, 1)
    for (int i = 0; i < numSlices; i++) {
        try {
            outputs[i] = processSlice(stack1.slice(i), stack2.slice(i), channel1, channel2, params);
        } catch (...) {
            #pragma omp critical(coloc_slice_failure)
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    PairResult result;
    result.image1Title = stack1.title();
    result.image2Title = stack2.title();
    result.image1Path = stack1.sourcePath();
    result.image2Path = stack2.sourcePath();
    result.channel1 = channel1;
    result.channel2 = channel2;
    result.planeSize = stack1.size();

    result.slices.reserve(outputs.size());
    result.histograms.reserve(outputs.size());
    result.quadrantPlots.reserve(outputs.size());
    result.intensityPlots.reserve(outputs.size());
    result.colocMasks.reserve(outputs.size());

    for (size_t i = 0; i < outputs.size(); i++) {
        auto& out = outputs[i];
        Logger()->debug("slice {}: below={} ch1={} ch2={} coloc={} pearson={}",
                        i + 1, out.stats.counts.belowBoth, out.stats.counts.channel1Only,
                        out.stats.counts.channel2Only, out.stats.counts.colocalized, out.stats.pearson);
        result.slices.push_back(out.stats);
        result.histograms.push_back(std::move(out.histogram));
        result.quadrantPlots.push_back(std::move(out.quadrantPlot));
        result.intensityPlots.push_back(std::move(out.intensityPlot));
        result.colocMasks.push_back(std::move(out.colocMask));
    }

    Logger()->info("Finished {} vs {}", channel1.label, channel2.label);
    return result;
}

PairResult colocalizeWithMask(const ChannelStack& stack, const ChannelSpec& channel,
                              const PairResult& source, const ColocParams& params,
                              const std::string& maskTitle, const std::string& maskLabel,
                              const RgbColor& maskColor)
{
    ColocParams maskParams = params;
    maskParams.renderQuadrantPlot = false;
    maskParams.renderIntensityPlot = false;

    const ChannelStack masks = source.maskStack(maskTitle);
    const ChannelSpec maskChannel{maskLabel, params.maskThreshold, maskColor};
    return colocalizePair(stack, masks, channel, maskChannel, maskParams);
}

}  // namespace coloc
