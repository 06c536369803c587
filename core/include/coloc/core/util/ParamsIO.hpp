#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "coloc/core/types/ColocParams.hpp"

namespace coloc {

// Keys missing from @p j keep the values of @p defaults.
// Throws ConfigError for wrong types or thresholds outside 0..256.
ColocParams paramsFromJson(const nlohmann::json& j, const ColocParams& defaults = {},
                           const std::string& context = "configuration");

nlohmann::json paramsToJson(const ColocParams& params);

ColocParams loadParams(const std::filesystem::path& path, const ColocParams& defaults = {});

// Values given on a command line; unset fields keep the configured value
struct ParamsOverrides {
    std::optional<int> redThreshold;
    std::optional<int> greenThreshold;
    std::optional<int> blueThreshold;
    std::optional<int> maskThreshold;
    std::optional<bool> excludeBelowThresholdFromPearson;
    std::optional<bool> renderQuadrantPlot;
    std::optional<bool> renderIntensityPlot;
    std::optional<bool> renderColocMask;
    std::optional<bool> channelsInOneRow;
};

// Throws ConfigError if an overridden threshold is outside 0..256
ColocParams applyOverrides(ColocParams params, const ParamsOverrides& overrides);

// Throws ConfigError unless 0 <= threshold <= 256
void validateThreshold(int threshold, const std::string& name);

}  // namespace coloc
