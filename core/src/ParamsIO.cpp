#include "coloc/core/util/ParamsIO.hpp"

#include <nlohmann/json.hpp>

#include "coloc/core/types/Errors.hpp"
#include "coloc/core/util/LoadJson.hpp"

namespace coloc {

namespace keys {
constexpr const char* RedThreshold = "red_threshold";
constexpr const char* GreenThreshold = "green_threshold";
constexpr const char* BlueThreshold = "blue_threshold";
constexpr const char* MaskThreshold = "mask_threshold";
constexpr const char* SkipBelowForPearson = "skip_pixels_below_threshold_for_pearson";
constexpr const char* ColorPlot = "show_color_coded_colocalization_plot";
constexpr const char* IntensityPlot = "show_intensity_coded_colocalization_plot";
constexpr const char* ColocImage = "show_colocalized_image";
constexpr const char* ChannelsInOneRow = "show_channels_in_one_row";
}  // namespace keys

void validateThreshold(int threshold, const std::string& name)
{
    if (threshold < 0 || threshold > kMaxIntensity + 1) {
        throw ConfigError(name + " must be in 0.." + std::to_string(kMaxIntensity + 1) +
                          ", got " + std::to_string(threshold));
    }
}

ColocParams paramsFromJson(const nlohmann::json& j, const ColocParams& defaults, const std::string& context)
{
    if (!j.is_object()) {
        throw ConfigError(context + " must be a JSON object");
    }

    ColocParams p = defaults;
    p.redThreshold = json::int_or(j, keys::RedThreshold, p.redThreshold, context);
    p.greenThreshold = json::int_or(j, keys::GreenThreshold, p.greenThreshold, context);
    p.blueThreshold = json::int_or(j, keys::BlueThreshold, p.blueThreshold, context);
    p.maskThreshold = json::int_or(j, keys::MaskThreshold, p.maskThreshold, context);
    p.excludeBelowThresholdFromPearson =
        json::bool_or(j, keys::SkipBelowForPearson, p.excludeBelowThresholdFromPearson, context);
    p.renderQuadrantPlot = json::bool_or(j, keys::ColorPlot, p.renderQuadrantPlot, context);
    p.renderIntensityPlot = json::bool_or(j, keys::IntensityPlot, p.renderIntensityPlot, context);
    p.renderColocMask = json::bool_or(j, keys::ColocImage, p.renderColocMask, context);
    p.channelsInOneRow = json::bool_or(j, keys::ChannelsInOneRow, p.channelsInOneRow, context);

    validateThreshold(p.redThreshold, keys::RedThreshold);
    validateThreshold(p.greenThreshold, keys::GreenThreshold);
    validateThreshold(p.blueThreshold, keys::BlueThreshold);
    validateThreshold(p.maskThreshold, keys::MaskThreshold);
    return p;
}

nlohmann::json paramsToJson(const ColocParams& params)
{
    return {
        {keys::RedThreshold, params.redThreshold},
        {keys::GreenThreshold, params.greenThreshold},
        {keys::BlueThreshold, params.blueThreshold},
        {keys::MaskThreshold, params.maskThreshold},
        {keys::SkipBelowForPearson, params.excludeBelowThresholdFromPearson},
        {keys::ColorPlot, params.renderQuadrantPlot},
        {keys::IntensityPlot, params.renderIntensityPlot},
        {keys::ColocImage, params.renderColocMask},
        {keys::ChannelsInOneRow, params.channelsInOneRow},
    };
}

ColocParams loadParams(const std::filesystem::path& path, const ColocParams& defaults)
{
    return paramsFromJson(json::load_json_file(path), defaults, path.string());
}

ColocParams applyOverrides(ColocParams params, const ParamsOverrides& overrides)
{
    params.redThreshold = overrides.redThreshold.value_or(params.redThreshold);
    params.greenThreshold = overrides.greenThreshold.value_or(params.greenThreshold);
    params.blueThreshold = overrides.blueThreshold.value_or(params.blueThreshold);
    params.maskThreshold = overrides.maskThreshold.value_or(params.maskThreshold);
    params.excludeBelowThresholdFromPearson =
        overrides.excludeBelowThresholdFromPearson.value_or(params.excludeBelowThresholdFromPearson);
    params.renderQuadrantPlot = overrides.renderQuadrantPlot.value_or(params.renderQuadrantPlot);
    params.renderIntensityPlot = overrides.renderIntensityPlot.value_or(params.renderIntensityPlot);
    params.renderColocMask = overrides.renderColocMask.value_or(params.renderColocMask);
    params.channelsInOneRow = overrides.channelsInOneRow.value_or(params.channelsInOneRow);

    validateThreshold(params.redThreshold, keys::RedThreshold);
    validateThreshold(params.greenThreshold, keys::GreenThreshold);
    validateThreshold(params.blueThreshold, keys::BlueThreshold);
    validateThreshold(params.maskThreshold, keys::MaskThreshold);
    return params;
}

}  // namespace coloc
