#include "test.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "coloc/core/types/Errors.hpp"
#include "coloc/core/util/ParamsIO.hpp"

using namespace coloc;
namespace fs = std::filesystem;

TEST(ParamsIO, Defaults)
{
    ColocParams p;
    EXPECT_EQ(p.redThreshold, 75);
    EXPECT_EQ(p.greenThreshold, 75);
    EXPECT_EQ(p.blueThreshold, 75);
    EXPECT_EQ(p.maskThreshold, 100);
    EXPECT_FALSE(p.excludeBelowThresholdFromPearson);
    EXPECT_FALSE(p.renderQuadrantPlot);
    EXPECT_TRUE(p.channelsInOneRow);
    EXPECT_EQ(p.red().label, "Red");
    EXPECT_EQ(p.blue().color, colors::Blue);
}

TEST(ParamsIO, MissingKeysKeepDefaults)
{
    auto j = nlohmann::json::parse(R"({"red_threshold": 100, "show_channels_in_one_row": false})");
    auto p = paramsFromJson(j);
    EXPECT_EQ(p.redThreshold, 100);
    EXPECT_EQ(p.greenThreshold, 75);
    EXPECT_FALSE(p.channelsInOneRow);
    EXPECT_FALSE(p.renderColocMask);
}

TEST(ParamsIO, AllKeys)
{
    auto j = nlohmann::json::parse(R"({
        "red_threshold": 10, "green_threshold": 20, "blue_threshold": 30, "mask_threshold": 40,
        "skip_pixels_below_threshold_for_pearson": true,
        "show_color_coded_colocalization_plot": true,
        "show_intensity_coded_colocalization_plot": true,
        "show_colocalized_image": true
    })");
    auto p = paramsFromJson(j);
    EXPECT_EQ(p.greenThreshold, 20);
    EXPECT_EQ(p.blueThreshold, 30);
    EXPECT_EQ(p.maskThreshold, 40);
    EXPECT_TRUE(p.excludeBelowThresholdFromPearson);
    EXPECT_TRUE(p.renderQuadrantPlot);
    EXPECT_TRUE(p.renderIntensityPlot);
    EXPECT_TRUE(p.renderColocMask);

    auto back = paramsFromJson(paramsToJson(p));
    EXPECT_EQ(back.redThreshold, 10);
    EXPECT_TRUE(back.renderIntensityPlot);
}

TEST(ParamsIO, RejectsBadValues)
{
    EXPECT_THROW(paramsFromJson(nlohmann::json::parse(R"({"red_threshold": 300})")), ConfigError);
    EXPECT_THROW(paramsFromJson(nlohmann::json::parse(R"({"red_threshold": -1})")), ConfigError);
    EXPECT_THROW(paramsFromJson(nlohmann::json::parse(R"({"red_threshold": "high"})")), ConfigError);
    EXPECT_THROW(paramsFromJson(nlohmann::json::parse(R"({"show_colocalized_image": 1})")), ConfigError);
    EXPECT_THROW(paramsFromJson(nlohmann::json::parse("[1, 2]")), ConfigError);
    EXPECT_NO_THROW(paramsFromJson(nlohmann::json::parse(R"({"blue_threshold": 256})")));
}

TEST(ParamsIO, LoadFromFile)
{
    const fs::path path = fs::temp_directory_path() / "coloc_test_params.json";
    {
        std::ofstream o(path);
        o << R"({"green_threshold": 33})";
    }
    auto p = loadParams(path);
    EXPECT_EQ(p.greenThreshold, 33);
    fs::remove(path);

    EXPECT_THROW(loadParams(fs::temp_directory_path() / "coloc_test_missing.json"), ConfigError);
}

TEST(ParamsIO, LoadRejectsMalformedJson)
{
    const fs::path path = fs::temp_directory_path() / "coloc_test_bad.json";
    {
        std::ofstream o(path);
        o << "{ not json";
    }
    EXPECT_THROW(loadParams(path), ConfigError);
    fs::remove(path);
}

TEST(ParamsIO, OverridesReplaceOnlySetFields)
{
    ColocParams base;
    base.greenThreshold = 90;
    base.renderColocMask = true;

    ParamsOverrides o;
    o.redThreshold = 120;
    o.maskThreshold = 50;
    o.renderQuadrantPlot = true;
    o.channelsInOneRow = false;
    auto p = applyOverrides(base, o);

    EXPECT_EQ(p.redThreshold, 120);
    EXPECT_EQ(p.greenThreshold, 90);
    EXPECT_EQ(p.blueThreshold, 75);
    EXPECT_EQ(p.maskThreshold, 50);
    EXPECT_TRUE(p.renderQuadrantPlot);
    EXPECT_FALSE(p.renderIntensityPlot);
    EXPECT_TRUE(p.renderColocMask);
    EXPECT_FALSE(p.channelsInOneRow);

    auto unchanged = applyOverrides(base, ParamsOverrides{});
    EXPECT_EQ(unchanged.greenThreshold, 90);
    EXPECT_TRUE(unchanged.channelsInOneRow);
}

TEST(ParamsIO, OverridesAreValidated)
{
    ParamsOverrides high;
    high.blueThreshold = 257;
    EXPECT_THROW(applyOverrides(ColocParams{}, high), ConfigError);

    ParamsOverrides negative;
    negative.maskThreshold = -1;
    EXPECT_THROW(applyOverrides(ColocParams{}, negative), ConfigError);

    ParamsOverrides edge;
    edge.redThreshold = 256;
    EXPECT_EQ(applyOverrides(ColocParams{}, edge).redThreshold, 256);
}
