#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "coloc/core/Version.hpp"
#include "coloc/core/util/AutoThreshold.hpp"
#include "coloc/core/util/Logging.hpp"
#include "coloc/core/util/PairAnalysis.hpp"
#include "coloc/core/util/ParamsIO.hpp"
#include "coloc/core/util/Report.hpp"
#include "coloc/core/util/ResultWriter.hpp"
#include "coloc/core/util/StackIO.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

using namespace coloc;

namespace {

std::optional<ChannelSelect> parseChannel(const std::string& s)
{
    if (s == "red" || s == "r") return ChannelSelect::Red;
    if (s == "green" || s == "g") return ChannelSelect::Green;
    if (s == "blue" || s == "b") return ChannelSelect::Blue;
    return std::nullopt;
}

RgbColor channelColor(ChannelSelect c)
{
    switch (c) {
        case ChannelSelect::Red:   return colors::Red;
        case ChannelSelect::Green: return colors::Green;
        case ChannelSelect::Blue:  break;
    }
    return colors::Blue;
}

std::string channelLabel(ChannelSelect c)
{
    switch (c) {
        case ChannelSelect::Red:   return "Red";
        case ChannelSelect::Green: return "Green";
        case ChannelSelect::Blue:  break;
    }
    return "Blue";
}

}  // namespace

int main(int argc, char** argv)
{
    po::options_description desc("Colocalization statistics for two single-channel images or stacks.");
    desc.add_options()
        ("help,h", "Print help")
        ("version", "Print version")
        ("image1", po::value<std::string>()->required(), "First image or stack")
        ("image2", po::value<std::string>()->required(), "Second image or stack")
        ("channel1", po::value<std::string>()->default_value("red"), "Channel taken from a colour image1 (red, green, blue)")
        ("channel2", po::value<std::string>()->default_value("green"), "Channel taken from a colour image2 (red, green, blue)")
        ("label1", po::value<std::string>(), "Report label of the first channel")
        ("label2", po::value<std::string>(), "Report label of the second channel")
        ("threshold1", po::value<int>()->default_value(75), "Noise threshold of the first channel (0-256)")
        ("threshold2", po::value<int>()->default_value(75), "Noise threshold of the second channel (0-256)")
        ("auto-threshold", "Compute IsoData thresholds from the middle slices")
        ("config,c", po::value<std::string>(), "JSON configuration file (flags only)")
        ("skip-below-pearson", "Exclude pixels below both thresholds from the Pearson correlation")
        ("color-plot", "Write the colour coded colocalization plot")
        ("intensity-plot", "Write the logarithmic intensity colocalization plot")
        ("coloc-image", "Write the colocalized image")
        ("output,o", po::value<std::string>(), "Output folder for the table, plots and result files")
        ("save-results", "Write matrix and metadata files (next to the images unless --output is given)")
        ("json", po::value<std::string>(), "Write a JSON summary")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error, critical, off")
        ("log-file", po::value<std::string>(), "Also append log messages to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        if (vm.count("version")) {
            std::cout << ProjectInfo::NameAndVersion() << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (!SetLogLevel(vm["log-level"].as<std::string>())) {
        std::cerr << "Error: unknown log level " << vm["log-level"].as<std::string>() << std::endl;
        return 1;
    }

    const auto sel1 = parseChannel(vm["channel1"].as<std::string>());
    const auto sel2 = parseChannel(vm["channel2"].as<std::string>());
    if (!sel1 || !sel2) {
        std::cerr << "Error: channels must be red, green or blue." << std::endl;
        return 1;
    }

    try {
        if (vm.count("log-file")) {
            AddLogFile(vm["log-file"].as<std::string>());
        }

        ColocParams params;
        if (vm.count("config")) {
            params = loadParams(vm["config"].as<std::string>());
        }
        ParamsOverrides overrides;
        if (vm.count("skip-below-pearson")) overrides.excludeBelowThresholdFromPearson = true;
        if (vm.count("color-plot")) overrides.renderQuadrantPlot = true;
        if (vm.count("intensity-plot")) overrides.renderIntensityPlot = true;
        if (vm.count("coloc-image")) overrides.renderColocMask = true;
        params = applyOverrides(params, overrides);

        const ChannelStack stack1 = loadChannelStack(vm["image1"].as<std::string>(), *sel1);
        const ChannelStack stack2 = loadChannelStack(vm["image2"].as<std::string>(), *sel2);

        ChannelSpec ch1{vm.count("label1") ? vm["label1"].as<std::string>() : channelLabel(*sel1),
                        vm["threshold1"].as<int>(), channelColor(*sel1)};
        ChannelSpec ch2{vm.count("label2") ? vm["label2"].as<std::string>() : channelLabel(*sel2),
                        vm["threshold2"].as<int>(), channelColor(*sel2)};
        if (ch1.color == ch2.color) {
            // Same channel of two images: keep the quadrants distinguishable
            ch2.color = ch1.color == colors::Blue ? colors::Red : colors::Blue;
        }

        if (vm.count("auto-threshold")) {
            ch1.threshold = autoThreshold(stack1);
            ch2.threshold = autoThreshold(stack2);
            Logger()->info("Auto thresholds: {} {}, {} {}", ch1.label, ch1.threshold, ch2.label, ch2.threshold);
        }
        validateThreshold(ch1.threshold, "threshold1");
        validateThreshold(ch2.threshold, "threshold2");

        const PairResult result = colocalizePair(stack1, stack2, ch1, ch2, params);

        ReportTable table;
        table.header = pairReportHeader();
        table.rows = toTextRows(result);
        std::cout << table.toString();

        std::optional<fs::path> outputDir;
        if (vm.count("output")) {
            outputDir = fs::path(vm["output"].as<std::string>());
            fs::create_directories(*outputDir);

            writeTable(*outputDir / "pair_channels.tsv", table);
            writePlots(*outputDir, result, params.renderColocMask);
        }

        if (vm.count("save-results")) {
            SaveOptions options;
            options.outputRoot = outputDir;
            options.timestamp = std::chrono::system_clock::now();
            saveResult(result, options);
        }

        if (vm.count("json")) {
            const fs::path jsonPath = vm["json"].as<std::string>();
            std::ofstream o(jsonPath);
            if (!o.is_open()) {
                throw std::runtime_error("Failed to open output file " + jsonPath.string());
            }
            nlohmann::json doc = toJson(result);
            doc["version"] = ProjectInfo::VersionString();
            doc["params"] = paramsToJson(params);
            o << doc.dump(4);
            Logger()->info("Wrote {}", jsonPath.string());
        }

        return 0;
    } catch (const std::exception& e) {
        Logger()->critical("{}", e.what());
        return 1;
    }
}
