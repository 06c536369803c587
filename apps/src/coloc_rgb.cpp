#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "coloc/core/Version.hpp"
#include "coloc/core/util/AnalysisRun.hpp"
#include "coloc/core/util/AutoThreshold.hpp"
#include "coloc/core/util/Logging.hpp"
#include "coloc/core/util/ParamsIO.hpp"
#include "coloc/core/util/Report.hpp"
#include "coloc/core/util/ResultWriter.hpp"
#include "coloc/core/util/StackIO.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

using namespace coloc;

int main(int argc, char** argv)
{
    po::options_description desc("Colocalization statistics for the channels of RGB images.");
    desc.add_options()
        ("help,h", "Print help")
        ("version", "Print version")
        ("rgb", po::value<std::vector<std::string>>()->multitoken(), "Colour image(s) or stack(s); each is analyzed on its own")
        ("red", po::value<std::string>(), "Red channel image (grayscale or colour)")
        ("green", po::value<std::string>(), "Green channel image (grayscale or colour)")
        ("blue", po::value<std::string>(), "Blue channel image (grayscale or colour)")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("red-threshold", po::value<int>(), "Red noise threshold (0-255)")
        ("green-threshold", po::value<int>(), "Green noise threshold (0-255)")
        ("blue-threshold", po::value<int>(), "Blue noise threshold (0-255)")
        ("mask-threshold", po::value<int>(), "Threshold of the Red/Green mask in the three-channel pass")
        ("auto-threshold", "Compute IsoData thresholds from the middle slice of the first image")
        ("skip-below-pearson", "Exclude pixels below both thresholds from the Pearson correlation")
        ("color-plot", "Write the colour coded colocalization plot")
        ("intensity-plot", "Write the logarithmic intensity colocalization plot")
        ("coloc-image", "Write the colocalized image")
        ("stacked-rows", "One row per slice per pair instead of all pairs in one row")
        ("output,o", po::value<std::string>(), "Output folder for tables, plots and result files")
        ("save-results", "Write matrix and metadata files (next to the images unless --output is given)")
        ("json", po::value<std::string>(), "Write a JSON summary of every pair")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error, critical, off")
        ("log-file", po::value<std::string>(), "Also append log messages to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }
    if (vm.count("version")) {
        std::cout << ProjectInfo::NameAndVersion() << std::endl;
        return 0;
    }

    if (!SetLogLevel(vm["log-level"].as<std::string>())) {
        std::cerr << "Error: unknown log level " << vm["log-level"].as<std::string>() << std::endl;
        return 1;
    }

    const bool separate = vm.count("red") || vm.count("green") || vm.count("blue");
    if (!vm.count("rgb") && !separate) {
        std::cerr << "Error: --rgb or at least one of --red, --green, --blue is required." << std::endl;
        return 1;
    }
    if (vm.count("rgb") && separate) {
        std::cerr << "Error: --rgb cannot be combined with --red, --green or --blue." << std::endl;
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
        if (vm.count("red-threshold")) overrides.redThreshold = vm["red-threshold"].as<int>();
        if (vm.count("green-threshold")) overrides.greenThreshold = vm["green-threshold"].as<int>();
        if (vm.count("blue-threshold")) overrides.blueThreshold = vm["blue-threshold"].as<int>();
        if (vm.count("mask-threshold")) overrides.maskThreshold = vm["mask-threshold"].as<int>();
        if (vm.count("skip-below-pearson")) overrides.excludeBelowThresholdFromPearson = true;
        if (vm.count("color-plot")) overrides.renderQuadrantPlot = true;
        if (vm.count("intensity-plot")) overrides.renderIntensityPlot = true;
        if (vm.count("coloc-image")) overrides.renderColocMask = true;
        if (vm.count("stacked-rows")) overrides.channelsInOneRow = false;
        params = applyOverrides(params, overrides);

        std::vector<RgbImageSet> sets;
        if (separate) {
            RgbImageSet set;
            if (vm.count("red")) set.red = loadChannelStack(vm["red"].as<std::string>(), ChannelSelect::Red);
            if (vm.count("green")) set.green = loadChannelStack(vm["green"].as<std::string>(), ChannelSelect::Green);
            if (vm.count("blue")) set.blue = loadChannelStack(vm["blue"].as<std::string>(), ChannelSelect::Blue);
            sets.push_back(std::move(set));
        } else {
            for (const auto& file : vm["rgb"].as<std::vector<std::string>>()) {
                sets.push_back(loadRgbStack(file));
            }
        }

        if (vm.count("auto-threshold")) {
            params = withAutoThresholds(params, sets.front());
        }

        std::optional<fs::path> outputDir;
        if (vm.count("output")) {
            outputDir = fs::path(vm["output"].as<std::string>());
            fs::create_directories(*outputDir);
        }

        SaveOptions saveOptions;
        saveOptions.outputRoot = outputDir;
        saveOptions.timestamp = std::chrono::system_clock::now();

        AnalysisRun run(params);
        nlohmann::json summary = nlohmann::json::array();

        for (const auto& set : sets) {
            ImageSetAnalysis analysis = run.add(set);

            std::vector<const PairResult*> all;
            for (const auto& r : analysis.pairs) all.push_back(&r);
            if (analysis.chain) all.push_back(&*analysis.chain);

            for (const PairResult* r : all) {
                if (vm.count("json")) {
                    summary.push_back(toJson(*r));
                }
                if (vm.count("save-results")) {
                    saveResult(*r, saveOptions);
                }
                if (outputDir) {
                    writePlots(*outputDir, *r, params.renderColocMask);
                }
            }
        }

        std::cout << "Colocalization statistics for pair of channels\n"
                  << run.pairTable().toString() << "\n"
                  << "Colocalization statistics for three channels\n"
                  << run.chainTable().toString();

        if (outputDir) {
            writeTable(*outputDir / "pair_channels.tsv", run.pairTable());
            writeTable(*outputDir / "three_channels.tsv", run.chainTable());
        }

        if (vm.count("json")) {
            const fs::path jsonPath = vm["json"].as<std::string>();
            std::ofstream o(jsonPath);
            if (!o.is_open()) {
                throw std::runtime_error("Failed to open output file " + jsonPath.string());
            }
            nlohmann::json doc;
            doc["version"] = ProjectInfo::VersionString();
            doc["params"] = paramsToJson(params);
            doc["pairs"] = std::move(summary);
            o << doc.dump(4);
            Logger()->info("Wrote {}", jsonPath.string());
        }

        return run.failureCount() > 0 ? 2 : 0;
    } catch (const std::exception& e) {
        Logger()->critical("{}", e.what());
        return 1;
    }
}
