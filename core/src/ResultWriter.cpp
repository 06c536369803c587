#include "coloc/core/util/ResultWriter.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "coloc/core/types/ColocParams.hpp"
#include "coloc/core/util/Logging.hpp"
#include "coloc/core/util/Report.hpp"
#include "coloc/core/util/StackIO.hpp"

namespace fs = std::filesystem;

namespace coloc {

namespace {

std::string formatTime(const std::chrono::system_clock::time_point& tp, const char* pattern)
{
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

void writeFile(const fs::path& path, const std::string& contents)
{
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    out << contents;
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path.string());
    }
}

template<typename Plane>
bool anyRendered(const std::vector<Plane>& planes)
{
    return std::any_of(planes.begin(), planes.end(), [](const Plane& p) { return !p.empty(); });
}

template<typename Plane>
void writeStackIfRendered(const fs::path& path, const std::vector<Plane>& planes, std::vector<fs::path>& written)
{
    if (!anyRendered(planes)) {
        Logger()->debug("Nothing rendered for {}", path.string());
        return;
    }
    writePlaneStack(path, std::vector<cv::Mat>(planes.begin(), planes.end()));
    written.push_back(path);
}

}  // namespace

void writeMatrix(std::ostream& os, const PairResult& result)
{
    os << "Colocalization matrix for X:" << result.image1Title << " vs Y:" << result.image2Title
       << " and " << result.channelsLabel() << "\n";

    for (int i = 0; i < static_cast<int>(result.histograms.size()); i++) {
        const JointHistogram& hist = result.histograms[static_cast<size_t>(i)];
        os << "Slice " << (i + 1) << "\n";

        // Header row: empty corner cell, then the channel-2 intensities
        for (int z2 = 0; z2 < kIntensityLevels; z2++) {
            os << '\t' << z2;
        }
        os << "\n";

        for (int z1 = 0; z1 < kIntensityLevels; z1++) {
            os << z1;
            for (int z2 = 0; z2 < kIntensityLevels; z2++) {
                os << '\t' << (hist.count(z1, z2) + 1) << ".0";
            }
            os << "\n";
        }
        os << "\n";
    }
}

void writeMetadata(std::ostream& os, const PairResult& result)
{
    os << "Image 1 information\n"
       << "Name:\t" << result.image1Title << "\n"
       << "Path:\t" << result.image1Path.string() << "\n"
       << "Channel:\t" << result.channel1.label << "\n"
       << "Threshold:\t" << result.channel1.threshold << "\n"
       << "\n"
       << "Image 2 information\n"
       << "Name:\t" << result.image2Title << "\n"
       << "Path:\t" << result.image2Path.string() << "\n"
       << "Channel:\t" << result.channel2.label << "\n"
       << "Threshold:\t" << result.channel2.threshold << "\n"
       << "Pearson correlation:\t";
    for (const auto& s : result.slices) {
        os << formatDecimal(s.pearson, 5) << "\t";
    }
    os << "\n";
}

std::string resultFileStem(const PairResult& result)
{
    return result.image1Title + "_vs_" + result.image2Title + "__" +
           result.channel1.label + "_vs_" + result.channel2.label;
}

std::vector<fs::path> resultFolders(const PairResult& result, const SaveOptions& options)
{
    const std::string date = formatTime(options.timestamp, "%Y-%m-%d");
    const std::string time = formatTime(options.timestamp, "%H-%M-%S");

    std::vector<fs::path> folders;
    if (options.outputRoot) {
        folders.push_back(*options.outputRoot / date / time);
        return folders;
    }

    for (const fs::path& source : {result.image1Path, result.image2Path}) {
        if (source.empty()) {
            continue;
        }
        fs::path folder = source.parent_path() / options.folderName / date / time;
        if (std::find(folders.begin(), folders.end(), folder) == folders.end()) {
            folders.push_back(std::move(folder));
        }
    }
    return folders;
}

std::vector<fs::path> saveResult(const PairResult& result, const SaveOptions& options)
{
    std::ostringstream metadata;
    writeMetadata(metadata, result);
    std::ostringstream matrix;
    writeMatrix(matrix, result);

    const std::string stem = resultFileStem(result);
    const auto folders = resultFolders(result, options);
    if (folders.empty()) {
        Logger()->warn("No source path or output folder for {}; results not saved", stem);
    }

    std::vector<fs::path> written;
    for (const auto& folder : folders) {
        std::error_code ec;
        fs::create_directories(folder, ec);
        if (ec) {
            throw std::runtime_error("Failed to create folder " + folder.string() + ": " + ec.message());
        }

        fs::path metadataPath = folder / ("Metadata_" + stem + ".txt");
        fs::path matrixPath = folder / ("Matrix_" + stem + ".txt");
        writeFile(metadataPath, metadata.str());
        writeFile(matrixPath, matrix.str());
        Logger()->info("Wrote {} and {}", metadataPath.string(), matrixPath.string());

        written.push_back(std::move(metadataPath));
        written.push_back(std::move(matrixPath));
    }
    return written;
}

void writeTable(const fs::path& path, const ReportTable& table)
{
    writeFile(path, table.toString());
    Logger()->info("Wrote {}", path.string());
}

std::vector<fs::path> writePlots(const fs::path& dir, const PairResult& result, bool includeColocMask)
{
    const std::string stem = resultFileStem(result);
    std::vector<fs::path> written;
    writeStackIfRendered(dir / ("ColorPlot_" + stem + ".tif"), result.quadrantPlots, written);
    writeStackIfRendered(dir / ("IntensityPlot_" + stem + ".tif"), result.intensityPlots, written);
    if (includeColocMask) {
        writeStackIfRendered(dir / ("Colocalization_" + stem + ".tif"), result.colocMasks, written);
    }
    return written;
}

}  // namespace coloc
