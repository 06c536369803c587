#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "coloc/core/types/PairResult.hpp"
#include "coloc/core/util/Report.hpp"

namespace coloc {

// Joint histogram dump of every slice. Rows are channel-1 intensities,
// columns channel-2 intensities; each cell holds count + 1.
void writeMatrix(std::ostream& os, const PairResult& result);

// Image names, paths, channels, thresholds and per-slice Pearson values
void writeMetadata(std::ostream& os, const PairResult& result);

// "<img1>_vs_<img2>__<ch1>_vs_<ch2>"
std::string resultFileStem(const PairResult& result);

struct SaveOptions {
    // Subfolder created next to each source image
    std::string folderName = "colocalization_results";
    // If set, results go to <outputRoot>/<date>/<time> instead of next to the images
    std::optional<std::filesystem::path> outputRoot;
    // Shared by all pairs of one run so they land in the same folder
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// Folders a result is written to: <dir>/<folderName>/<yyyy-mm-dd>/<HH-MM-SS>
// for each distinct source directory, or the output root if one is given
std::vector<std::filesystem::path> resultFolders(const PairResult& result, const SaveOptions& options);

/**
 * Writes Metadata_<stem>.txt and Matrix_<stem>.txt into every folder
 * from resultFolders(), creating them as needed.
 *
 * @return the files written
 * @throws std::runtime_error if a folder or file cannot be written
 */
std::vector<std::filesystem::path> saveResult(const PairResult& result, const SaveOptions& options);

// Writes header and rows; throws std::runtime_error if the file cannot be written
void writeTable(const std::filesystem::path& path, const ReportTable& table);

/**
 * Writes the visualization stacks of a result into @p dir as multi-page
 * TIFFs: ColorPlot_<stem>.tif and IntensityPlot_<stem>.tif for the plots
 * that were rendered, Colocalization_<stem>.tif for the masks if
 * @p includeColocMask. A stack whose planes are all empty (not rendered
 * for this pass) is skipped.
 *
 * @return the files written
 * @throws std::runtime_error if a file cannot be written
 */
std::vector<std::filesystem::path> writePlots(const std::filesystem::path& dir, const PairResult& result,
                                              bool includeColocMask);

}  // namespace coloc
