#include "coloc/core/util/Report.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace coloc {

namespace {

nlohmann::json numberOrNull(double v)
{
    if (std::isnan(v)) {
        return nullptr;
    }
    return v;
}

}  // namespace

std::string ReportTable::toString() const
{
    std::ostringstream oss;
    oss << header << "\n";
    for (const auto& row : rows) {
        oss << row << "\n";
    }
    return oss.str();
}

const std::string& pairReportHeader()
{
    static const std::string header =
        "Image titles for colocalization\tSlice #\tCh1 vs Ch2\t"
        "Ch1 pixels\tCh2 pixels\tColoc pixels\t"
        "Percent Ch1\tPercent Ch2\tPercent Coloc\t"
        "Ch1 Overlap Ch2\tCh2 Overlap Ch1\tPearson\t";
    return header;
}

std::string formatDecimal(double value, int precision)
{
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string formatReportRow(const PairResult& result, int sliceIndex)
{
    const SliceStatistics& s = result.slices.at(static_cast<size_t>(sliceIndex));

    std::ostringstream oss;
    oss << result.imagesLabel() << '\t'
        << (sliceIndex + 1) << '\t'
        << result.channelsLabel() << '\t'
        << s.counts.channel1Only << '\t'
        << s.counts.channel2Only << '\t'
        << s.counts.colocalized << '\t'
        << formatDecimal(s.percentChannel1Only, 3) << '\t'
        << formatDecimal(s.percentChannel2Only, 3) << '\t'
        << formatDecimal(s.percentColocalized, 3) << '\t'
        << formatDecimal(s.channel1OverlapChannel2, 5) << '\t'
        << formatDecimal(s.channel2OverlapChannel1, 5) << '\t'
        << formatDecimal(s.pearson, 3) << '\t';
    return oss.str();
}

std::vector<std::string> toTextRows(const PairResult& result)
{
    std::vector<std::string> rows;
    rows.reserve(result.slices.size());
    for (int i = 0; i < result.numSlices(); i++) {
        rows.push_back(formatReportRow(result, i));
    }
    return rows;
}

std::vector<std::string> appendRows(std::vector<std::string> existing,
                                    const std::vector<std::string>& rows, bool inOneRow)
{
    if (!inOneRow || existing.empty()) {
        existing.insert(existing.end(), rows.begin(), rows.end());
        return existing;
    }

    const size_t n = std::min(existing.size(), rows.size());
    existing.resize(n);
    for (size_t i = 0; i < n; i++) {
        existing[i] += rows[i];
    }
    return existing;
}

nlohmann::json toJson(const PairResult& result)
{
    nlohmann::json j;
    j["image1"] = {{"title", result.image1Title}, {"path", result.image1Path.string()}};
    j["image2"] = {{"title", result.image2Title}, {"path", result.image2Path.string()}};
    j["channel1"] = {{"label", result.channel1.label}, {"threshold", result.channel1.threshold}};
    j["channel2"] = {{"label", result.channel2.label}, {"threshold", result.channel2.threshold}};
    j["width"] = result.planeSize.width;
    j["height"] = result.planeSize.height;

    nlohmann::json slices = nlohmann::json::array();
    for (int i = 0; i < result.numSlices(); i++) {
        const SliceStatistics& s = result.slices[static_cast<size_t>(i)];
        slices.push_back({
            {"slice", i + 1},
            {"below_both", s.counts.belowBoth},
            {"channel1_only", s.counts.channel1Only},
            {"channel2_only", s.counts.channel2Only},
            {"colocalized", s.counts.colocalized},
            {"max_count", s.maxCount},
            {"percent_channel1_only", numberOrNull(s.percentChannel1Only)},
            {"percent_channel2_only", numberOrNull(s.percentChannel2Only)},
            {"percent_colocalized", numberOrNull(s.percentColocalized)},
            {"channel1_overlap_channel2", numberOrNull(s.channel1OverlapChannel2)},
            {"channel2_overlap_channel1", numberOrNull(s.channel2OverlapChannel1)},
            {"pearson", numberOrNull(s.pearson)},
        });
    }
    j["slices"] = std::move(slices);
    return j;
}

}  // namespace coloc
