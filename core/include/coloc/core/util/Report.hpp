#pragma once

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "coloc/core/types/PairResult.hpp"

namespace coloc {

// Tab-delimited results: one header line plus one line per row
struct ReportTable {
    std::string header;
    std::vector<std::string> rows;

    [[nodiscard]] bool empty() const { return rows.empty(); }
    [[nodiscard]] std::string toString() const;
};

// Column titles of one pair, tab separated with a trailing tab
const std::string& pairReportHeader();

// Fixed-point with @p precision decimals; NaN is written as "NaN"
std::string formatDecimal(double value, int precision);

// Pair title, slice number (1-based), channel label, three counts,
// three percentages (%.3f), two overlaps (%.5f), Pearson (%.3f).
// Every cell is followed by a tab so rows can be concatenated.
std::string formatReportRow(const PairResult& result, int sliceIndex);

std::vector<std::string> toTextRows(const PairResult& result);

/**
 * Adds @p rows to @p existing.
 *
 * Stacked mode appends them below. In one-row mode each new row is
 * appended to the right of the existing row with the same index; if the
 * counts differ only min(existing, rows) merged rows are kept and the
 * extra slices are dropped. An empty @p existing takes @p rows as is.
 */
std::vector<std::string> appendRows(std::vector<std::string> existing,
                                    const std::vector<std::string>& rows, bool inOneRow);

// Machine-readable summary of a pair (no image planes)
nlohmann::json toJson(const PairResult& result);

}  // namespace coloc
