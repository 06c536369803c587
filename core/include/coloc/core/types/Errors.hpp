#pragma once

#include <stdexcept>
#include <string>

#include <opencv2/core.hpp>

namespace coloc {

// Two planes or stacks that must be compared pixel by pixel differ in size
class DimensionMismatch : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or out-of-range configuration value
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline void requireSameSize(const cv::Size& a, const cv::Size& b, const std::string& context)
{
    if (a != b) {
        throw DimensionMismatch(context + " are not of the same pixel size (" +
                                std::to_string(a.width) + "x" + std::to_string(a.height) + " vs " +
                                std::to_string(b.width) + "x" + std::to_string(b.height) + ")");
    }
}

}  // namespace coloc
