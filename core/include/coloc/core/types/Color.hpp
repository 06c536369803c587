#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

namespace coloc {

// 8-bit RGB triple. Planes store colours in OpenCV's BGR order (see toBgr).
struct RgbColor {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};

    constexpr RgbColor() = default;
    constexpr RgbColor(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    static constexpr RgbColor fromHex(uint32_t rgb)
    {
        return {static_cast<uint8_t>((rgb >> 16) & 0xFF),
                static_cast<uint8_t>((rgb >> 8) & 0xFF),
                static_cast<uint8_t>(rgb & 0xFF)};
    }

    [[nodiscard]] cv::Vec3b toBgr() const { return {b, g, r}; }

    bool operator==(const RgbColor&) const = default;
};

namespace colors {

inline constexpr RgbColor White = RgbColor::fromHex(0xFFFFFF);
inline constexpr RgbColor Red = RgbColor::fromHex(0xFF0000);
inline constexpr RgbColor Green = RgbColor::fromHex(0x00FF00);
inline constexpr RgbColor Blue = RgbColor::fromHex(0x0000FF);
inline constexpr RgbColor Black = RgbColor::fromHex(0x000000);
inline constexpr RgbColor Gray = RgbColor::fromHex(0x808080);
inline constexpr RgbColor Orange = RgbColor::fromHex(0xFF8000);

}  // namespace colors

}  // namespace coloc
