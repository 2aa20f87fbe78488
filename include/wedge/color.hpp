#pragma once

#include <array>
#include <cstdint>
#include <cstdio>
#include <string>

namespace wedge
{

// 24-bit 0xRRGGBB color. The upper byte is always zero.
using Rgb = uint32_t;

// Start and end of a color ramp.
using ColorPair = std::array<Rgb, 2>;

inline constexpr uint32_t red(Rgb c)
{
    return (c & 0xFF0000u) >> 16;
}

inline constexpr uint32_t green(Rgb c)
{
    return (c & 0x00FF00u) >> 8;
}

inline constexpr uint32_t blue(Rgb c)
{
    return c & 0x0000FFu;
}

inline constexpr Rgb pack_rgb(uint32_t r, uint32_t g, uint32_t b)
{
    return ((r & 0xFFu) << 16) | ((g & 0xFFu) << 8) | (b & 0xFFu);
}

// Channel-wise linear interpolation. The ratio is not clamped: values outside
// [0, 1] extrapolate and each channel wraps to its low 8 bits. Channel values
// saturate at the int32_t range (NaN counts as the low end) before wrapping.
inline constexpr Rgb lerp_color(Rgb from, Rgb to, float ratio)
{
    auto channel = [ratio](uint32_t a, uint32_t b)
    {
        constexpr float lo = -2147483648.0f;
        constexpr float hi = 2147483520.0f;   // largest float below 2^31

        float v = static_cast<float>(a)
                  + ratio * (static_cast<float>(b) - static_cast<float>(a));
        if (!(v >= lo))
            v = lo;
        else if (v > hi)
            v = hi;
        return static_cast<uint32_t>(static_cast<int32_t>(v));
    };
    return pack_rgb(channel(red(from), red(to)),
                    channel(green(from), green(to)),
                    channel(blue(from), blue(to)));
}

// "#rrggbb"
inline std::string to_hex(Rgb c)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%06x", static_cast<unsigned>(c & 0xFFFFFFu));
    return buf;
}

// Named ramps for the resource breakdown charts.
namespace ramps
{
inline constexpr ColorPair land{0xB7FF7A, 0x0E681F};
inline constexpr ColorPair water{0x7DE1EF, 0x4560FF};
inline constexpr ColorPair energy{0xFDCE4C, 0xE81224};
inline constexpr ColorPair emissions{0xF2F7E2, 0x6CB30B};
inline constexpr ColorPair biodiversity{0xEA8BCF, 0x6865F8};
inline constexpr ColorPair electricity{0xFFFF1A, 0xFF8C1A};
inline constexpr ColorPair fuel{0xF7F6C7, 0xD3753F};
inline constexpr ColorPair animal_calories{0xF8AD72, 0xCA5704};
inline constexpr ColorPair plant_calories{0xB1EF8F, 0x06CA9B};
inline constexpr ColorPair contentedness{0x000000, 0xFFFFFF};
}   // namespace ramps

}   // namespace wedge
