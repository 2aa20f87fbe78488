#pragma once

#include <cstddef>
#include <functional>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <wedge/color.hpp>
#include <wedge/value_set.hpp>

namespace wedge
{

// Pure geometry for radial charts: value -> slice layout, label anchors and
// point -> slice lookup. Nothing here draws.

inline constexpr float  TWO_PI                 = 2.0f * std::numbers::pi_v<float>;
inline constexpr double NEGLIGIBLE_SHARE       = 0.01;
inline constexpr float  INLINE_LABEL_MIN_ANGLE = std::numbers::pi_v<float> / 12.0f;

struct Point
{
    float x = 0.0f;
    float y = 0.0f;
};

struct ChartGeometry
{
    Point center;
    float radius = 0.0f;
};

struct Slice
{
    std::string label;
    float       start_angle = 0.0f;   // radians, clockwise in screen space from +x
    float       end_angle   = 0.0f;
    Rgb         color       = 0;

    float width() const { return end_angle - start_angle; }
    float bisector() const { return start_angle + width() * 0.5f; }
};

struct LabelPlacement
{
    std::string label;
    float       x       = 0.0f;   // text origin, already shifted left by half the text width
    float       y       = 0.0f;
    bool        visible = false;   // wide enough to be drawn inline
};

// Cumulative end angles, one per slice, ascending.
using SliceBoundaryTable = std::vector<float>;

using TextWidthFn = std::function<float(std::string_view)>;

// Centered disc inside a width x height surface, inset by twice the outline width.
ChartGeometry compute_geometry(float width, float height, float outline_width);

// Drops labels below min_share of the total, then lays the survivors out around
// the full turn in insertion order. Colors ramp from -> to across the
// survivors. Returns an empty layout when nothing survives.
std::vector<Slice> compute_slices(const ValueSet& values,
                                  Rgb             from,
                                  Rgb             to,
                                  double          min_share = NEGLIGIBLE_SHARE);

SliceBoundaryTable boundary_table(const std::vector<Slice>& slices);

std::vector<LabelPlacement> compute_label_placements(const std::vector<Slice>& slices,
                                                     Point                     center,
                                                     float                     radius,
                                                     const TextWidthFn&        text_width,
                                                     float min_inline_angle = INLINE_LABEL_MIN_ANGLE);

// Index of the slice under point, or nullopt when the point lies on or outside
// the rim or past the last boundary.
std::optional<size_t> slice_index_at(const SliceBoundaryTable& boundaries,
                                     const std::vector<Slice>& slices,
                                     Point                     point,
                                     Point                     center,
                                     float                     radius);

const Slice* slice_at(const SliceBoundaryTable& boundaries,
                      const std::vector<Slice>& slices,
                      Point                     point,
                      Point                     center,
                      float                     radius);

}   // namespace wedge
