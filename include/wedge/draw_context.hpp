#pragma once

#include <cstdint>
#include <string_view>
#include <wedge/color.hpp>

namespace wedge
{

// Backing surface a chart draws into. All drawing coordinates are logical
// (unscaled) units; the backend maps them to device pixels using the scale set
// by set_scale().
class DrawContext
{
   public:
    virtual ~DrawContext() = default;

    // Device pixel size of the backing store.
    virtual void set_backing_size(uint32_t width_px, uint32_t height_px) = 0;

    // Size the surface is displayed at, in logical units.
    virtual void set_display_size(float width, float height) = 0;

    // Replaces the current transform with a uniform scale. Never composes with
    // a previously set scale.
    virtual void  set_scale(float scale) = 0;
    virtual float scale() const          = 0;

    virtual void clear_rect(float x, float y, float width, float height) = 0;

    virtual void fill_circle(float cx, float cy, float radius, Rgb color) = 0;

    // Pie wedge from start_angle to end_angle (radians, clockwise in screen
    // space), closed through the center.
    virtual void fill_wedge(float cx,
                            float cy,
                            float radius,
                            float start_angle,
                            float end_angle,
                            Rgb   color) = 0;

    // (x, y) is the left end of the text baseline.
    virtual void fill_text(std::string_view text, float x, float y, Rgb color) = 0;

    virtual float measure_text(std::string_view text) const = 0;
};

}   // namespace wedge
