#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <wedge/draw_context.hpp>

namespace wedge
{

// ─── Recorded commands ──────────────────────────────────────────────────────
// Coordinates are logical units. `scale` is the transform that was active when
// the command was issued.

struct ClearCmd
{
    float x = 0.0f, y = 0.0f, width = 0.0f, height = 0.0f;
    float scale = 1.0f;
};

struct CircleCmd
{
    float cx = 0.0f, cy = 0.0f, radius = 0.0f;
    Rgb   color = 0;
    float scale = 1.0f;
};

struct WedgeCmd
{
    float cx = 0.0f, cy = 0.0f, radius = 0.0f;
    float start_angle = 0.0f, end_angle = 0.0f;
    Rgb   color = 0;
    float scale = 1.0f;
};

struct TextCmd
{
    std::string text;
    float       x = 0.0f, y = 0.0f;
    Rgb         color = 0;
    float       scale = 1.0f;
};

using DrawCommand = std::variant<ClearCmd, CircleCmd, WedgeCmd, TextCmd>;

struct DisplayListConfig
{
    float font_size     = 12.0f;
    float glyph_advance = 0.6f;   // average advance as a fraction of font_size
};

// Headless DrawContext that keeps every command in memory. Used for SVG export
// and for inspecting what a chart drew.
class DisplayList : public DrawContext
{
   public:
    explicit DisplayList(const DisplayListConfig& config = {}) : config_(config) {}

    void  set_backing_size(uint32_t width_px, uint32_t height_px) override;
    void  set_display_size(float width, float height) override;
    void  set_scale(float scale) override;
    float scale() const override { return scale_; }

    void clear_rect(float x, float y, float width, float height) override;
    void fill_circle(float cx, float cy, float radius, Rgb color) override;
    void fill_wedge(float cx,
                    float cy,
                    float radius,
                    float start_angle,
                    float end_angle,
                    Rgb   color) override;
    void fill_text(std::string_view text, float x, float y, Rgb color) override;

    // Code points x font_size x glyph_advance.
    float measure_text(std::string_view text) const override;

    const std::vector<DrawCommand>& commands() const { return commands_; }

    template <typename T>
    size_t count() const
    {
        size_t n = 0;
        for (const auto& cmd : commands_)
        {
            if (std::holds_alternative<T>(cmd))
                ++n;
        }
        return n;
    }

    uint32_t backing_width() const { return backing_w_; }
    uint32_t backing_height() const { return backing_h_; }
    float    display_width() const { return display_w_; }
    float    display_height() const { return display_h_; }

    const DisplayListConfig& config() const { return config_; }

   private:
    DisplayListConfig        config_;
    std::vector<DrawCommand> commands_;
    uint32_t                 backing_w_ = 0;
    uint32_t                 backing_h_ = 0;
    float                    display_w_ = 0.0f;
    float                    display_h_ = 0.0f;
    float                    scale_     = 1.0f;
};

}   // namespace wedge
