#include <wedge/display_list.hpp>

namespace wedge
{

void DisplayList::set_backing_size(uint32_t width_px, uint32_t height_px)
{
    backing_w_ = width_px;
    backing_h_ = height_px;
}

void DisplayList::set_display_size(float width, float height)
{
    display_w_ = width;
    display_h_ = height;
}

void DisplayList::set_scale(float scale)
{
    scale_ = scale;
}

void DisplayList::clear_rect(float x, float y, float width, float height)
{
    // A clear over the whole surface leaves nothing visible underneath.
    if (x <= 0.0f && y <= 0.0f && x + width >= display_w_ && y + height >= display_h_)
    {
        commands_.clear();
        return;
    }
    commands_.push_back(ClearCmd{x, y, width, height, scale_});
}

void DisplayList::fill_circle(float cx, float cy, float radius, Rgb color)
{
    commands_.push_back(CircleCmd{cx, cy, radius, color, scale_});
}

void DisplayList::fill_wedge(float cx,
                             float cy,
                             float radius,
                             float start_angle,
                             float end_angle,
                             Rgb   color)
{
    commands_.push_back(WedgeCmd{cx, cy, radius, start_angle, end_angle, color, scale_});
}

void DisplayList::fill_text(std::string_view text, float x, float y, Rgb color)
{
    commands_.push_back(TextCmd{std::string(text), x, y, color, scale_});
}

float DisplayList::measure_text(std::string_view text) const
{
    size_t code_points = 0;
    for (char c : text)
    {
        // Skip UTF-8 continuation bytes.
        if ((static_cast<unsigned char>(c) & 0xC0u) != 0x80u)
            ++code_points;
    }
    return static_cast<float>(code_points) * config_.font_size * config_.glyph_advance;
}

}   // namespace wedge
