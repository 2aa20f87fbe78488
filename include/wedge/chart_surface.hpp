#pragma once

// ─── ChartSurface ───────────────────────────────────────────────────────────
//
// A pie chart bound to a host container and a DrawContext.
//
//   MyContainer container;                       // implements ChartContainer
//   wedge::ChartSurface chart({.device_pixel_scale = 2.0f});
//   chart.initialize(container, std::make_unique<wedge::DisplayList>());
//
//   chart.clear();
//   chart.render({{"Coal", 40}, {"Solar", 12}, {"Wind", 9}}, wedge::ramps::energy);
//
//   // Host forwards pointer moves in its own client coordinates:
//   chart.on_pointer_move({mouse_x, mouse_y});
//   if (chart.tooltip().visible) ...
//
// ─────────────────────────────────────────────────────────────────────────────

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <wedge/color.hpp>
#include <wedge/draw_context.hpp>
#include <wedge/radial_layout.hpp>
#include <wedge/value_set.hpp>

namespace wedge
{

// ─── Host interface ─────────────────────────────────────────────────────────

// Content box of the host element in the same client coordinates the host
// uses for pointer events.
struct ContentBox
{
    float x      = 0.0f;
    float y      = 0.0f;
    float width  = 0.0f;
    float height = 0.0f;
};

class ChartContainer
{
   public:
    virtual ~ChartContainer()              = default;
    virtual ContentBox content_box() const = 0;
};

struct PointerEvent
{
    float client_x = 0.0f;
    float client_y = 0.0f;
};

// Floating label for slices too narrow to carry their label inline.
// left/top are surface-local logical units.
struct TooltipState
{
    bool        visible = false;
    std::string text;
    float       left       = 0.0f;
    float       top        = 0.0f;
    float       font_scale = 0.65f;   // relative to the chart font size

    bool operator==(const TooltipState&) const = default;
};

using TooltipCallback = std::function<void(const TooltipState&)>;

// ─── Configuration ──────────────────────────────────────────────────────────

struct ChartConfig
{
    // Device pixels per logical unit (2.0 on HiDPI). Values <= 0 mean unknown
    // and fall back to 1.
    float device_pixel_scale = 1.0f;

    float outline_width = 1.0f;
    Rgb   outline_color = 0x222222;
    Rgb   label_color   = 0x000000;
    float font_size     = 12.0f;

    float tooltip_font_scale = 0.65f;

    double negligible_share       = NEGLIGIBLE_SHARE;
    float  inline_label_min_angle = INLINE_LABEL_MIN_ANGLE;
};

// ─── ChartSurface ───────────────────────────────────────────────────────────

class ChartSurface
{
   public:
    explicit ChartSurface(const ChartConfig& config = {});
    ~ChartSurface();

    ChartSurface(const ChartSurface&)            = delete;
    ChartSurface& operator=(const ChartSurface&) = delete;
    ChartSurface(ChartSurface&&) noexcept;
    ChartSurface& operator=(ChartSurface&&) noexcept;

    // Binds the container (which must outlive the surface) and takes the
    // backing context, then sizes it. Returns false if context is null.
    bool initialize(ChartContainer& container, std::unique_ptr<DrawContext> context);
    bool is_initialized() const { return container_ != nullptr && context_ != nullptr; }

    // Re-reads the container size and rescales the backing surface. Safe to
    // call any number of times. Without an argument the last scale is kept
    // (ChartConfig::device_pixel_scale until a host passes one).
    void resize();
    void resize(float device_pixel_scale);

    void clear();

    // Draws background disc, wedges, then inline labels. Hit-test data from
    // the previous render is replaced only once drawing has finished.
    bool render(const ValueSet& values, const ColorPair& colors);

    void on_pointer_move(const PointerEvent& event);
    void on_pointer_leave();

    const TooltipState& tooltip() const { return tooltip_; }
    void                set_tooltip_callback(TooltipCallback cb) { tooltip_cb_ = std::move(cb); }

    // ── Retained state of the last render ───────────────────────────────

    bool                               has_rendered() const { return retained_.has_value(); }
    const std::vector<Slice>&          slices() const;
    const SliceBoundaryTable&          boundaries() const;
    const std::vector<LabelPlacement>& labels() const;
    std::optional<ChartGeometry>       geometry() const;

    // ── Properties ──────────────────────────────────────────────────────

    float width() const { return width_; }
    float height() const { return height_; }
    float device_pixel_scale() const { return pixel_scale_; }

    DrawContext*       context() { return context_.get(); }
    const DrawContext* context() const { return context_.get(); }

    const ChartConfig& config() const { return config_; }

   private:
    struct RetainedChart
    {
        ChartGeometry               geometry;
        std::vector<Slice>          slices;
        SliceBoundaryTable          boundaries;
        std::vector<LabelPlacement> labels;
    };

    void show_tooltip(const LabelPlacement& placement);
    void hide_tooltip();
    void publish_tooltip(TooltipState next);

    ChartConfig                  config_;
    ChartContainer*              container_ = nullptr;
    std::unique_ptr<DrawContext> context_;

    float width_       = 0.0f;
    float height_      = 0.0f;
    float pixel_scale_ = 1.0f;

    std::optional<RetainedChart> retained_;

    TooltipState    tooltip_;
    TooltipCallback tooltip_cb_;
};

}   // namespace wedge
