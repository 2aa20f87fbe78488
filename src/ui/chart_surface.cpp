#include <algorithm>
#include <cmath>
#include <wedge/chart_surface.hpp>
#include <wedge/logger.hpp>

namespace wedge
{

namespace
{

const std::vector<Slice>          empty_slices;
const SliceBoundaryTable          empty_boundaries;
const std::vector<LabelPlacement> empty_labels;

float sanitize_scale(float scale)
{
    return (std::isfinite(scale) && scale > 0.0f) ? scale : 1.0f;
}

}   // namespace

ChartSurface::ChartSurface(const ChartConfig& config)
    : config_(config), pixel_scale_(sanitize_scale(config.device_pixel_scale))
{
    tooltip_.font_scale = config_.tooltip_font_scale;
}

ChartSurface::~ChartSurface() = default;

ChartSurface::ChartSurface(ChartSurface&&) noexcept            = default;
ChartSurface& ChartSurface::operator=(ChartSurface&&) noexcept = default;

bool ChartSurface::initialize(ChartContainer& container, std::unique_ptr<DrawContext> context)
{
    if (!context)
    {
        WEDGE_LOG_ERROR("surface", "initialize() called without a draw context");
        return false;
    }

    container_ = &container;
    context_   = std::move(context);
    retained_.reset();
    hide_tooltip();

    resize();

    WEDGE_LOG_DEBUG("surface",
                    "ChartSurface initialized ({}x{} @ {}x)",
                    width_,
                    height_,
                    pixel_scale_);
    return true;
}

// ─── Sizing ─────────────────────────────────────────────────────────────────

void ChartSurface::resize()
{
    resize(pixel_scale_);
}

void ChartSurface::resize(float device_pixel_scale)
{
    if (!is_initialized())
    {
        WEDGE_LOG_WARN("surface", "resize() ignored: surface not initialized");
        return;
    }

    ContentBox box = container_->content_box();
    width_         = std::max(0.0f, box.width);
    height_        = std::max(0.0f, box.height);
    pixel_scale_   = sanitize_scale(device_pixel_scale);

    context_->set_backing_size(static_cast<uint32_t>(std::lround(width_ * pixel_scale_)),
                               static_cast<uint32_t>(std::lround(height_ * pixel_scale_)));
    context_->set_display_size(width_, height_);
    // Absolute, so repeated resizes never stack.
    context_->set_scale(pixel_scale_);
}

void ChartSurface::clear()
{
    if (!is_initialized())
        return;
    context_->clear_rect(0.0f, 0.0f, width_, height_);
}

// ─── Rendering ──────────────────────────────────────────────────────────────

bool ChartSurface::render(const ValueSet& values, const ColorPair& colors)
{
    if (!is_initialized())
    {
        WEDGE_LOG_WARN("surface", "render() called before initialize()");
        return false;
    }

    RetainedChart next;
    next.geometry = compute_geometry(width_, height_, config_.outline_width);
    const Point c = next.geometry.center;
    const float r = next.geometry.radius;

    context_->fill_circle(c.x, c.y, r + config_.outline_width, config_.outline_color);

    next.slices = compute_slices(values, colors[0], colors[1], config_.negligible_share);
    for (const auto& s : next.slices)
        context_->fill_wedge(c.x, c.y, r, s.start_angle, s.end_angle, s.color);

    DrawContext* ctx = context_.get();
    next.labels      = compute_label_placements(
        next.slices,
        c,
        r,
        [ctx](std::string_view text) { return ctx->measure_text(text); },
        config_.inline_label_min_angle);

    // Text goes last so no wedge can cover it.
    for (const auto& label : next.labels)
    {
        if (label.visible)
            context_->fill_text(label.label, label.x, label.y, config_.label_color);
    }

    next.boundaries = boundary_table(next.slices);

    WEDGE_LOG_TRACE("surface",
                    "Rendered {} slice(s) from {} value(s), radius {}",
                    next.slices.size(),
                    values.size(),
                    r);

    retained_ = std::move(next);
    return true;
}

// ─── Pointer handling ───────────────────────────────────────────────────────

void ChartSurface::on_pointer_move(const PointerEvent& event)
{
    if (!retained_ || !container_)
    {
        hide_tooltip();
        return;
    }

    ContentBox box = container_->content_box();
    Point      local{event.client_x - box.x, event.client_y - box.y};

    const auto& chart = *retained_;
    auto        index = slice_index_at(chart.boundaries,
                                chart.slices,
                                local,
                                chart.geometry.center,
                                chart.geometry.radius);

    if (index && *index < chart.labels.size() && !chart.labels[*index].visible)
        show_tooltip(chart.labels[*index]);
    else
        hide_tooltip();
}

void ChartSurface::on_pointer_leave()
{
    hide_tooltip();
}

void ChartSurface::show_tooltip(const LabelPlacement& placement)
{
    TooltipState next;
    next.visible    = true;
    next.text       = placement.label;
    next.left       = placement.x;
    next.top        = placement.y;
    next.font_scale = config_.tooltip_font_scale;
    publish_tooltip(std::move(next));
}

void ChartSurface::hide_tooltip()
{
    TooltipState next;
    next.font_scale = config_.tooltip_font_scale;
    publish_tooltip(std::move(next));
}

void ChartSurface::publish_tooltip(TooltipState next)
{
    if (next == tooltip_)
        return;
    tooltip_ = std::move(next);
    if (tooltip_cb_)
        tooltip_cb_(tooltip_);
}

// ─── Queries ────────────────────────────────────────────────────────────────

const std::vector<Slice>& ChartSurface::slices() const
{
    return retained_ ? retained_->slices : empty_slices;
}

const SliceBoundaryTable& ChartSurface::boundaries() const
{
    return retained_ ? retained_->boundaries : empty_boundaries;
}

const std::vector<LabelPlacement>& ChartSurface::labels() const
{
    return retained_ ? retained_->labels : empty_labels;
}

std::optional<ChartGeometry> ChartSurface::geometry() const
{
    if (!retained_)
        return std::nullopt;
    return retained_->geometry;
}

}   // namespace wedge
