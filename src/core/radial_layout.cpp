#include <algorithm>
#include <cmath>
#include <numbers>
#include <wedge/logger.hpp>
#include <wedge/radial_layout.hpp>

namespace wedge
{

ChartGeometry compute_geometry(float width, float height, float outline_width)
{
    ChartGeometry g;
    g.center = {width * 0.5f, height * 0.5f};
    g.radius = std::max(0.0f, std::min(width, height) * 0.5f - outline_width * 2.0f);
    return g;
}

std::vector<Slice> compute_slices(const ValueSet& values, Rgb from, Rgb to, double min_share)
{
    std::vector<Slice> slices;

    double total   = values.total();
    double divisor = 1.0;
    if (std::isinf(total))
    {
        // Finite values whose sum overflows: work in units of the largest value.
        for (const auto& entry : values)
            divisor = std::max(divisor, entry.second);
        total = 0.0;
        for (const auto& entry : values)
            total += entry.second / divisor;
        WEDGE_LOG_DEBUG("layout", "Value total overflows, rescaled by {}", divisor);
    }
    if (!(total > 0.0))
        return slices;

    auto magnitude = [divisor](const ValueSet::Entry& entry) { return entry.second / divisor; };

    // First pass: drop slivers against the full total.
    std::vector<const ValueSet::Entry*> survivors;
    survivors.reserve(values.size());
    for (const auto& entry : values)
    {
        if (magnitude(entry) / total >= min_share)
            survivors.push_back(&entry);
    }

    // Second pass: shares are taken against what is left.
    double kept_total = 0.0;
    for (const auto* entry : survivors)
        kept_total += magnitude(*entry);
    if (!(kept_total > 0.0))
        return slices;

    if (survivors.size() < values.size())
    {
        WEDGE_LOG_DEBUG("layout",
                        "Dropped {} negligible label(s) of {}",
                        values.size() - survivors.size(),
                        values.size());
    }

    const auto n          = survivors.size();
    double     cumulative = 0.0;
    float      last_angle = 0.0f;
    slices.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        cumulative += magnitude(*survivors[i]);

        // End angles come from the running share so the final boundary lands on
        // exactly one full turn.
        float end_angle = (i + 1 == n)
                              ? TWO_PI
                              : static_cast<float>(2.0 * std::numbers::pi * cumulative / kept_total);
        end_angle = std::max(end_angle, last_angle);

        Slice s;
        s.label       = survivors[i]->first;
        s.start_angle = last_angle;
        s.end_angle   = end_angle;
        s.color = lerp_color(from, to, static_cast<float>(i) / static_cast<float>(n));
        slices.push_back(std::move(s));

        last_angle = end_angle;
    }
    return slices;
}

SliceBoundaryTable boundary_table(const std::vector<Slice>& slices)
{
    SliceBoundaryTable table;
    table.reserve(slices.size());
    for (const auto& s : slices)
        table.push_back(s.end_angle);
    return table;
}

std::vector<LabelPlacement> compute_label_placements(const std::vector<Slice>& slices,
                                                     Point                     center,
                                                     float                     radius,
                                                     const TextWidthFn&        text_width,
                                                     float                     min_inline_angle)
{
    std::vector<LabelPlacement> placements;
    placements.reserve(slices.size());

    const float half_r = radius * 0.5f;
    for (const auto& s : slices)
    {
        float angle = s.bisector();
        float w     = text_width ? text_width(s.label) : 0.0f;

        LabelPlacement p;
        p.label   = s.label;
        p.x       = center.x + half_r * std::cos(angle) - w * 0.5f;
        p.y       = center.y + half_r * std::sin(angle);
        p.visible = s.width() > min_inline_angle;
        placements.push_back(std::move(p));
    }
    return placements;
}

std::optional<size_t> slice_index_at(const SliceBoundaryTable& boundaries,
                                     const std::vector<Slice>& slices,
                                     Point                     point,
                                     Point                     center,
                                     float                     radius)
{
    float dx = point.x - center.x;
    float dy = point.y - center.y;
    if (std::sqrt(dx * dx + dy * dy) >= radius)
        return std::nullopt;

    float angle = std::fmod(std::atan2(dy, dx) + TWO_PI, TWO_PI);

    auto it = std::lower_bound(boundaries.begin(), boundaries.end(), angle);
    if (it == boundaries.end())
        return std::nullopt;

    auto index = static_cast<size_t>(it - boundaries.begin());
    if (index >= slices.size())
        return std::nullopt;
    return index;
}

const Slice* slice_at(const SliceBoundaryTable& boundaries,
                      const std::vector<Slice>& slices,
                      Point                     point,
                      Point                     center,
                      float                     radius)
{
    auto index = slice_index_at(boundaries, slices, point, center, radius);
    return index ? &slices[*index] : nullptr;
}

}   // namespace wedge
