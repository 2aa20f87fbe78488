#include <cmath>
#include <cstdio>
#include <fstream>
#include <numbers>
#include <sstream>
#include <type_traits>
#include <wedge/display_list.hpp>
#include <wedge/export.hpp>
#include <wedge/logger.hpp>
#include <wedge/radial_layout.hpp>

namespace wedge
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

// Compact number formatting (no trailing zeros)
std::string fmt(float v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", static_cast<double>(v));
    return buf;
}

std::string xml_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

void emit_circle(std::ostringstream& svg, float cx, float cy, float r, Rgb color)
{
    svg << "  <circle cx=\"" << fmt(cx) << "\" cy=\"" << fmt(cy) << "\" r=\"" << fmt(r)
        << "\" fill=\"" << to_hex(color) << "\"/>\n";
}

void emit_wedge(std::ostringstream& svg, const WedgeCmd& w)
{
    float span = w.end_angle - w.start_angle;
    if (span <= 0.0f || w.radius <= 0.0f)
        return;

    // An arc cannot start and end on the same point, so a full turn is a circle.
    if (span >= TWO_PI - 1e-4f)
    {
        emit_circle(svg, w.cx, w.cy, w.radius, w.color);
        return;
    }

    float x0    = w.cx + w.radius * std::cos(w.start_angle);
    float y0    = w.cy + w.radius * std::sin(w.start_angle);
    float x1    = w.cx + w.radius * std::cos(w.end_angle);
    float y1    = w.cy + w.radius * std::sin(w.end_angle);
    int   large = span > std::numbers::pi_v<float> ? 1 : 0;

    svg << "  <path d=\"M" << fmt(w.cx) << "," << fmt(w.cy) << " L" << fmt(x0) << "," << fmt(y0)
        << " A" << fmt(w.radius) << "," << fmt(w.radius) << " 0 " << large << ",1 " << fmt(x1)
        << "," << fmt(y1) << " Z\" fill=\"" << to_hex(w.color) << "\"/>\n";
}

void emit_text(std::ostringstream& svg, const TextCmd& t, float font_size)
{
    svg << "  <text x=\"" << fmt(t.x) << "\" y=\"" << fmt(t.y)
        << "\" font-family=\"sans-serif\" font-size=\"" << fmt(font_size) << "\" fill=\""
        << to_hex(t.color) << "\">" << xml_escape(t.text) << "</text>\n";
}

}   // anonymous namespace

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::to_string(const DisplayList& list)
{
    std::ostringstream svg;

    float w = list.display_width();
    float h = list.display_height();

    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << fmt(w) << "\" height=\""
        << fmt(h) << "\" viewBox=\"0 0 " << fmt(w) << " " << fmt(h) << "\">\n";

    for (const auto& cmd : list.commands())
    {
        std::visit(
            [&](const auto& c)
            {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, CircleCmd>)
                    emit_circle(svg, c.cx, c.cy, c.radius, c.color);
                else if constexpr (std::is_same_v<T, WedgeCmd>)
                    emit_wedge(svg, c);
                else if constexpr (std::is_same_v<T, TextCmd>)
                    emit_text(svg, c, list.config().font_size);
                // SVG has no erase primitive; partial clears are not exported.
            },
            cmd);
    }

    svg << "</svg>\n";
    return svg.str();
}

bool SvgExporter::write_svg(const std::string& path, const DisplayList& list)
{
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file)
    {
        WEDGE_LOG_ERROR("export", "Cannot open '{}' for writing", path);
        return false;
    }

    file << to_string(list);
    if (!file)
    {
        WEDGE_LOG_ERROR("export", "Failed while writing '{}'", path);
        return false;
    }

    WEDGE_LOG_INFO("export", "Wrote SVG '{}' ({} commands)", path, list.commands().size());
    return true;
}

}   // namespace wedge
