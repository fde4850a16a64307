#include <iostream>
#include <lumaplot/lumaplot.hpp>
#include <string>
#include <vector>

using namespace lumaplot;

// Renders every marker shape and line pattern headless and prints the
// coverage as text, darker characters for higher alpha.

static void print_coverage(const Image& image, int repeat_x)
{
    static const char ramp[] = " .:-=+*#%@";

    for (uint32_t y = 0; y < image.height; ++y)
    {
        std::string row;
        for (uint32_t x = 0; x < image.width; ++x)
        {
            size_t i = (static_cast<size_t>(y) * image.width + x) * 4;
            row.append(repeat_x, ramp[image.rgba[i + 3] * 9 / 255]);
        }
        std::cout << row << "\n";
    }
    std::cout << "\n";
}

int main()
{
    Logger::instance().set_level(log_level_from_env(LogLevel::Warning));
    Logger::instance().add_sink(sinks::console_sink());

    RenderConfig config;
    config.clear_color = colors::transparent;

    // ─── Markers ────────────────────────────────────────────────────────────

    for (auto shape : ALL_MARKER_SHAPES)
    {
        PlotFrame frame;
        frame.uniforms.viewport_size = {24.0f, 24.0f};
        frame.uniforms.padding       = {0.0f, 0.0f};
        frame.uniforms.marker_radius = 10.0f;

        PointInstance p;
        p.position = {0.5f, 0.5f};
        p.color    = colors::black;
        p.shape    = to_tag(shape);
        frame.points.push_back(p);

        Image image = render_offscreen(frame, config);
        if (image.empty())
        {
            LUMAPLOT_LOG_ERROR("example", "Failed to render marker {}", marker_shape_name(shape));
            return 1;
        }

        std::cout << marker_shape_name(shape) << " (tag " << to_tag(shape) << ")\n";
        print_coverage(image, 2);
    }

    // ─── Line patterns ──────────────────────────────────────────────────────

    PlotOptions opts;
    opts.padding      = {0.0f, 0.0f};
    opts.line_width   = 2.0f;
    opts.show_markers = false;
    opts.x_range      = Range{0.0f, 1.0f};
    opts.y_range      = Range{0.0f, 1.0f};

    for (auto pattern : ALL_LINE_PATTERNS)
    {
        PlotSeries s;
        s.label  = line_pattern_name(pattern);
        s.color  = colors::black;
        s.marker = MarkerShape::None;
        s.line   = pattern;
        s.points = {{0.0, 0.5}, {1.0, 0.5}};

        std::vector<PlotSeries> series = {s};
        PlotFrame               frame  = build_frame(series, 72.0f, 4.0f, opts);

        Image image = render_offscreen(frame, config);
        if (image.empty())
        {
            LUMAPLOT_LOG_ERROR("example", "Failed to render line {}", line_pattern_name(pattern));
            return 1;
        }

        std::cout << line_pattern_name(pattern) << " (tag " << to_tag(pattern) << ")\n";
        print_coverage(image, 1);
    }
    return 0;
}
