#include <cmath>
#include <iostream>
#include <lumaplot/lumaplot.hpp>
#include <string>
#include <vector>

using namespace lumaplot;

int main(int argc, char** argv)
{
    const std::string path = argc > 1 ? argv[1] : "lumaplot_output.png";

    LogConfig log;
    log.level = log_level_from_env(LogLevel::Info);
    configure_logging(log);

    auto signal = PlotSeries::from_function(
        "signal",
        rgb(0.1f, 0.7f, 0.3f),
        [](double x) { return std::sin(x) * std::cos(x * 0.5); },
        0.0,
        10.0,
        120);
    signal.marker = MarkerShape::Circle;

    auto envelope = PlotSeries::from_function(
        "envelope", rgb(0.8f, 0.2f, 0.2f), [](double x) { return std::cos(x * 0.5); }, 0.0, 10.0, 60);
    envelope.marker = MarkerShape::None;
    envelope.line   = LinePattern::Dashed;

    std::vector<PlotSeries> series = {signal, envelope};

    PlotOptions opts;
    opts.marker_radius = 3.0f;
    opts.y_range       = Range{-1.2f, 1.2f};

    PlotFrame frame = build_frame(series, 1280.0f, 720.0f, opts);
    Image     image = render_offscreen(frame);
    if (image.empty())
    {
        std::cerr << "Render failed\n";
        return 1;
    }

    if (!ImageExporter::write_png(path, image))
    {
        std::cerr << "Could not write " << path << "\n";
        return 1;
    }

    std::cout << "Saved " << path << " (" << frame.point_count() << " markers, "
              << frame.line_vertex_count() << " line vertices)\n";
    return 0;
}
