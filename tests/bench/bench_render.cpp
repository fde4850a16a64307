#include <benchmark/benchmark.h>
#include <cmath>
#include <lumaplot/frame.hpp>
#include <lumaplot/logger.hpp>
#include <lumaplot/offscreen.hpp>
#include <lumaplot/series.hpp>
#include <vector>

#include "core/line_tessellator.hpp"

using namespace lumaplot;

// ─── Data generation helpers ────────────────────────────────────────────────

static PlotSeries sine_series(size_t n, MarkerShape marker, LinePattern line)
{
    PlotSeries s = PlotSeries::from_function(
        "bench", colors::blue, [](double x) { return std::sin(x * 0.1); }, 0.0, 100.0, n);
    s.marker = marker;
    s.line   = line;
    return s;
}

static std::vector<Vec2> screen_polyline(size_t n)
{
    std::vector<Vec2> pts(n);
    for (size_t i = 0; i < n; ++i)
    {
        float t = static_cast<float>(i) / static_cast<float>(n);
        pts[i]  = {t * 1280.0f, 360.0f + 200.0f * std::sin(t * 40.0f)};
    }
    return pts;
}

// ─── Frame building ─────────────────────────────────────────────────────────

static void BM_BuildFrame(benchmark::State& state)
{
    std::vector<PlotSeries> series = {
        sine_series(static_cast<size_t>(state.range(0)), MarkerShape::Circle, LinePattern::Solid)};

    for (auto _ : state)
    {
        PlotFrame frame = build_frame(series, 1280.0f, 720.0f);
        benchmark::DoNotOptimize(frame.line_vertices.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_BuildFrame)->Arg(1000)->Arg(10000)->Arg(100000)->Unit(benchmark::kMicrosecond);

static void BM_TessellatePolyline(benchmark::State& state)
{
    auto                    pts = screen_polyline(static_cast<size_t>(state.range(0)));
    std::vector<LineVertex> out;
    out.reserve(pts.size() * 6);

    for (auto _ : state)
    {
        out.clear();
        size_t n = tessellate_polyline(pts, colors::red, LinePattern::Dashed, 2.0f, 1.0f, out);
        benchmark::DoNotOptimize(n);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TessellatePolyline)->Arg(1000)->Arg(100000)->Unit(benchmark::kMicrosecond);

// ─── Software rendering ─────────────────────────────────────────────────────

static void BM_SoftwareRender_Markers(benchmark::State& state)
{
    Logger::instance().set_level(LogLevel::Warning);
    std::vector<PlotSeries> series = {
        sine_series(static_cast<size_t>(state.range(0)), MarkerShape::Diamond, LinePattern::None)};
    PlotFrame frame = build_frame(series, 640.0f, 480.0f);

    for (auto _ : state)
    {
        Image image = render_offscreen(frame);
        benchmark::DoNotOptimize(image.rgba.data());
    }
}
BENCHMARK(BM_SoftwareRender_Markers)->Arg(100)->Arg(1000)->Unit(benchmark::kMillisecond);

static void BM_SoftwareRender_Lines(benchmark::State& state)
{
    Logger::instance().set_level(LogLevel::Warning);
    std::vector<PlotSeries> series = {
        sine_series(static_cast<size_t>(state.range(0)), MarkerShape::None, LinePattern::DashDot)};
    PlotFrame frame = build_frame(series, 640.0f, 480.0f);

    for (auto _ : state)
    {
        Image image = render_offscreen(frame);
        benchmark::DoNotOptimize(image.rgba.data());
    }
}
BENCHMARK(BM_SoftwareRender_Lines)->Arg(1000)->Arg(10000)->Unit(benchmark::kMillisecond);
