#include <gtest/gtest.h>

#include <lumaplot/frame.hpp>
#include <lumaplot/logger.hpp>
#include <string>
#include <vector>

#include "render/renderer.hpp"

using namespace lumaplot;

// Records every backend call as a short string
class RecordingBackend : public Backend
{
   public:
    void begin_frame(const Color& clear_color) override
    {
        calls.push_back("begin");
        last_clear = clear_color;
    }

    bool update(const UniformBlock&            uniforms,
                std::span<const PointInstance> points,
                std::span<const LineVertex>    line_vertices) override
    {
        calls.push_back("update");
        last_uniforms   = uniforms;
        uploaded_points = points.size();
        uploaded_lines  = line_vertices.size();
        return accept_update;
    }

    void draw_lines(uint32_t vertex_count) override
    {
        calls.push_back("lines:" + std::to_string(vertex_count));
    }

    void draw_markers(uint32_t instance_count) override
    {
        calls.push_back("markers:" + std::to_string(instance_count));
    }

    void end_frame() override { calls.push_back("end"); }

    std::vector<std::string> calls;
    bool                     accept_update = true;
    Color                    last_clear;
    UniformBlock             last_uniforms;
    size_t                   uploaded_points = 0;
    size_t                   uploaded_lines  = 0;
};

class RendererTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        // Keep rejection errors out of the test output
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::null_sink());
    }

    void TearDown() override { Logger::instance().clear_sinks(); }

    static PlotFrame make_frame(size_t points, size_t line_vertices)
    {
        PlotFrame frame;
        frame.uniforms.viewport_size = {320.0f, 240.0f};
        frame.uniforms.x_range       = {0.0f, 10.0f};
        frame.uniforms.y_range       = {-1.0f, 1.0f};
        frame.uniforms.padding       = {10.0f, 10.0f};
        frame.points.resize(points);
        frame.line_vertices.resize(line_vertices);
        return frame;
    }
};

TEST_F(RendererTest, CallSequenceDrawsLinesBeforeMarkers)
{
    RecordingBackend backend;
    Renderer         renderer(backend);

    ASSERT_TRUE(renderer.render(make_frame(3, 12)));

    std::vector<std::string> expected = {"begin", "update", "lines:12", "markers:3", "end"};
    EXPECT_EQ(backend.calls, expected);
    EXPECT_EQ(backend.uploaded_points, 3u);
    EXPECT_EQ(backend.uploaded_lines, 12u);
    EXPECT_FLOAT_EQ(backend.last_uniforms.viewport_size.x, 320.0f);
    EXPECT_EQ(renderer.frames_rendered(), 1u);
    EXPECT_EQ(renderer.frames_rejected(), 0u);
}

TEST_F(RendererTest, InvalidUniformsNeverReachBackend)
{
    RecordingBackend backend;
    Renderer         renderer(backend);

    PlotFrame frame           = make_frame(3, 12);
    frame.uniforms.line_width = 0.0f;
    EXPECT_FALSE(renderer.render(frame));

    frame                  = make_frame(3, 12);
    frame.uniforms.padding = {200.0f, 10.0f};
    EXPECT_FALSE(renderer.render(frame));

    EXPECT_TRUE(backend.calls.empty());
    EXPECT_EQ(renderer.frames_rendered(), 0u);
    EXPECT_EQ(renderer.frames_rejected(), 2u);
}

TEST_F(RendererTest, FailedUpdateEndsFrameWithoutDrawing)
{
    RecordingBackend backend;
    backend.accept_update = false;
    Renderer renderer(backend);

    EXPECT_FALSE(renderer.render(make_frame(3, 12)));

    std::vector<std::string> expected = {"begin", "update", "end"};
    EXPECT_EQ(backend.calls, expected);
    EXPECT_EQ(renderer.frames_rejected(), 1u);
    EXPECT_EQ(renderer.frames_rendered(), 0u);
}

TEST_F(RendererTest, EmptyArraysSkipDrawCalls)
{
    RecordingBackend backend;
    Renderer         renderer(backend);

    ASSERT_TRUE(renderer.render(make_frame(0, 0)));

    std::vector<std::string> expected = {"begin", "update", "end"};
    EXPECT_EQ(backend.calls, expected);
    EXPECT_EQ(renderer.frames_rendered(), 1u);
}

TEST_F(RendererTest, ConfigSwitchesLayers)
{
    RecordingBackend backend;
    Renderer         renderer(backend);

    RenderConfig no_lines;
    no_lines.show_lines = false;
    ASSERT_TRUE(renderer.render(make_frame(2, 6), no_lines));

    std::vector<std::string> expected = {"begin", "update", "markers:2", "end"};
    EXPECT_EQ(backend.calls, expected);

    backend.calls.clear();
    RenderConfig no_markers;
    no_markers.show_markers = false;
    ASSERT_TRUE(renderer.render(make_frame(2, 6), no_markers));

    expected = {"begin", "update", "lines:6", "end"};
    EXPECT_EQ(backend.calls, expected);
    EXPECT_EQ(renderer.frames_rendered(), 2u);
}

TEST_F(RendererTest, ClearColorForwarded)
{
    RecordingBackend backend;
    Renderer         renderer(backend);

    RenderConfig config;
    config.clear_color = Color{0.1f, 0.2f, 0.3f, 0.4f};
    ASSERT_TRUE(renderer.render(make_frame(1, 0), config));

    EXPECT_FLOAT_EQ(backend.last_clear.r, 0.1f);
    EXPECT_FLOAT_EQ(backend.last_clear.g, 0.2f);
    EXPECT_FLOAT_EQ(backend.last_clear.b, 0.3f);
    EXPECT_FLOAT_EQ(backend.last_clear.a, 0.4f);
}

TEST_F(RendererTest, BackendAccessor)
{
    RecordingBackend backend;
    Renderer         renderer(backend);
    EXPECT_EQ(&renderer.backend(), &backend);
}
