#include <gtest/gtest.h>

#include <lumaplot/plot_style.hpp>

#include "render/line_stage.hpp"

using namespace lumaplot;

static UniformBlock make_uniforms(float line_width = 2.0f)
{
    UniformBlock u;
    u.viewport_size = {200.0f, 100.0f};
    u.line_width    = line_width;
    return u;
}

// ─── Vertex step ─────────────────────────────────────────────────────────────

TEST(LineVertexStage, ScreenToNdc)
{
    auto u = make_uniforms();

    LineVertex v;
    v.position = {0.0f, 0.0f};
    auto tl    = line_vertex(v, u);
    EXPECT_FLOAT_EQ(tl.clip_position.x, -1.0f);
    EXPECT_FLOAT_EQ(tl.clip_position.y, 1.0f);

    v.position = {200.0f, 100.0f};
    auto br    = line_vertex(v, u);
    EXPECT_FLOAT_EQ(br.clip_position.x, 1.0f);
    EXPECT_FLOAT_EQ(br.clip_position.y, -1.0f);
}

TEST(LineVertexStage, IgnoresDataRange)
{
    auto u    = make_uniforms();
    u.x_range = {-1000.0f, 5.0f};
    u.padding = {30.0f, 30.0f};

    LineVertex v;
    v.position = {100.0f, 50.0f};
    auto out   = line_vertex(v, u);
    EXPECT_FLOAT_EQ(out.clip_position.x, 0.0f);
    EXPECT_FLOAT_EQ(out.clip_position.y, 0.0f);
}

TEST(LineVertexStage, PassesAttributesThrough)
{
    LineVertex v;
    v.color         = Color{0.1f, 0.2f, 0.3f, 0.4f};
    v.edge_distance = -1.5f;
    v.arc_length    = 42.0f;
    v.pattern       = to_tag(LinePattern::DashDot);

    auto out = line_vertex(v, make_uniforms());
    EXPECT_FLOAT_EQ(out.color.g, 0.2f);
    EXPECT_FLOAT_EQ(out.color.a, 0.4f);
    EXPECT_FLOAT_EQ(out.edge_distance, -1.5f);
    EXPECT_FLOAT_EQ(out.arc_length, 42.0f);
    EXPECT_EQ(out.pattern, to_tag(LinePattern::DashDot));
}

// ─── Coverage ────────────────────────────────────────────────────────────────

TEST(LineCoverage, CenterlineIsOpaque)
{
    EXPECT_FLOAT_EQ(line_coverage(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(line_coverage(0.8f), 1.0f);
}

TEST(LineCoverage, EdgeFadesOut)
{
    EXPECT_NEAR(line_coverage(1.0f), 0.0f, 1e-6f);
    EXPECT_NEAR(line_coverage(-1.0f), 0.0f, 1e-6f);
    EXPECT_NEAR(line_coverage(0.9f), 0.5f, 1e-4f);
}

TEST(LineCoverage, SymmetricInSign)
{
    for (int i = 0; i <= 24; ++i)
    {
        float d = i * 0.05f;
        EXPECT_FLOAT_EQ(line_coverage(d), line_coverage(-d)) << "d = " << d;
    }
}

// ─── Fragment step ───────────────────────────────────────────────────────────

TEST(LineFragment, FringeBeyondEdgeIsDiscarded)
{
    auto     u     = make_uniforms();
    uint32_t solid = to_tag(LinePattern::Solid);
    EXPECT_FALSE(line_fragment(colors::blue, 1.0f, 0.0f, solid, u).has_value());
    EXPECT_FALSE(line_fragment(colors::blue, -2.0f, 0.0f, solid, u).has_value());
}

TEST(LineFragment, ScalesAlphaOnly)
{
    auto u   = make_uniforms();
    auto out = line_fragment(Color{0.2f, 0.4f, 0.6f, 0.5f}, 0.9f, 0.0f, 0u, u);
    ASSERT_TRUE(out.has_value());
    EXPECT_FLOAT_EQ(out->r, 0.2f);
    EXPECT_FLOAT_EQ(out->g, 0.4f);
    EXPECT_FLOAT_EQ(out->b, 0.6f);
    EXPECT_NEAR(out->a, 0.25f, 1e-4f);
}

TEST(LineFragment, PatternMasksFragments)
{
    auto     u      = make_uniforms(2.0f);
    uint32_t dashed = to_tag(LinePattern::Dashed);
    // Width 2: on [0,16), off [16,24)
    EXPECT_TRUE(line_fragment(colors::blue, 0.0f, 4.0f, dashed, u).has_value());
    EXPECT_FALSE(line_fragment(colors::blue, 0.0f, 18.0f, dashed, u).has_value());
    EXPECT_TRUE(line_fragment(colors::blue, 0.0f, 25.0f, dashed, u).has_value());
}

TEST(LineFragment, NonePatternNeverDraws)
{
    auto u = make_uniforms();
    auto out = line_fragment(colors::blue, 0.0f, 0.0f, to_tag(LinePattern::None), u);
    EXPECT_FALSE(out.has_value());
}

TEST(LineFragment, UnknownPatternIsSolid)
{
    auto u = make_uniforms();
    EXPECT_TRUE(line_fragment(colors::blue, 0.0f, 18.0f, 99u, u).has_value());
}
