#include <gtest/gtest.h>

#include <limits>
#include <lumaplot/validation.hpp>
#include <string>

using namespace lumaplot;

static UniformBlock valid_block()
{
    UniformBlock u;
    u.viewport_size = {200.0f, 200.0f};
    u.x_range       = {0.0f, 20.0f};
    u.y_range       = {0.0f, 20.0f};
    u.padding       = {0.0f, 0.0f};
    u.marker_radius = 5.0f;
    u.line_width    = 2.0f;
    return u;
}

static constexpr float NaN = std::numeric_limits<float>::quiet_NaN();
static constexpr float Inf = std::numeric_limits<float>::infinity();

TEST(ValidateUniforms, ValidBlock)
{
    EXPECT_EQ(validate_uniforms(valid_block()), UniformError::None);
}

TEST(ValidateUniforms, Viewport)
{
    auto u            = valid_block();
    u.viewport_size.x = 0.0f;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonPositiveViewport);

    u                 = valid_block();
    u.viewport_size.y = -10.0f;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonPositiveViewport);
}

TEST(ValidateUniforms, DegenerateRanges)
{
    auto u    = valid_block();
    u.x_range = {5.0f, 5.0f};
    EXPECT_EQ(validate_uniforms(u), UniformError::DegenerateXRange);

    u         = valid_block();
    u.y_range = {3.0f, 1.0f};
    EXPECT_EQ(validate_uniforms(u), UniformError::DegenerateYRange);

    u         = valid_block();
    u.x_range = {NaN, 1.0f};
    EXPECT_EQ(validate_uniforms(u), UniformError::DegenerateXRange);
}

TEST(ValidateUniforms, Padding)
{
    auto u      = valid_block();
    u.padding.x = 100.0f;   // exactly half: no plot area left
    EXPECT_EQ(validate_uniforms(u), UniformError::PaddingTooLarge);

    u           = valid_block();
    u.padding.y = -1.0f;
    EXPECT_EQ(validate_uniforms(u), UniformError::PaddingTooLarge);

    u         = valid_block();
    u.padding = {99.0f, 99.0f};
    EXPECT_EQ(validate_uniforms(u), UniformError::None);
}

TEST(ValidateUniforms, MarkerRadiusAndLineWidth)
{
    auto u          = valid_block();
    u.marker_radius = 0.0f;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonPositiveMarkerRadius);

    u            = valid_block();
    u.line_width = -2.0f;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonPositiveLineWidth);
}

TEST(ValidateUniforms, NonFiniteValues)
{
    auto u      = valid_block();
    u.padding.x = NaN;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonFiniteValue);

    u           = valid_block();
    u.x_range   = {0.0f, Inf};
    EXPECT_EQ(validate_uniforms(u), UniformError::NonFiniteValue);

    u                 = valid_block();
    u.viewport_size.x = Inf;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonFiniteValue);

    u               = valid_block();
    u.marker_radius = NaN;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonPositiveMarkerRadius);
}

TEST(ValidateUniforms, FirstFailureWins)
{
    auto u            = valid_block();
    u.viewport_size.x = 0.0f;
    u.x_range         = {1.0f, 1.0f};
    u.line_width      = 0.0f;
    EXPECT_EQ(validate_uniforms(u), UniformError::NonPositiveViewport);

    u            = valid_block();
    u.y_range    = {1.0f, 1.0f};
    u.line_width = 0.0f;
    EXPECT_EQ(validate_uniforms(u), UniformError::DegenerateYRange);
}

TEST(UniformErrorName, StableNames)
{
    EXPECT_STREQ(uniform_error_name(UniformError::None), "None");
    EXPECT_STREQ(uniform_error_name(UniformError::NonPositiveViewport), "NonPositiveViewport");
    EXPECT_STREQ(uniform_error_name(UniformError::DegenerateXRange), "DegenerateXRange");
    EXPECT_STREQ(uniform_error_name(UniformError::DegenerateYRange), "DegenerateYRange");
    EXPECT_STREQ(uniform_error_name(UniformError::PaddingTooLarge), "PaddingTooLarge");
    EXPECT_STREQ(uniform_error_name(UniformError::NonPositiveMarkerRadius),
                 "NonPositiveMarkerRadius");
    EXPECT_STREQ(uniform_error_name(UniformError::NonPositiveLineWidth), "NonPositiveLineWidth");
    EXPECT_STREQ(uniform_error_name(UniformError::NonFiniteValue), "NonFiniteValue");
}
