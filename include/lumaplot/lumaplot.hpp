#pragma once

// Umbrella header: the public data types, frame building, offscreen
// rendering and (when built with stb) PNG export.

#include <lumaplot/color.hpp>
#include <lumaplot/export.hpp>
#include <lumaplot/frame.hpp>
#include <lumaplot/gpu_types.hpp>
#include <lumaplot/logger.hpp>
#include <lumaplot/offscreen.hpp>
#include <lumaplot/plot_style.hpp>
#include <lumaplot/series.hpp>
#include <lumaplot/validation.hpp>
