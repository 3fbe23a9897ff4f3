#ifndef ONEIRO_LIBRARY_H
#define ONEIRO_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/error.hpp"
#include "../src/common/config.hpp"
#include "../src/profile/registry.hpp"
#include "../src/image/codec.hpp"
#include "../src/regularization/regularization.hpp"
#include "../src/smoothing/smoothing.hpp"
#include "../src/smoothing/apply.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
// Image-space primitives called by a gradient-ascent ("deep dream") loop:
//  - Profile      : per-model normalization statistics, looked up by name.
//  - Image        : raster <-> normalized (1, 3, H, W) tensor conversions.
//  - Regularization::Clip / Shift : range clamp and circular jitter.
//  - Smoothing    : cascade Gaussian gradient smoothing, as a torch module or
//                   as a host-side OpenCV pass.
// Everything is header-only; link against LibTorch and OpenCV.

#endif // ONEIRO_LIBRARY_H
