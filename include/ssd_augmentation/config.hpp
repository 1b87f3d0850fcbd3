#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>


namespace config
{
// Per-channel RGB mean used as the expansion canvas color
constexpr std::array<double, 3> SSD_BACKGROUND = {123.0, 117.0, 104.0};

// Network input size
constexpr int SSD_OUTPUT_HEIGHT = 300;
constexpr int SSD_OUTPUT_WIDTH = 300;

// Expansion
constexpr double SSD_EXPAND_PROB = 0.5;
constexpr double SSD_EXPAND_MIN_SCALE = 1.0;
constexpr double SSD_EXPAND_MAX_SCALE = 4.0;

// Random crop
constexpr double SSD_CROP_PROB = 0.857;
constexpr int SSD_CROP_MAX_TRIALS = 50;
constexpr int SSD_CROP_MAX_ATTEMPTS = 1000;
constexpr double SSD_CROP_MIN_SCALE = 0.3;
constexpr double SSD_CROP_MAX_SCALE = 1.0;
constexpr double SSD_CROP_MIN_ASPECT_RATIO = 0.5;
constexpr double SSD_CROP_MAX_ASPECT_RATIO = 2.0;
constexpr std::array<float, 5> SSD_CROP_MIN_IOUS = {0.1f, 0.3f, 0.5f, 0.7f, 0.9f};

// Flip
constexpr double SSD_FLIP_PROB = 0.5;

// Photometric distortions
constexpr double SSD_BRIGHTNESS_DELTA = 32.0;
constexpr double SSD_CONTRAST_LOWER = 0.5;
constexpr double SSD_CONTRAST_UPPER = 1.5;
constexpr double SSD_SATURATION_LOWER = 0.5;
constexpr double SSD_SATURATION_UPPER = 1.5;
constexpr double SSD_HUE_DELTA = 18.0;
constexpr double SSD_DISTORTION_PROB = 0.5;
constexpr double SSD_CHANNEL_SWAP_PROB = 0.0;

} // namespace config
