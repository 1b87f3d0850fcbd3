#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <optional>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/box_filter.hpp"
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{

enum class FlipAxis
{
  kHorizontal,  // mirror left-right
  kVertical     // mirror top-bottom
};

// Mirrors the image and reflects the boxes across the same axis
class Flip
{
public:
  explicit Flip(FlipAxis axis = FlipAxis::kHorizontal);

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  FlipAxis axis_;
};

// Flip applied with a given probability
class RandomFlip
{
public:
  /**
   * @throws ConfigError if prob is outside [0, 1]
   */
  explicit RandomFlip(FlipAxis axis = FlipAxis::kHorizontal, double prob = 0.5);

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  Flip flip_;
  double prob_;
};

// Resizes to a fixed size and rescales the boxes by the same ratios
class Resize
{
public:
  /**
   * @param height Output height
   * @param width Output width
   * @param interpolation OpenCV interpolation flag
   * @param box_filter Filter applied to the rescaled boxes against the output frame
   * @throws ConfigError if the output size is not positive
   */
  Resize(int height, int width, int interpolation = cv::INTER_LINEAR,
    std::optional<BoxFilter> box_filter = std::nullopt);

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  int height_;
  int width_;
  int interpolation_;
  std::optional<BoxFilter> box_filter_;
};

// Resize with an interpolation mode drawn uniformly per call
class ResizeRandomInterp
{
public:
  /**
   * @throws ConfigError if the mode list is empty or the output size is not positive
   */
  ResizeRandomInterp(int height, int width,
    const std::vector<int> & interpolation_modes = {
    cv::INTER_NEAREST, cv::INTER_LINEAR, cv::INTER_CUBIC, cv::INTER_AREA, cv::INTER_LANCZOS4},
    std::optional<BoxFilter> box_filter = std::nullopt);

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  std::vector<Resize> resizers_;
};

// Clips every box to the image frame
class ClipBoxes
{
public:
  Sample operator()(const Sample & sample, RandomEngine & rng) const;
};

} // namespace ssd_augmentation
