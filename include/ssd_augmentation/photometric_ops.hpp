#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{
// Pixel-only operations. Every operation passes the labels through unchanged.

enum class ColorSpace
{
  kRGB,
  kBGR,
  kHSV,
  kGray
};

// Color space conversion of an 8-bit image
class ConvertColor
{
public:
  /**
   * @param from Current color space
   * @param to Target color space
   * @param keep_3ch Replicate a gray result to 3 channels
   * @throws ConfigError for unsupported conversions
   */
  ConvertColor(ColorSpace from, ColorSpace to, bool keep_3ch = true);

  /**
   * @throws TypeMismatch unless the image is 8-bit with the channel count of `from`
   */
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  ColorSpace from_;
  ColorSpace to_;
  bool keep_3ch_;
  int conversion_code_;
};

enum class DataType
{
  kUInt8,
  kFloat32
};

// Pixel depth conversion; conversion to 8 bit rounds and saturates
class ConvertDataType
{
public:
  explicit ConvertDataType(DataType to);

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  DataType to_;
};

// Brings 1- and 4-channel images to 3 channels
class ConvertTo3Channels
{
public:
  /**
   * @throws TypeMismatch for channel counts other than 1, 3 or 4
   */
  Sample operator()(const Sample & sample, RandomEngine & rng) const;
};

// Adds a random offset to every pixel of a float image
class RandomBrightness
{
public:
  /**
   * @param lower Smallest offset
   * @param upper Largest offset
   * @param prob Probability of applying the offset
   * @throws ConfigError if lower > upper or prob is outside [0, 1]
   */
  RandomBrightness(double lower = -84.0, double upper = 84.0, double prob = 0.5);

  /**
   * @throws TypeMismatch unless the image is 32-bit float
   */
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  double lower_;
  double upper_;
  double prob_;
};

// Scales pixel values around 127.5 by a random factor
class RandomContrast
{
public:
  RandomContrast(double lower = 0.5, double upper = 1.5, double prob = 0.5);

  // Requires a 32-bit float image
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  double lower_;
  double upper_;
  double prob_;
};

// Scales the saturation channel of a float HSV image
class RandomSaturation
{
public:
  RandomSaturation(double lower = 0.3, double upper = 2.0, double prob = 0.5);

  // Requires a 3-channel 32-bit float image in HSV
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  double lower_;
  double upper_;
  double prob_;
};

// Rotates the hue channel of a float HSV image, hue range [0, 180)
class RandomHue
{
public:
  /**
   * @param max_delta Largest absolute hue shift, at most 180
   * @param prob Probability of applying the shift
   */
  explicit RandomHue(double max_delta = 18.0, double prob = 0.5);

  // Requires a 3-channel 32-bit float image in HSV
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  double max_delta_;
  double prob_;
};

// Applies one of the five non-identity channel permutations
class RandomChannelSwap
{
public:
  explicit RandomChannelSwap(double prob = 0.5);

  // Requires a 3-channel image
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

  // Output channel i is taken from input channel permutation[i]
  static constexpr std::array<std::array<int, 3>, 5> PERMUTATIONS = {{
    {0, 2, 1}, {1, 0, 2}, {1, 2, 0}, {2, 0, 1}, {2, 1, 0}
  }};

private:
  double prob_;
};

} // namespace ssd_augmentation
