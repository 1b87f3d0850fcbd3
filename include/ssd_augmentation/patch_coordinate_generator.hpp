#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <string>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{

// Samples candidate patch rectangles relative to an image size
class PatchCoordinateGenerator
{
public:
  // How the two patch dimensions are tied together
  enum class MatchMode
  {
    kIndependent,         // height and width scales sampled on their own
    kMatchHeightToWidth,  // width sampled, height = width / aspect ratio
    kMatchWidthToHeight   // height sampled, width = height * aspect ratio
  };

  struct Config
  {
    /**
     * @brief Relation between the sampled height and width
     */
    MatchMode match_mode;

    /**
     * @brief Bounds of a patch dimension as a fraction of the image dimension
     * @details Values above 1 produce patches larger than the image.
     */
    double min_scale;
    double max_scale;

    /**
     * @brief Sample one scale and apply it to both dimensions
     * @details Only used in kIndependent mode. The patch then keeps the
     * aspect ratio of the image and the aspect ratio bounds do not apply.
     */
    bool scale_uniformly;

    /**
     * @brief Bounds of the patch aspect ratio (width / height)
     * @details Enforced on the whole-pixel patch in every mode except
     * kIndependent with scale_uniformly, where the patch takes the image
     * aspect ratio and these bounds are ignored.
     */
    double min_aspect_ratio;
    double max_aspect_ratio;

    /**
     * @brief Default constructor
     * @details Initializes the configuration with the SSD crop values.
     */
    Config()
    : match_mode(MatchMode::kIndependent), min_scale(0.3), max_scale(1.0),
      scale_uniformly(false), min_aspect_ratio(0.5), max_aspect_ratio(2.0) {}
  };

  /**
   * @brief Construct a generator
   * @throws ConfigError if the scale or aspect ratio bounds are invalid
   */
  explicit PatchCoordinateGenerator(const Config & config = Config());

  /**
   * @brief Sample one patch
   * @param image_height Height of the reference image
   * @param image_width Width of the reference image
   * @param rng Random source
   * @return Patch in absolute pixel coordinates of the reference image, at
   *         least 1 pixel per side. A patch no larger than the image lies
   *         inside it, a larger one contains it.
   * @throws ConfigError if the image size is not positive
   */
  cv::Rect operator()(int image_height, int image_width, RandomEngine & rng) const;

  const Config & config() const { return config_; }

private:
  // Patch height and width before placement
  cv::Size sample_size(int image_height, int image_width, RandomEngine & rng) const;

  // Shrink the overlong side until width / height is within the aspect ratio bounds
  void fit_aspect_ratio(int & patch_height, int & patch_width) const;

  // Offset along one dimension
  static int sample_offset(int image_extent, int patch_extent, RandomEngine & rng);

private:
  Config config_;
};

} // namespace ssd_augmentation
