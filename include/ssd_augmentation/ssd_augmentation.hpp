#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>
#include <cstdint>
#include <string>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/compose.hpp"
#include "ssd_augmentation/config.hpp"
#include "ssd_augmentation/patch_sampler.hpp"
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{

/**
 * @brief Photometric distortions of the SSD recipe
 * @details Picks one of two orderings with probability 0.5 each. They differ
 *          only in whether the contrast change happens before or after the
 *          HSV adjustments. Labels pass through untouched.
 */
class SSDPhotometricDistortions
{
public:
  struct NamedOrdering
  {
    std::string name;
    Compose sequence;
  };

  SSDPhotometricDistortions();

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

  const std::array<NamedOrdering, 2> & orderings() const { return orderings_; }

private:
  std::array<NamedOrdering, 2> orderings_;
};

// Places the image at a random position on a canvas up to 4x larger
class SSDExpand
{
public:
  /**
   * @param background Canvas fill value per channel
   */
  explicit SSDExpand(const cv::Scalar & background = cv::Scalar(
    config::SSD_BACKGROUND[0], config::SSD_BACKGROUND[1], config::SSD_BACKGROUND[2]));

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  PatchSampler expand_;
};

// IoU-constrained random crop of the SSD batch sampler
class SSDRandomCrop
{
public:
  /**
   * @param max_attempts Cap on drawn IoU thresholds per call
   */
  explicit SSDRandomCrop(int max_attempts = config::SSD_CROP_MAX_ATTEMPTS);

  Sample operator()(const Sample & sample, RandomEngine & rng) const;

private:
  PatchSampler random_crop_;
};

// The complete SSD training augmentation
class SSDDataAugmentation
{
public:
  struct Config
  {
    /**
     * @brief Output image size
     */
    int height;
    int width;

    /**
     * @brief Canvas fill value of the expansion stage, RGB
     */
    cv::Scalar background;

    /**
     * @brief Upper limit on IoU threshold draws in the crop stage
     */
    int crop_max_attempts;

    /**
     * @brief Clip the returned boxes to the output frame
     * @details The crop stage keeps boxes whose center lies in the crop
     * without trimming them, so their extents can leave the image.
     */
    bool clip_boxes_to_output;

    /**
     * @brief Seed of the engine used by augment()
     */
    uint32_t seed;

    /**
     * @brief Print the configuration on construction
     */
    bool verbose;

    /**
     * @brief Default constructor
     * @details Initializes the configuration with default values.
     */
    Config()
    : height(config::SSD_OUTPUT_HEIGHT), width(config::SSD_OUTPUT_WIDTH),
      background(config::SSD_BACKGROUND[0], config::SSD_BACKGROUND[1], config::SSD_BACKGROUND[2]),
      crop_max_attempts(config::SSD_CROP_MAX_ATTEMPTS),
      clip_boxes_to_output(true), seed(RandomEngine::default_seed), verbose(false) {}
  };

  explicit SSDDataAugmentation(const Config & config = Config());

  /**
   * @brief Augment one image with the pipeline's own random engine
   * @param image RGB image, 8-bit or float, 1, 3 or 4 channels
   * @param labels Boxes in absolute pixel coordinates of image
   * @return Augmented image of the configured size and its boxes
   */
  Sample augment(const cv::Mat & image, const LabelSet & labels);

  // Augment one sample with an external random engine
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

  const Config & config() const { return config_; }

private:
  Config config_;
  Compose sequence_;
  RandomEngine rng_;
};

} // namespace ssd_augmentation
