#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <optional>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/bound_generator.hpp"
#include "ssd_augmentation/box_filter.hpp"
#include "ssd_augmentation/image_validator.hpp"
#include "ssd_augmentation/patch_coordinate_generator.hpp"
#include "ssd_augmentation/random_utils.hpp"


namespace ssd_augmentation
{

/**
 * @brief Rejection sampler that moves an image and its boxes onto a random patch
 * @details Each outer attempt flips a coin with probability prob. On heads it
 *          draws overlap bounds (from the bound generator if attached, else the
 *          validator's own) and samples up to max_trials patches until the
 *          validator accepts one. The accepted patch becomes the new image
 *          frame. On tails, or once max_attempts are used up, the input is
 *          returned unchanged.
 *
 *          With max_trials = max_attempts = 1 and no validator this is the
 *          single-trial expansion; with a bound generator and many trials it
 *          is the IoU-constrained crop.
 */
class PatchSampler
{
public:
  struct Config
  {
    /**
     * @brief Probability of transforming the input on each outer attempt
     */
    double prob;

    /**
     * @brief Patches sampled per drawn bound pair
     */
    int max_trials;

    /**
     * @brief Upper limit on bound pair draws per call
     * @details Guarantees termination for configurations that can never be
     * satisfied. Exhaustion returns the input unchanged.
     */
    int max_attempts;

    /**
     * @brief Render only the part of the patch that overlaps the image
     * @details Keeps crops from ever growing the image. Boxes are still
     * filtered against the full patch.
     */
    bool clip_patch_to_image;

    /**
     * @brief Fill value for canvas pixels outside the source image
     */
    cv::Scalar background;

    /**
     * @brief Default constructor
     * @details Initializes a single-trial sampler that always fires.
     */
    Config()
    : prob(1.0), max_trials(1), max_attempts(1), clip_patch_to_image(false),
      background(0.0, 0.0, 0.0) {}
  };

  /**
   * @brief Construct a sampler
   * @param patch_coord_generator Source of candidate patches
   * @param box_filter Filter applied to the labels of the accepted patch, if any
   * @param image_validator Acceptance test for candidate patches, if any
   * @param bound_generator Per-attempt overlap bounds for the validator, if any
   * @param config Sampler configuration
   * @throws ConfigError if prob is outside [0, 1] or a trial count is below 1
   */
  PatchSampler(
    const PatchCoordinateGenerator & patch_coord_generator,
    std::optional<BoxFilter> box_filter,
    std::optional<ImageValidator> image_validator,
    std::optional<BoundGenerator> bound_generator,
    const Config & config = Config());

  /**
   * @brief Apply the sampler to one sample
   * @throws TypeMismatch if the image is empty
   */
  Sample operator()(const Sample & sample, RandomEngine & rng) const;

  const Config & config() const { return config_; }

private:
  // Search for an acceptable patch; std::nullopt if every attempt was declined or failed
  std::optional<cv::Rect> find_patch(const Sample & sample, RandomEngine & rng) const;

  // Move the sample onto the accepted patch
  Sample sample_patch(const Sample & sample, const cv::Rect & patch) const;

private:
  PatchCoordinateGenerator patch_coord_generator_;
  std::optional<BoxFilter> box_filter_;
  std::optional<ImageValidator> image_validator_;
  std::optional<BoundGenerator> bound_generator_;
  Config config_;
};

} // namespace ssd_augmentation
