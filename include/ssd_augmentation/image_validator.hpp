#pragma once

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"
#include "ssd_augmentation/box_filter.hpp"


namespace ssd_augmentation
{

// Decides whether a sampled patch keeps enough of the annotated objects
class ImageValidator
{
public:
  struct Config
  {
    /**
     * @brief Overlap measure between each box and the patch
     */
    OverlapCriterion overlap_criterion;

    /**
     * @brief Accepted overlap range when no bounds are passed per call
     */
    BoundPair bounds;

    /**
     * @brief Number of boxes that must meet the bounds
     */
    int min_boxes_required;

    /**
     * @brief Require every box to meet the bounds instead of min_boxes_required
     */
    bool require_all_boxes;

    Config()
    : overlap_criterion(OverlapCriterion::kIoU), bounds(0.3f, 1.0f),
      min_boxes_required(1), require_all_boxes(false) {}
  };

  /**
   * @throws ConfigError if min_boxes_required is negative or the bounds are inverted
   */
  explicit ImageValidator(const Config & config = Config());

  /**
   * @brief Validate a patch with the configured bounds
   * @param labels Boxes in absolute image coordinates
   * @param patch Candidate patch in the same frame
   * @return true if the patch is acceptable. An empty label set is always accepted.
   */
  bool operator()(const LabelSet & labels, const cv::Rect & patch) const;

  // Validate a patch with bounds drawn for this call
  bool operator()(const LabelSet & labels, const cv::Rect & patch, const BoundPair & bounds) const;

  const Config & config() const { return config_; }

private:
  Config config_;
};

} // namespace ssd_augmentation
