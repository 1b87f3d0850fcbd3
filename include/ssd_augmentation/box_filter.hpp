#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"


namespace ssd_augmentation
{

// How the overlap of a box with a patch is measured
enum class OverlapCriterion
{
  kCenterPoint,  // box center inside the patch, bounds ignored
  kIoU,          // intersection over union of box and patch
  kArea          // fraction of the box area inside the patch
};

namespace utils
{

// Whether the box satisfies the criterion against the patch within the given bounds
bool overlap_satisfied(
  const cv::Rect2f & box, const cv::Rect2f & patch,
  OverlapCriterion criterion, const BoundPair & bounds);

} // namespace utils

// Keeps the boxes that lie "inside" a patch
class BoxFilter
{
public:
  struct Config
  {
    /**
     * @brief Apply the overlap test
     */
    bool check_overlap;

    /**
     * @brief Drop boxes with xmax <= xmin or ymax <= ymin
     */
    bool check_degenerate;

    /**
     * @brief Drop boxes whose area is below min_area
     */
    bool check_min_area;
    float min_area;

    /**
     * @brief Overlap measure and its accepted range
     */
    OverlapCriterion overlap_criterion;
    BoundPair overlap_bounds;

    /**
     * @brief Clip survivors to the patch and express them relative to its origin
     * @details Without clipping the survivors keep their image coordinates.
     */
    bool clip_boxes;

    /**
     * @brief Default constructor
     * @details Initializes the configuration with default values.
     */
    Config()
    : check_overlap(true), check_degenerate(true), check_min_area(true), min_area(16.0f),
      overlap_criterion(OverlapCriterion::kCenterPoint), overlap_bounds(0.3f, 1.0f),
      clip_boxes(false) {}
  };

  /**
   * @throws ConfigError if min_area is negative or the overlap bounds are inverted
   */
  explicit BoxFilter(const Config & config = Config());

  /**
   * @brief Filter labels against a patch
   * @param labels Boxes in absolute image coordinates
   * @param patch Patch in the same coordinate frame
   * @return Surviving boxes in their original order
   */
  LabelSet operator()(const LabelSet & labels, const cv::Rect & patch) const;

  /**
   * @brief Row indices of the boxes that survive the filter
   */
  std::vector<int> kept_rows(const LabelSet & labels, const cv::Rect & patch) const;

  bool clips_boxes() const { return config_.clip_boxes; }

  const Config & config() const { return config_; }

private:
  Config config_;
};

} // namespace ssd_augmentation
