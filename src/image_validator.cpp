#include <string>

// Local includes
#include "ssd_augmentation/image_validator.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

ImageValidator::ImageValidator(const Config & config)
: config_(config)
{
  if (config_.min_boxes_required < 0) {
    throw ConfigError("min_boxes_required must be non-negative, got " +
      std::to_string(config_.min_boxes_required));
  }
  const auto & bounds = config_.bounds;
  if (bounds.lower && bounds.upper && *bounds.lower > *bounds.upper) {
    throw ConfigError("Lower bound " + std::to_string(*bounds.lower) +
      " is greater than upper bound " + std::to_string(*bounds.upper));
  }
}

bool ImageValidator::operator()(const LabelSet & labels, const cv::Rect & patch) const
{
  return (*this)(labels, patch, config_.bounds);
}

bool ImageValidator::operator()(
  const LabelSet & labels, const cv::Rect & patch, const BoundPair & bounds) const
{
  // Nothing to lose by cropping an image without objects
  if (labels.empty()) {
    return true;
  }

  const cv::Rect2f patch_f(patch);
  int num_valid = 0;
  for (int i = 0; i < labels.size(); ++i) {
    if (utils::overlap_satisfied(labels.box(i), patch_f, config_.overlap_criterion, bounds)) {
      ++num_valid;
    }
  }

  if (config_.require_all_boxes) {
    return num_valid == labels.size();
  }
  return num_valid >= config_.min_boxes_required;
}

} // namespace ssd_augmentation
