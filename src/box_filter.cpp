#include <string>

// Local includes
#include "ssd_augmentation/box_filter.hpp"
#include "ssd_augmentation/box_utils.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

namespace utils
{

bool overlap_satisfied(
  const cv::Rect2f & box, const cv::Rect2f & patch,
  OverlapCriterion criterion, const BoundPair & bounds)
{
  switch (criterion) {
    case OverlapCriterion::kCenterPoint:
      return center_in_patch(box, patch);
    case OverlapCriterion::kIoU:
      return bounds.contains(compute_iou(box, patch));
    case OverlapCriterion::kArea:
      return bounds.contains(area_fraction_inside(box, patch));
  }
  return false;
}

} // namespace utils

BoxFilter::BoxFilter(const Config & config)
: config_(config)
{
  if (config_.min_area < 0.0f) {
    throw ConfigError("min_area must be non-negative, got " + std::to_string(config_.min_area));
  }
  const auto & bounds = config_.overlap_bounds;
  if (bounds.lower && bounds.upper && *bounds.lower > *bounds.upper) {
    throw ConfigError("Overlap lower bound " + std::to_string(*bounds.lower) +
      " is greater than upper bound " + std::to_string(*bounds.upper));
  }
}

std::vector<int> BoxFilter::kept_rows(const LabelSet & labels, const cv::Rect & patch) const
{
  const cv::Rect2f patch_f(patch);
  std::vector<int> rows;
  rows.reserve(labels.size());

  for (int i = 0; i < labels.size(); ++i) {
    const cv::Rect2f box = labels.box(i);

    if (config_.check_degenerate && (box.width <= 0.0f || box.height <= 0.0f)) {
      continue;
    }
    if (config_.check_min_area && box.width * box.height < config_.min_area) {
      continue;
    }
    if (config_.check_overlap &&
      !utils::overlap_satisfied(box, patch_f, config_.overlap_criterion, config_.overlap_bounds))
    {
      continue;
    }
    rows.push_back(i);
  }
  return rows;
}

LabelSet BoxFilter::operator()(const LabelSet & labels, const cv::Rect & patch) const
{
  LabelSet kept = labels.select_rows(kept_rows(labels, patch));
  if (!config_.clip_boxes) {
    return kept;
  }

  const cv::Rect2f patch_f(patch);
  for (int i = 0; i < kept.size(); ++i) {
    cv::Rect2f box = utils::clip_box_to_patch(kept.box(i), patch_f);
    float xmin = box.x - patch_f.x;
    float ymin = box.y - patch_f.y;
    kept.set_box(i, xmin, ymin, xmin + box.width, ymin + box.height);
  }
  return kept;
}

} // namespace ssd_augmentation
