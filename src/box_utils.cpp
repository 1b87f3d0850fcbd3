#include <algorithm>
#include <sstream>

// Local includes
#include "ssd_augmentation/box_utils.hpp"


namespace ssd_augmentation
{

namespace utils
{

float intersection_area(const cv::Rect2f & box1, const cv::Rect2f & box2)
{
  float x1 = std::max(box1.x, box2.x);
  float y1 = std::max(box1.y, box2.y);
  float x2 = std::min(box1.x + box1.width, box2.x + box2.width);
  float y2 = std::min(box1.y + box1.height, box2.y + box2.height);

  if (x2 <= x1 || y2 <= y1) {
    return 0.0f;
  }
  return (x2 - x1) * (y2 - y1);
}

float compute_iou(const cv::Rect2f & box1, const cv::Rect2f & box2)
{
  float intersection = intersection_area(box1, box2);
  float area1 = std::max(0.0f, box1.width) * std::max(0.0f, box1.height);
  float area2 = std::max(0.0f, box2.width) * std::max(0.0f, box2.height);
  float union_area = area1 + area2 - intersection;

  if (union_area <= 0.0f) {
    return 0.0f;
  }
  return intersection / union_area;
}

float area_fraction_inside(const cv::Rect2f & box, const cv::Rect2f & patch)
{
  float box_area = std::max(0.0f, box.width) * std::max(0.0f, box.height);
  if (box_area <= 0.0f) {
    return 0.0f;
  }
  return intersection_area(box, patch) / box_area;
}

bool center_in_patch(const cv::Rect2f & box, const cv::Rect2f & patch)
{
  float cx = box.x + 0.5f * box.width;
  float cy = box.y + 0.5f * box.height;
  return cx >= patch.x && cx <= patch.x + patch.width &&
         cy >= patch.y && cy <= patch.y + patch.height;
}

cv::Rect2f clip_box_to_patch(const cv::Rect2f & box, const cv::Rect2f & patch)
{
  float x1 = std::clamp(box.x, patch.x, patch.x + patch.width);
  float y1 = std::clamp(box.y, patch.y, patch.y + patch.height);
  float x2 = std::clamp(box.x + box.width, patch.x, patch.x + patch.width);
  float y2 = std::clamp(box.y + box.height, patch.y, patch.y + patch.height);

  return cv::Rect2f(x1, y1, x2 - x1, y2 - y1);
}

LabelSet translate_labels(const LabelSet & labels, float dx, float dy)
{
  LabelSet shifted = labels.clone();
  const LabelFormat & f = shifted.format;
  for (int i = 0; i < shifted.size(); ++i) {
    shifted.data(i, f.xmin) += dx;
    shifted.data(i, f.xmax) += dx;
    shifted.data(i, f.ymin) += dy;
    shifted.data(i, f.ymax) += dy;
  }
  return shifted;
}

LabelSet clip_labels(const LabelSet & labels, int image_height, int image_width)
{
  LabelSet clipped = labels.clone();
  const cv::Rect2f frame(0.0f, 0.0f,
    static_cast<float>(image_width), static_cast<float>(image_height));
  for (int i = 0; i < clipped.size(); ++i) {
    cv::Rect2f box = clip_box_to_patch(clipped.box(i), frame);
    clipped.set_box(i, box.x, box.y, box.x + box.width, box.y + box.height);
  }
  return clipped;
}

LabelSet convert_coordinates(const LabelSet & labels, BoxEncoding from, BoxEncoding to)
{
  LabelSet converted = labels.clone();
  if (from == to) {
    return converted;
  }

  const LabelFormat & f = converted.format;
  for (int i = 0; i < converted.size(); ++i) {
    float a = labels.data(i, f.xmin);
    float b = labels.data(i, f.ymin);
    float c = labels.data(i, f.xmax);
    float d = labels.data(i, f.ymax);

    if (from == BoxEncoding::kCorners) {
      // (xmin, ymin, xmax, ymax) -> (cx, cy, w, h)
      converted.set_box(i, 0.5f * (a + c), 0.5f * (b + d), c - a, d - b);
    } else {
      // (cx, cy, w, h) -> (xmin, ymin, xmax, ymax)
      converted.set_box(i, a - 0.5f * c, b - 0.5f * d, a + 0.5f * c, b + 0.5f * d);
    }
  }
  return converted;
}

std::string labels_to_string(const LabelSet & labels)
{
  std::ostringstream oss;
  oss << "Total boxes: " << labels.size() << "\n";
  for (int i = 0; i < labels.size(); ++i) {
    const auto box = labels.box(i);
    oss << "Box " << (i + 1) << ": class " << labels.data(i, labels.format.class_id)
      << " [" << box.x << ", " << box.y << ", "
      << (box.x + box.width) << ", " << (box.y + box.height) << "]\n";
  }
  return oss.str();
}

} // namespace utils

} // namespace ssd_augmentation
