#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <string>

// OpenCV includes
#include <opencv2/core.hpp>

// Local includes
#include "ssd_augmentation/augmentation_types.hpp"


namespace ssd_augmentation
{

// Coordinate convention of the four box columns
enum class BoxEncoding
{
  kCorners,    // xmin, ymin, xmax, ymax
  kCentroids   // cx, cy, w, h
};

namespace utils
{

// Area of the overlap of two boxes, 0 if they are disjoint
float intersection_area(const cv::Rect2f & box1, const cv::Rect2f & box2);

// Intersection over union, 0 if the union is empty
float compute_iou(const cv::Rect2f & box1, const cv::Rect2f & box2);

// Fraction of the box area lying inside the patch, 0 for an empty box
float area_fraction_inside(const cv::Rect2f & box, const cv::Rect2f & patch);

// Whether the box center lies in the patch, boundaries included
bool center_in_patch(const cv::Rect2f & box, const cv::Rect2f & patch);

cv::Rect2f clip_box_to_patch(const cv::Rect2f & box, const cv::Rect2f & patch);

// Shift every box by (dx, dy). Returns a new label set.
LabelSet translate_labels(const LabelSet & labels, float dx, float dy);

// Clip every box to [0, width] x [0, height]. Returns a new label set.
LabelSet clip_labels(const LabelSet & labels, int image_height, int image_width);

/**
 * @brief Convert the four box columns between corner and centroid encoding
 * @details Columns are taken from the label format; in centroid encoding
 *          the xmin, ymin, xmax and ymax columns hold cx, cy, w and h.
 */
LabelSet convert_coordinates(const LabelSet & labels, BoxEncoding from, BoxEncoding to);

// Human readable dump of a label set, one box per line
std::string labels_to_string(const LabelSet & labels);

} // namespace utils

} // namespace ssd_augmentation
