#include <cmath>
#include <string>
#include <utility>

// Local includes
#include "ssd_augmentation/geometric_ops.hpp"
#include "ssd_augmentation/box_utils.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

// Flip

Flip::Flip(FlipAxis axis)
: axis_(axis)
{
}

Sample Flip::operator()(const Sample & sample, RandomEngine & /*rng*/) const
{
  Sample result{cv::Mat(), sample.labels.clone()};
  LabelSet & labels = result.labels;
  const LabelFormat & f = labels.format;

  if (axis_ == FlipAxis::kHorizontal) {
    cv::flip(sample.image, result.image, 1);
    const float width = static_cast<float>(sample.image.cols);
    for (int i = 0; i < labels.size(); ++i) {
      float xmin = labels.data(i, f.xmin);
      labels.data(i, f.xmin) = width - labels.data(i, f.xmax);
      labels.data(i, f.xmax) = width - xmin;
    }
  } else {
    cv::flip(sample.image, result.image, 0);
    const float height = static_cast<float>(sample.image.rows);
    for (int i = 0; i < labels.size(); ++i) {
      float ymin = labels.data(i, f.ymin);
      labels.data(i, f.ymin) = height - labels.data(i, f.ymax);
      labels.data(i, f.ymax) = height - ymin;
    }
  }
  return result;
}

// RandomFlip

RandomFlip::RandomFlip(FlipAxis axis, double prob)
: flip_(axis), prob_(prob)
{
  if (prob_ < 0.0 || prob_ > 1.0) {
    throw ConfigError("RandomFlip: prob must be in [0, 1], got " + std::to_string(prob_));
  }
}

Sample RandomFlip::operator()(const Sample & sample, RandomEngine & rng) const
{
  if (!utils::sample_bernoulli(prob_, rng)) {
    return sample;
  }
  return flip_(sample, rng);
}

// Resize

Resize::Resize(int height, int width, int interpolation, std::optional<BoxFilter> box_filter)
: height_(height), width_(width), interpolation_(interpolation), box_filter_(std::move(box_filter))
{
  if (height_ <= 0 || width_ <= 0) {
    throw ConfigError("Resize: output size must be positive, got " +
      std::to_string(height_) + "x" + std::to_string(width_));
  }
}

Sample Resize::operator()(const Sample & sample, RandomEngine & /*rng*/) const
{
  if (sample.image.empty()) {
    throw TypeMismatch("Resize received an empty image");
  }

  Sample result{cv::Mat(), sample.labels.clone()};
  cv::resize(sample.image, result.image, cv::Size(width_, height_), 0, 0, interpolation_);

  const float scale_y = static_cast<float>(height_) / sample.image.rows;
  const float scale_x = static_cast<float>(width_) / sample.image.cols;
  LabelSet & labels = result.labels;
  const LabelFormat & f = labels.format;
  for (int i = 0; i < labels.size(); ++i) {
    labels.data(i, f.xmin) = std::round(labels.data(i, f.xmin) * scale_x);
    labels.data(i, f.xmax) = std::round(labels.data(i, f.xmax) * scale_x);
    labels.data(i, f.ymin) = std::round(labels.data(i, f.ymin) * scale_y);
    labels.data(i, f.ymax) = std::round(labels.data(i, f.ymax) * scale_y);
  }

  if (box_filter_) {
    labels = (*box_filter_)(labels, cv::Rect(0, 0, width_, height_));
  }
  return result;
}

// ResizeRandomInterp

ResizeRandomInterp::ResizeRandomInterp(
  int height, int width, const std::vector<int> & interpolation_modes,
  std::optional<BoxFilter> box_filter)
{
  if (interpolation_modes.empty()) {
    throw ConfigError("ResizeRandomInterp: at least one interpolation mode is required");
  }
  for (int mode : interpolation_modes) {
    resizers_.emplace_back(height, width, mode, box_filter);
  }
}

Sample ResizeRandomInterp::operator()(const Sample & sample, RandomEngine & rng) const
{
  int index = utils::sample_uniform_int(0, static_cast<int>(resizers_.size()) - 1, rng);
  return resizers_[index](sample, rng);
}

// ClipBoxes

Sample ClipBoxes::operator()(const Sample & sample, RandomEngine & /*rng*/) const
{
  return Sample{sample.image, utils::clip_labels(sample.labels, sample.image.rows, sample.image.cols)};
}

} // namespace ssd_augmentation
