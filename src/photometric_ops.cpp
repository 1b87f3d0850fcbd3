#include <string>
#include <vector>

// OpenCV includes
#include <opencv2/imgproc.hpp>

// Local includes
#include "ssd_augmentation/photometric_ops.hpp"
#include "ssd_augmentation/exception.hpp"


namespace ssd_augmentation
{

namespace
{

void check_probability(double prob, const std::string & op_name)
{
  if (prob < 0.0 || prob > 1.0) {
    throw ConfigError(op_name + ": prob must be in [0, 1], got " + std::to_string(prob));
  }
}

void check_range(double lower, double upper, const std::string & op_name)
{
  if (lower > upper) {
    throw ConfigError(op_name + ": lower (" + std::to_string(lower) +
      ") must not exceed upper (" + std::to_string(upper) + ")");
  }
}

void require_float(const cv::Mat & image, const std::string & op_name)
{
  if (image.depth() != CV_32F) {
    throw TypeMismatch(op_name + " requires a 32-bit float image");
  }
}

void require_float_3ch(const cv::Mat & image, const std::string & op_name)
{
  if (image.type() != CV_32FC3) {
    throw TypeMismatch(op_name + " requires a 3-channel 32-bit float image");
  }
}

// Clamp pixel values to [0, 255] in place
void clip_to_pixel_range(cv::Mat & image)
{
  cv::max(image, 0.0, image);
  cv::min(image, 255.0, image);
}

int channels_of(ColorSpace space)
{
  return space == ColorSpace::kGray ? 1 : 3;
}

int conversion_code(ColorSpace from, ColorSpace to)
{
  using CS = ColorSpace;
  if (from == CS::kRGB && to == CS::kHSV) {return cv::COLOR_RGB2HSV;}
  if (from == CS::kHSV && to == CS::kRGB) {return cv::COLOR_HSV2RGB;}
  if (from == CS::kBGR && to == CS::kHSV) {return cv::COLOR_BGR2HSV;}
  if (from == CS::kHSV && to == CS::kBGR) {return cv::COLOR_HSV2BGR;}
  if (from == CS::kRGB && to == CS::kBGR) {return cv::COLOR_RGB2BGR;}
  if (from == CS::kBGR && to == CS::kRGB) {return cv::COLOR_BGR2RGB;}
  if (from == CS::kRGB && to == CS::kGray) {return cv::COLOR_RGB2GRAY;}
  if (from == CS::kBGR && to == CS::kGray) {return cv::COLOR_BGR2GRAY;}
  if (from == CS::kGray && to == CS::kRGB) {return cv::COLOR_GRAY2RGB;}
  if (from == CS::kGray && to == CS::kBGR) {return cv::COLOR_GRAY2BGR;}
  return -1;
}

} // namespace

// ConvertColor

ConvertColor::ConvertColor(ColorSpace from, ColorSpace to, bool keep_3ch)
: from_(from), to_(to), keep_3ch_(keep_3ch), conversion_code_(-1)
{
  if (from_ != to_) {
    conversion_code_ = conversion_code(from_, to_);
    if (conversion_code_ < 0) {
      throw ConfigError("ConvertColor: unsupported color conversion");
    }
  }
}

Sample ConvertColor::operator()(const Sample & sample, RandomEngine & /*rng*/) const
{
  const cv::Mat & image = sample.image;
  if (image.depth() != CV_8U || image.channels() != channels_of(from_)) {
    throw TypeMismatch("ConvertColor requires an 8-bit image with " +
      std::to_string(channels_of(from_)) + " channel(s), got " +
      std::to_string(image.channels()));
  }
  if (from_ == to_) {
    return sample;
  }

  Sample result{cv::Mat(), sample.labels};
  cv::cvtColor(image, result.image, conversion_code_);
  if (to_ == ColorSpace::kGray && keep_3ch_) {
    cv::cvtColor(result.image, result.image, cv::COLOR_GRAY2RGB);
  }
  return result;
}

// ConvertDataType

ConvertDataType::ConvertDataType(DataType to)
: to_(to)
{
}

Sample ConvertDataType::operator()(const Sample & sample, RandomEngine & /*rng*/) const
{
  const int depth = (to_ == DataType::kUInt8) ? CV_8U : CV_32F;
  if (sample.image.depth() == depth) {
    return sample;
  }

  Sample result{cv::Mat(), sample.labels};
  sample.image.convertTo(result.image, depth);
  return result;
}

// ConvertTo3Channels

Sample ConvertTo3Channels::operator()(const Sample & sample, RandomEngine & /*rng*/) const
{
  const cv::Mat & image = sample.image;
  Sample result{cv::Mat(), sample.labels};

  switch (image.channels()) {
    case 1:
      cv::merge(std::vector<cv::Mat>{image, image, image}, result.image);
      return result;
    case 3:
      return sample;
    case 4:
    {
      std::vector<cv::Mat> channels;
      cv::split(image, channels);
      channels.pop_back();
      cv::merge(channels, result.image);
      return result;
    }
    default:
      throw TypeMismatch("ConvertTo3Channels cannot handle " +
        std::to_string(image.channels()) + " channels");
  }
}

// RandomBrightness

RandomBrightness::RandomBrightness(double lower, double upper, double prob)
: lower_(lower), upper_(upper), prob_(prob)
{
  check_range(lower_, upper_, "RandomBrightness");
  check_probability(prob_, "RandomBrightness");
}

Sample RandomBrightness::operator()(const Sample & sample, RandomEngine & rng) const
{
  require_float(sample.image, "RandomBrightness");
  if (!utils::sample_bernoulli(prob_, rng)) {
    return sample;
  }

  double delta = utils::sample_uniform(lower_, upper_, rng);
  Sample result{cv::Mat(), sample.labels};
  cv::add(sample.image, cv::Scalar::all(delta), result.image);
  clip_to_pixel_range(result.image);
  return result;
}

// RandomContrast

RandomContrast::RandomContrast(double lower, double upper, double prob)
: lower_(lower), upper_(upper), prob_(prob)
{
  check_range(lower_, upper_, "RandomContrast");
  check_probability(prob_, "RandomContrast");
}

Sample RandomContrast::operator()(const Sample & sample, RandomEngine & rng) const
{
  require_float(sample.image, "RandomContrast");
  if (!utils::sample_bernoulli(prob_, rng)) {
    return sample;
  }

  // 127.5 + factor * (x - 127.5)
  double factor = utils::sample_uniform(lower_, upper_, rng);
  Sample result{cv::Mat(), sample.labels};
  sample.image.convertTo(result.image, -1, factor, 127.5 * (1.0 - factor));
  clip_to_pixel_range(result.image);
  return result;
}

// RandomSaturation

RandomSaturation::RandomSaturation(double lower, double upper, double prob)
: lower_(lower), upper_(upper), prob_(prob)
{
  check_range(lower_, upper_, "RandomSaturation");
  check_probability(prob_, "RandomSaturation");
}

Sample RandomSaturation::operator()(const Sample & sample, RandomEngine & rng) const
{
  require_float_3ch(sample.image, "RandomSaturation");
  if (!utils::sample_bernoulli(prob_, rng)) {
    return sample;
  }

  double factor = utils::sample_uniform(lower_, upper_, rng);
  std::vector<cv::Mat> channels;
  cv::split(sample.image, channels);
  channels[1] *= factor;
  clip_to_pixel_range(channels[1]);

  Sample result{cv::Mat(), sample.labels};
  cv::merge(channels, result.image);
  return result;
}

// RandomHue

RandomHue::RandomHue(double max_delta, double prob)
: max_delta_(max_delta), prob_(prob)
{
  if (max_delta_ < 0.0 || max_delta_ > 180.0) {
    throw ConfigError("RandomHue: max_delta must be in [0, 180], got " +
      std::to_string(max_delta_));
  }
  check_probability(prob_, "RandomHue");
}

Sample RandomHue::operator()(const Sample & sample, RandomEngine & rng) const
{
  require_float_3ch(sample.image, "RandomHue");
  if (!utils::sample_bernoulli(prob_, rng)) {
    return sample;
  }

  const float delta = static_cast<float>(utils::sample_uniform(-max_delta_, max_delta_, rng));
  std::vector<cv::Mat> channels;
  cv::split(sample.image, channels);

  cv::Mat1f hue = channels[0];
  for (int r = 0; r < hue.rows; ++r) {
    float * row = hue.ptr<float>(r);
    for (int c = 0; c < hue.cols; ++c) {
      float h = row[c] + delta;
      if (h < 0.0f) {
        h += 180.0f;
      } else if (h >= 180.0f) {
        h -= 180.0f;
      }
      row[c] = h;
    }
  }

  Sample result{cv::Mat(), sample.labels};
  cv::merge(channels, result.image);
  return result;
}

// RandomChannelSwap

RandomChannelSwap::RandomChannelSwap(double prob)
: prob_(prob)
{
  check_probability(prob_, "RandomChannelSwap");
}

Sample RandomChannelSwap::operator()(const Sample & sample, RandomEngine & rng) const
{
  if (sample.image.channels() != 3) {
    throw TypeMismatch("RandomChannelSwap requires a 3-channel image");
  }
  if (!utils::sample_bernoulli(prob_, rng)) {
    return sample;
  }

  const auto & permutation =
    PERMUTATIONS[utils::sample_uniform_int(0, static_cast<int>(PERMUTATIONS.size()) - 1, rng)];
  const int from_to[] = {permutation[0], 0, permutation[1], 1, permutation[2], 2};

  Sample result{cv::Mat(sample.image.size(), sample.image.type()), sample.labels};
  cv::mixChannels(&sample.image, 1, &result.image, 1, from_to, 3);
  return result;
}

} // namespace ssd_augmentation
