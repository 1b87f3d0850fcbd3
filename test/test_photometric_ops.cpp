// C++ standard library includes
#include <algorithm>
#include <set>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Google Test includes
#include <gtest/gtest.h>

// Local includes
#include "ssd_augmentation/exception.hpp"
#include "ssd_augmentation/photometric_ops.hpp"


using namespace ssd_augmentation;


class PhotometricOpsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    labels_ = LabelSet::from_rows({{1.0f, 5.0f, 5.0f, 15.0f, 15.0f}});
  }

  // 3-channel image with channel values (c0, c1, c2) everywhere
  static cv::Mat make_image(int type, double c0, double c1, double c2)
  {
    return cv::Mat(8, 8, type, cv::Scalar(c0, c1, c2));
  }

  RandomEngine rng_{99};
  LabelSet labels_;
};


TEST_F(PhotometricOpsTest, BrightnessClipsToPixelRange)
{
  RandomBrightness brighter(100.0, 100.0, 1.0);
  Sample out = brighter(Sample{make_image(CV_32FC3, 10.0, 200.0, 250.0), labels_}, rng_);

  cv::Vec3f pixel = out.image.at<cv::Vec3f>(0, 0);
  EXPECT_FLOAT_EQ(pixel[0], 110.0f);
  EXPECT_FLOAT_EQ(pixel[1], 255.0f);
  EXPECT_FLOAT_EQ(pixel[2], 255.0f);
  EXPECT_EQ(out.labels.data.data, labels_.data.data);
}

TEST_F(PhotometricOpsTest, ContrastScalesAroundMidpoint)
{
  RandomContrast contrast(2.0, 2.0, 1.0);
  Sample out = contrast(Sample{make_image(CV_32FC3, 127.5, 100.0, 200.0), labels_}, rng_);

  cv::Vec3f pixel = out.image.at<cv::Vec3f>(3, 3);
  EXPECT_FLOAT_EQ(pixel[0], 127.5f);
  EXPECT_FLOAT_EQ(pixel[1], 72.5f);
  EXPECT_FLOAT_EQ(pixel[2], 255.0f);
}

TEST_F(PhotometricOpsTest, SaturationScalesOnlySecondChannel)
{
  RandomSaturation saturation(0.5, 0.5, 1.0);
  Sample out = saturation(Sample{make_image(CV_32FC3, 40.0, 100.0, 60.0), labels_}, rng_);

  cv::Vec3f pixel = out.image.at<cv::Vec3f>(0, 0);
  EXPECT_FLOAT_EQ(pixel[0], 40.0f);
  EXPECT_FLOAT_EQ(pixel[1], 50.0f);
  EXPECT_FLOAT_EQ(pixel[2], 60.0f);
}

TEST_F(PhotometricOpsTest, HueWrapsAround)
{
  RandomHue hue(180.0, 1.0);
  cv::Mat image = make_image(CV_32FC3, 170.0, 10.0, 20.0);

  for (int i = 0; i < 100; ++i) {
    Sample out = hue(Sample{image, labels_}, rng_);
    cv::Vec3f pixel = out.image.at<cv::Vec3f>(0, 0);
    EXPECT_GE(pixel[0], 0.0f);
    EXPECT_LT(pixel[0], 180.0f);
    EXPECT_FLOAT_EQ(pixel[1], 10.0f);
    EXPECT_FLOAT_EQ(pixel[2], 20.0f);
  }
}

TEST_F(PhotometricOpsTest, ZeroProbabilityLeavesImageUntouched)
{
  cv::Mat image = make_image(CV_32FC3, 1.0, 2.0, 3.0);
  const Sample input{image, labels_};

  EXPECT_EQ(RandomBrightness(-32, 32, 0.0)(input, rng_).image.data, image.data);
  EXPECT_EQ(RandomContrast(0.5, 1.5, 0.0)(input, rng_).image.data, image.data);
  EXPECT_EQ(RandomSaturation(0.5, 1.5, 0.0)(input, rng_).image.data, image.data);
  EXPECT_EQ(RandomHue(18, 0.0)(input, rng_).image.data, image.data);
  EXPECT_EQ(RandomChannelSwap(0.0)(input, rng_).image.data, image.data);
}

TEST_F(PhotometricOpsTest, ChannelSwapPermutesChannels)
{
  RandomChannelSwap swap(1.0);
  cv::Mat image = make_image(CV_8UC3, 1, 2, 3);

  std::set<std::vector<int>> seen;
  for (int i = 0; i < 200; ++i) {
    Sample out = swap(Sample{image, labels_}, rng_);
    cv::Vec3b pixel = out.image.at<cv::Vec3b>(0, 0);
    std::vector<int> order = {pixel[0], pixel[1], pixel[2]};
    EXPECT_NE(order, (std::vector<int>{1, 2, 3}));
    std::vector<int> sorted = order;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(sorted, (std::vector<int>{1, 2, 3}));
    seen.insert(order);
  }
  EXPECT_EQ(seen.size(), RandomChannelSwap::PERMUTATIONS.size());
}

TEST_F(PhotometricOpsTest, ConvertDataTypeRoundsAndSaturates)
{
  ConvertDataType to_uint8(DataType::kUInt8);
  Sample out = to_uint8(Sample{make_image(CV_32FC3, 12.6, -3.0, 300.0), labels_}, rng_);

  ASSERT_EQ(out.image.type(), CV_8UC3);
  cv::Vec3b pixel = out.image.at<cv::Vec3b>(0, 0);
  EXPECT_EQ(pixel[0], 13);
  EXPECT_EQ(pixel[1], 0);
  EXPECT_EQ(pixel[2], 255);

  ConvertDataType to_float(DataType::kFloat32);
  EXPECT_EQ(to_float(out, rng_).image.type(), CV_32FC3);
}

TEST_F(PhotometricOpsTest, ConvertTo3Channels)
{
  ConvertTo3Channels to_3ch;

  cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(42));
  Sample out = to_3ch(Sample{gray, labels_}, rng_);
  ASSERT_EQ(out.image.type(), CV_8UC3);
  EXPECT_EQ(out.image.at<cv::Vec3b>(1, 1), cv::Vec3b(42, 42, 42));

  cv::Mat rgba(4, 4, CV_8UC4, cv::Scalar(1, 2, 3, 4));
  out = to_3ch(Sample{rgba, labels_}, rng_);
  ASSERT_EQ(out.image.type(), CV_8UC3);
  EXPECT_EQ(out.image.at<cv::Vec3b>(0, 0), cv::Vec3b(1, 2, 3));

  cv::Mat two(4, 4, CV_8UC2);
  EXPECT_THROW(to_3ch(Sample{two, labels_}, rng_), TypeMismatch);
}

TEST_F(PhotometricOpsTest, ColorConversionRoundTripIsClose)
{
  ConvertColor rgb_to_hsv(ColorSpace::kRGB, ColorSpace::kHSV);
  ConvertColor hsv_to_rgb(ColorSpace::kHSV, ColorSpace::kRGB);
  cv::Mat image = make_image(CV_8UC3, 200, 50, 100);

  Sample hsv = rgb_to_hsv(Sample{image, labels_}, rng_);
  Sample rgb = hsv_to_rgb(hsv, rng_);
  EXPECT_LE(cv::norm(rgb.image, image, cv::NORM_INF), 4.0);

  ConvertColor rgb_to_gray(ColorSpace::kRGB, ColorSpace::kGray, true);
  EXPECT_EQ(rgb_to_gray(Sample{image, labels_}, rng_).image.channels(), 3);
  ConvertColor rgb_to_gray_1ch(ColorSpace::kRGB, ColorSpace::kGray, false);
  EXPECT_EQ(rgb_to_gray_1ch(Sample{image, labels_}, rng_).image.channels(), 1);
}

TEST_F(PhotometricOpsTest, PreconditionsRaiseTypeMismatch)
{
  cv::Mat uint8_image = make_image(CV_8UC3, 1, 2, 3);
  cv::Mat float_gray(8, 8, CV_32FC1, cv::Scalar(5.0));

  EXPECT_THROW(RandomBrightness(-1, 1, 1.0)(Sample{uint8_image, labels_}, rng_), TypeMismatch);
  EXPECT_THROW(RandomContrast(0.5, 1.5, 1.0)(Sample{uint8_image, labels_}, rng_), TypeMismatch);
  EXPECT_THROW(RandomSaturation(0.5, 1.5, 1.0)(Sample{float_gray, labels_}, rng_), TypeMismatch);
  EXPECT_THROW(RandomHue(18, 1.0)(Sample{float_gray, labels_}, rng_), TypeMismatch);
  EXPECT_THROW(RandomChannelSwap(1.0)(Sample{float_gray, labels_}, rng_), TypeMismatch);

  ConvertColor rgb_to_hsv(ColorSpace::kRGB, ColorSpace::kHSV);
  cv::Mat float_rgb = make_image(CV_32FC3, 1, 2, 3);
  EXPECT_THROW(rgb_to_hsv(Sample{float_rgb, labels_}, rng_), TypeMismatch);
}

TEST_F(PhotometricOpsTest, InvalidConfigThrows)
{
  EXPECT_THROW(RandomBrightness(10, -10, 0.5), ConfigError);
  EXPECT_THROW(RandomContrast(0.5, 1.5, 1.5), ConfigError);
  EXPECT_THROW(RandomHue(200, 0.5), ConfigError);
  EXPECT_THROW(RandomChannelSwap(-0.1), ConfigError);
  EXPECT_THROW(ConvertColor(ColorSpace::kHSV, ColorSpace::kGray), ConfigError);
}
