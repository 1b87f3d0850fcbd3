// C++ standard library includes
#include <cstdint>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Google Test includes
#include <gtest/gtest.h>

// Local includes
#include "ssd_augmentation/box_utils.hpp"
#include "ssd_augmentation/exception.hpp"
#include "ssd_augmentation/ssd_augmentation.hpp"


using namespace ssd_augmentation;


class SSDAugmentationTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    // 500 rows, 400 columns
    image_ = cv::Mat(500, 400, CV_8UC3);
    cv::randu(image_, cv::Scalar::all(0), cv::Scalar::all(255));
    labels_ = LabelSet::from_rows({{1.0f, 100.0f, 50.0f, 300.0f, 250.0f}});
  }

  static void expect_boxes_in_frame(const Sample & sample)
  {
    const LabelSet & labels = sample.labels;
    for (int i = 0; i < labels.size(); ++i) {
      EXPECT_GE(labels.data(i, 1), 0.0f);
      EXPECT_GE(labels.data(i, 2), 0.0f);
      EXPECT_LE(labels.data(i, 3), static_cast<float>(sample.image.cols));
      EXPECT_LE(labels.data(i, 4), static_cast<float>(sample.image.rows));
    }
  }

  cv::Mat image_;
  LabelSet labels_;
};


TEST_F(SSDAugmentationTest, ProducesFixedSizeOutput)
{
  SSDDataAugmentation::Config config;
  config.seed = 42;
  SSDDataAugmentation augmentation(config);

  Sample out = augmentation.augment(image_, labels_);
  EXPECT_EQ(out.image.rows, 300);
  EXPECT_EQ(out.image.cols, 300);
  EXPECT_EQ(out.image.type(), CV_8UC3);
  EXPECT_LE(out.labels.size(), 1);
  EXPECT_EQ(out.labels.data.cols, 5);
  expect_boxes_in_frame(out);
}

TEST_F(SSDAugmentationTest, OutputHoldsAcrossManySeeds)
{
  SSDDataAugmentation augmentation;
  for (uint32_t seed = 0; seed < 200; ++seed) {
    RandomEngine rng(seed);
    Sample out = augmentation(Sample{image_, labels_}, rng);
    ASSERT_EQ(out.image.size(), cv::Size(300, 300));
    ASSERT_LE(out.labels.size(), 1);
    expect_boxes_in_frame(out);
    if (!out.labels.empty()) {
      EXPECT_FLOAT_EQ(out.labels.data(0, 0), 1.0f);
    }
  }
}

TEST_F(SSDAugmentationTest, SameSeedReproducesOutput)
{
  SSDDataAugmentation::Config config;
  config.seed = 7;
  SSDDataAugmentation first(config);
  SSDDataAugmentation second(config);

  for (int i = 0; i < 5; ++i) {
    Sample a = first.augment(image_, labels_);
    Sample b = second.augment(image_, labels_);
    EXPECT_EQ(cv::norm(a.image, b.image, cv::NORM_INF), 0.0);
    ASSERT_EQ(a.labels.size(), b.labels.size());
    if (!a.labels.empty()) {
      EXPECT_EQ(cv::norm(a.labels.data, b.labels.data, cv::NORM_INF), 0.0);
    }
  }
}

TEST_F(SSDAugmentationTest, CustomOutputSizeAndFloatInput)
{
  SSDDataAugmentation::Config config;
  config.height = 128;
  config.width = 96;
  SSDDataAugmentation augmentation(config);

  cv::Mat float_image;
  image_.convertTo(float_image, CV_32F);
  RandomEngine rng(3);
  for (int i = 0; i < 20; ++i) {
    Sample out = augmentation(Sample{float_image, labels_}, rng);
    EXPECT_EQ(out.image.rows, 128);
    EXPECT_EQ(out.image.cols, 96);
    EXPECT_EQ(out.image.type(), CV_8UC3);
    expect_boxes_in_frame(out);
  }
}

TEST_F(SSDAugmentationTest, EmptyImageThrows)
{
  SSDDataAugmentation augmentation;
  EXPECT_THROW(augmentation.augment(cv::Mat(), labels_), TypeMismatch);
}

TEST_F(SSDAugmentationTest, TinyImageIsAugmented)
{
  SSDDataAugmentation augmentation;
  cv::Mat tiny(3, 3, CV_8UC3, cv::Scalar(10, 20, 30));
  LabelSet labels = LabelSet::from_rows({{1.0f, 0.0f, 0.0f, 3.0f, 3.0f}});

  for (uint32_t seed = 0; seed < 30; ++seed) {
    RandomEngine rng(seed);
    Sample out;
    ASSERT_NO_THROW(out = augmentation(Sample{tiny, labels}, rng));
    EXPECT_EQ(out.image.size(), cv::Size(300, 300));
    EXPECT_LE(out.labels.size(), 1);
    expect_boxes_in_frame(out);
  }
}

TEST_F(SSDAugmentationTest, InvalidOutputSizeThrows)
{
  SSDDataAugmentation::Config config;
  config.width = 0;
  EXPECT_THROW(SSDDataAugmentation augmentation(config), ConfigError);
}

TEST_F(SSDAugmentationTest, ExpandKeepsWholeImage)
{
  SSDExpand expand;
  RandomEngine rng(11);
  int expanded = 0;
  for (int i = 0; i < 100; ++i) {
    Sample out = expand(Sample{image_, labels_}, rng);
    ASSERT_GE(out.image.rows, image_.rows);
    ASSERT_GE(out.image.cols, image_.cols);
    ASSERT_LE(out.image.rows, 4 * image_.rows);
    ASSERT_LE(out.image.cols, 4 * image_.cols);
    ASSERT_EQ(out.labels.size(), 1);

    // The box moves with the image but keeps its size
    cv::Rect2f box = out.labels.box(0);
    EXPECT_FLOAT_EQ(box.width, 200.0f);
    EXPECT_FLOAT_EQ(box.height, 200.0f);
    if (out.image.rows > image_.rows) {
      ++expanded;
    }
  }
  EXPECT_GT(expanded, 20);
  EXPECT_LT(expanded, 80);
}

TEST_F(SSDAugmentationTest, RandomCropNeverGrowsImage)
{
  SSDRandomCrop crop;
  RandomEngine rng(23);
  for (int i = 0; i < 200; ++i) {
    Sample out = crop(Sample{image_, labels_}, rng);
    ASSERT_LE(out.image.rows, image_.rows);
    ASSERT_LE(out.image.cols, image_.cols);
    ASSERT_LE(out.labels.size(), 1);
    if (!out.labels.empty()) {
      const cv::Rect2f frame(0.0f, 0.0f,
        static_cast<float>(out.image.cols), static_cast<float>(out.image.rows));
      EXPECT_TRUE(utils::center_in_patch(out.labels.box(0), frame));
    }
  }
}
