// C++ standard library includes
#include <string>
#include <vector>

// OpenCV includes
#include <opencv2/core.hpp>

// Google Test includes
#include <gtest/gtest.h>

// Local includes
#include "ssd_augmentation/compose.hpp"
#include "ssd_augmentation/exception.hpp"
#include "ssd_augmentation/ssd_augmentation.hpp"


using namespace ssd_augmentation;


class ComposeTest : public ::testing::Test
{
protected:
  // Stage that appends its tag to a trace and adds value to every pixel
  Compose::Stage make_stage(const std::string & tag, double value)
  {
    return [this, tag, value](const Sample & sample, RandomEngine &) {
        trace_.push_back(tag);
        Sample out{sample.image + cv::Scalar::all(value), sample.labels};
        return out;
      };
  }

  std::vector<std::string> trace_;
  RandomEngine rng_{5};
};


TEST_F(ComposeTest, EmptyComposeIsIdentity)
{
  Compose compose;
  cv::Mat image(4, 4, CV_32FC1, cv::Scalar(1.0));
  Sample out = compose(Sample{image, LabelSet()}, rng_);
  EXPECT_EQ(cv::norm(out.image, image, cv::NORM_INF), 0.0);
  EXPECT_EQ(compose.size(), 0u);
}

TEST_F(ComposeTest, StagesRunInOrder)
{
  Compose compose({make_stage("a", 1.0), make_stage("b", 2.0)});
  compose.add(make_stage("c", 3.0));

  cv::Mat image(2, 2, CV_32FC1, cv::Scalar(0.0));
  Sample out = compose(Sample{image, LabelSet()}, rng_);

  EXPECT_EQ(trace_, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_FLOAT_EQ(out.image.at<float>(0, 0), 6.0f);
  // The caller's image is untouched
  EXPECT_FLOAT_EQ(image.at<float>(0, 0), 0.0f);
}

TEST_F(ComposeTest, RejectsEmptyStage)
{
  Compose compose;
  EXPECT_THROW(compose.add(Compose::Stage()), ConfigError);
}

TEST_F(ComposeTest, PhotometricOrderingsAreNamed)
{
  SSDPhotometricDistortions distortions;
  const auto & orderings = distortions.orderings();
  EXPECT_EQ(orderings[0].name, "contrast_first");
  EXPECT_EQ(orderings[1].name, "contrast_last");
  EXPECT_EQ(orderings[0].sequence.size(), 12u);
  EXPECT_EQ(orderings[1].sequence.size(), 14u);
}

TEST_F(ComposeTest, PhotometricDistortionsLeaveLabelsAlone)
{
  SSDPhotometricDistortions distortions;
  cv::Mat image(30, 40, CV_8UC3);
  cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));
  LabelSet labels = LabelSet::from_rows({{1.0f, 2.0f, 3.0f, 20.0f, 25.0f}});

  for (int i = 0; i < 50; ++i) {
    Sample out = distortions(Sample{image, labels}, rng_);
    EXPECT_EQ(out.image.type(), CV_8UC3);
    EXPECT_EQ(out.image.size(), image.size());
    EXPECT_EQ(cv::norm(out.labels.data, labels.data, cv::NORM_INF), 0.0);
  }
}

TEST_F(ComposeTest, PhotometricDistortionsAcceptGrayInput)
{
  SSDPhotometricDistortions distortions;
  cv::Mat gray(16, 16, CV_8UC1, cv::Scalar(90));
  Sample out = distortions(Sample{gray, LabelSet()}, rng_);
  EXPECT_EQ(out.image.type(), CV_8UC3);
}
