#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <stdexcept>

#include "artmatch_core/types/embedding.hpp"
#include "artmatch_core/types/errors.hpp"
#include "artmatch_core/vision/feature_extractor.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace artmatch_core {

using artmatch_tests::MockImageEncoder;
using artmatch_tests::MockObjectDetector;
using artmatch_tests::TestUtilities;
using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::Throw;

namespace {

DetectedObject raw_detection(const std::string &label, float confidence, BoundingBox bbox) {
  DetectedObject object;
  object.label = label;
  object.confidence = confidence;
  object.bbox = bbox;
  return object;
}

}  // namespace

class FeatureExtractorTest : public ::testing::Test {
 protected:
  static constexpr size_t kDimension = 16;

  void SetUp() override {
    detector_ = std::make_shared<NiceMock<MockObjectDetector>>();
    encoder_ = std::make_shared<NiceMock<MockImageEncoder>>(kDimension);
    settings_.embedding_dimension = kDimension;
  }

  std::shared_ptr<NiceMock<MockObjectDetector>> detector_;
  std::shared_ptr<NiceMock<MockImageEncoder>> encoder_;
  FeatureExtractorSettings settings_;
};

TEST_F(FeatureExtractorTest, Analyze_EmptyGrayScene) {
  FeatureExtractor extractor(detector_, encoder_, settings_);

  RoomSignature signature =
      extractor.analyze(TestUtilities::solid_image(320, 240, cv::Scalar(128, 128, 128)));

  EXPECT_TRUE(signature.detected_objects.empty());
  EXPECT_EQ(signature.embedding.size(), kDimension);
  EXPECT_TRUE(is_unit_norm(signature.embedding));
  EXPECT_GE(signature.confidence_score, 0.0f);
  EXPECT_LE(signature.confidence_score, 1.0f);
  EXPECT_FALSE(signature.degraded);
  EXPECT_EQ(signature.style, "Contemporary");
  ASSERT_EQ(signature.palette.size(), 1u);
  EXPECT_EQ(signature.palette[0].name, "Gray");
  ASSERT_EQ(signature.wall_spaces.size(), 1u);
  EXPECT_EQ(signature.wall_spaces[0].location, "center_wall");
}

TEST_F(FeatureExtractorTest, Analyze_FiltersDetectionsByThresholdAndAllowList) {
  EXPECT_CALL(*detector_, detect(_))
      .WillOnce(Return(std::vector<DetectedObject>{
          raw_detection("chair", 0.6f, BoundingBox{10, 20, 50, 100}),
          raw_detection("toaster", 0.95f, BoundingBox{0, 0, 5, 5}),
          raw_detection("couch", 0.2f, BoundingBox{0, 0, 5, 5}),
          raw_detection("brick wall", 0.9f, BoundingBox{0, 0, 100, 40})}));
  FeatureExtractor extractor(detector_, encoder_, settings_);

  RoomSignature signature =
      extractor.analyze(TestUtilities::solid_image(200, 200, cv::Scalar(90, 140, 190)));

  ASSERT_EQ(signature.detected_objects.size(), 2u);
  EXPECT_EQ(signature.detected_objects[0].label, "brick wall");
  EXPECT_EQ(signature.detected_objects[1].label, "chair");
  EXPECT_FLOAT_EQ(signature.detected_objects[1].area, 40.0f * 80.0f);
  EXPECT_FLOAT_EQ(signature.detected_objects[1].centroid.x, 30.0f);
  EXPECT_FLOAT_EQ(signature.detected_objects[1].centroid.y, 60.0f);
  EXPECT_EQ(signature.style, "Minimalist");
}

TEST_F(FeatureExtractorTest, Analyze_DetectorFailureDegradesButKeepsEmbedding) {
  EXPECT_CALL(*detector_, detect(_)).WillOnce(Throw(std::runtime_error("inference failed")));
  FeatureExtractor extractor(detector_, encoder_, settings_);

  RoomSignature signature =
      extractor.analyze(TestUtilities::solid_image(64, 64, cv::Scalar(128, 128, 128)));

  EXPECT_TRUE(signature.degraded);
  EXPECT_TRUE(signature.detected_objects.empty());
  EXPECT_EQ(signature.embedding, uniform_unit_vector(kDimension));
  EXPECT_FLOAT_EQ(signature.confidence_score, 0.0f);
}

TEST_F(FeatureExtractorTest, Analyze_MissingDetectorReportsZeroConfidence) {
  FeatureExtractor extractor(nullptr, encoder_, settings_);

  RoomSignature signature =
      extractor.analyze(TestUtilities::solid_image(64, 64, cv::Scalar(128, 128, 128)));

  EXPECT_TRUE(signature.degraded);
  EXPECT_FLOAT_EQ(signature.confidence_score, 0.0f);
  EXPECT_EQ(signature.embedding.size(), kDimension);
}

TEST_F(FeatureExtractorTest, Analyze_ZeroEncoderOutputDegradesInsteadOfThrowing) {
  EXPECT_CALL(*encoder_, encode(_)).WillOnce(Return(std::vector<float>(kDimension, 0.0f)));
  FeatureExtractor extractor(detector_, encoder_, settings_);

  RoomSignature signature;
  ASSERT_NO_THROW(signature = extractor.analyze(
                      TestUtilities::solid_image(64, 64, cv::Scalar(128, 128, 128))));

  EXPECT_TRUE(signature.degraded);
  EXPECT_FLOAT_EQ(signature.confidence_score, 0.0f);
  EXPECT_EQ(signature.style, "Contemporary");
  EXPECT_EQ(signature.embedding, uniform_unit_vector(kDimension));
}

TEST_F(FeatureExtractorTest, Analyze_NanEncoderOutputDegradesInsteadOfThrowing) {
  EXPECT_CALL(*encoder_, encode(_))
      .WillOnce(Return(std::vector<float>(kDimension, std::numeric_limits<float>::quiet_NaN())));
  FeatureExtractor extractor(detector_, encoder_, settings_);

  RoomSignature signature;
  ASSERT_NO_THROW(signature = extractor.analyze(
                      TestUtilities::solid_image(64, 64, cv::Scalar(128, 128, 128))));

  EXPECT_TRUE(signature.degraded);
  EXPECT_EQ(signature.embedding, uniform_unit_vector(kDimension));
}

TEST_F(FeatureExtractorTest, Analyze_UnnormalizedEncoderOutputIsNormalized) {
  std::vector<float> scaled(kDimension, 0.0f);
  scaled[2] = 3.0f;
  EXPECT_CALL(*encoder_, encode(_)).WillOnce(Return(scaled));
  FeatureExtractor extractor(detector_, encoder_, settings_);

  RoomSignature signature =
      extractor.analyze(TestUtilities::solid_image(64, 64, cv::Scalar(128, 128, 128)));

  EXPECT_FALSE(signature.degraded);
  EXPECT_EQ(signature.embedding, TestUtilities::unit_vector(kDimension, 2));
}

TEST_F(FeatureExtractorTest, Analyze_MissingModelsYieldDegradedSignature) {
  FeatureExtractor extractor(nullptr, nullptr, settings_);

  RoomSignature signature =
      extractor.analyze(TestUtilities::solid_image(64, 64, cv::Scalar(128, 128, 128)));

  EXPECT_TRUE(signature.degraded);
  EXPECT_FLOAT_EQ(signature.confidence_score, 0.0f);
  EXPECT_EQ(signature.style, "Contemporary");
  EXPECT_EQ(signature.embedding, uniform_unit_vector(kDimension));
  EXPECT_FALSE(signature.palette.empty());
}

TEST_F(FeatureExtractorTest, Analyze_EncoderFailureFallsBackToNeutralEmbedding) {
  EXPECT_CALL(*encoder_, encode(_)).WillOnce(Throw(std::runtime_error("forward failed")));
  FeatureExtractor extractor(detector_, encoder_, settings_);

  RoomSignature signature =
      extractor.analyze(TestUtilities::solid_image(64, 64, cv::Scalar(200, 200, 200)));

  EXPECT_TRUE(signature.degraded);
  EXPECT_FLOAT_EQ(signature.confidence_score, 0.0f);
  EXPECT_EQ(signature.embedding, uniform_unit_vector(kDimension));
}

TEST_F(FeatureExtractorTest, Analyze_WrongEncoderWidthIsFatal) {
  EXPECT_CALL(*encoder_, encode(_)).WillOnce(Return(uniform_unit_vector(kDimension * 2)));
  FeatureExtractor extractor(detector_, encoder_, settings_);

  EXPECT_THROW(extractor.analyze(TestUtilities::solid_image(64, 64, cv::Scalar(1, 2, 3))),
               DimensionMismatch);
}

TEST_F(FeatureExtractorTest, Constructor_RejectsEncoderOfOtherWidth) {
  auto wide_encoder = std::make_shared<NiceMock<MockImageEncoder>>(kDimension + 1);
  EXPECT_THROW((void)FeatureExtractor(detector_, wide_encoder, settings_), DimensionMismatch);
}

TEST_F(FeatureExtractorTest, Analyze_EmptyImageIsUnprocessable) {
  FeatureExtractor extractor(detector_, encoder_, settings_);
  EXPECT_THROW(extractor.analyze(cv::Mat()), UnprocessableImage);
}

TEST_F(FeatureExtractorTest, Analyze_GrayscaleInputIsAccepted) {
  FeatureExtractor extractor(detector_, encoder_, settings_);
  cv::Mat gray(48, 48, CV_8UC1, cv::Scalar(100));

  RoomSignature signature = extractor.analyze(gray);

  EXPECT_EQ(signature.embedding.size(), kDimension);
  EXPECT_EQ(signature.lighting.brightness, "Dim");
}

}  // namespace artmatch_core
