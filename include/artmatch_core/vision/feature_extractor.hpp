#pragma once

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

#include "artmatch_core/types/room_signature.hpp"
#include "artmatch_core/vision/color_palette.hpp"
#include "artmatch_core/vision/image_encoder.hpp"
#include "artmatch_core/vision/object_detector.hpp"

namespace artmatch_core {

struct FeatureExtractorSettings {
  size_t embedding_dimension = 512;
  float detection_confidence_threshold = 0.3f;
  PaletteSettings palette;
};

/**
 * @class FeatureExtractor
 * @brief Turns a decoded room photo into a RoomSignature.
 *
 * Either model may be null. A missing or failing model never fails the call;
 * the signature is marked degraded and its confidence_score is 0. An encoder
 * output with a zero or non-finite norm counts as a failed model. Only an unreadable image
 * (UnprocessableImage) or an encoder of the wrong width (DimensionMismatch)
 * propagate to the caller.
 */
class FeatureExtractor {
 public:
  FeatureExtractor(std::shared_ptr<ObjectDetector> detector,
                   std::shared_ptr<ImageEncoder> encoder, FeatureExtractorSettings settings);

  RoomSignature analyze(const cv::Mat &image) const;

  size_t embedding_dimension() const { return settings_.embedding_dimension; }

  // Labels kept from the detector. Anything containing "wall" is kept as well.
  static bool is_relevant_label(const std::string &label);

 private:
  std::shared_ptr<ObjectDetector> detector_;
  std::shared_ptr<ImageEncoder> encoder_;
  FeatureExtractorSettings settings_;

  std::vector<DetectedObject> detect_objects(const cv::Mat &bgr, bool &failed) const;
  std::vector<float> encode_image(const cv::Mat &bgr, bool &failed) const;
};

}  // namespace artmatch_core
