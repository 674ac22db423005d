#include "artmatch_core/vision/feature_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

#include "artmatch_core/types/embedding.hpp"
#include "artmatch_core/types/errors.hpp"
#include "artmatch_core/vision/image_decoder.hpp"
#include "artmatch_core/vision/lighting_analyzer.hpp"
#include "artmatch_core/vision/scene_heuristics.hpp"

namespace artmatch_core {

FeatureExtractor::FeatureExtractor(std::shared_ptr<ObjectDetector> detector,
                                   std::shared_ptr<ImageEncoder> encoder,
                                   FeatureExtractorSettings settings)
    : detector_(std::move(detector)), encoder_(std::move(encoder)), settings_(settings) {
  if (settings_.embedding_dimension == 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
  if (encoder_ && encoder_->dimension() != settings_.embedding_dimension) {
    throw DimensionMismatch("Encoder produces " + std::to_string(encoder_->dimension()) +
                            "-dim embeddings, deployment expects " +
                            std::to_string(settings_.embedding_dimension));
  }
}

bool FeatureExtractor::is_relevant_label(const std::string &label) {
  static const std::unordered_set<std::string> relevant = {
      "couch", "chair", "bed",  "dining table", "potted plant", "tv",
      "laptop", "book", "clock", "vase",         "lamp",         "person"};
  return relevant.count(label) > 0 || label.find("wall") != std::string::npos;
}

std::vector<DetectedObject> FeatureExtractor::detect_objects(const cv::Mat &bgr,
                                                             bool &failed) const {
  std::vector<DetectedObject> kept;
  if (!detector_) {
    failed = true;
    return kept;
  }

  std::vector<DetectedObject> raw;
  try {
    raw = detector_->detect(bgr);
  } catch (const std::exception &e) {
    std::cerr << "Warning: object detection failed, continuing without objects: " << e.what()
              << std::endl;
    failed = true;
    return kept;
  }

  for (auto &object : raw) {
    if (object.confidence <= settings_.detection_confidence_threshold ||
        !is_relevant_label(object.label)) {
      continue;
    }
    object.area = std::max(0.0f, object.bbox.area());
    object.centroid = Point{(object.bbox.x1 + object.bbox.x2) / 2.0f,
                            (object.bbox.y1 + object.bbox.y2) / 2.0f};
    kept.push_back(std::move(object));
  }
  std::stable_sort(kept.begin(), kept.end(), [](const DetectedObject &a, const DetectedObject &b) {
    return a.confidence > b.confidence;
  });
  return kept;
}

std::vector<float> FeatureExtractor::encode_image(const cv::Mat &bgr, bool &failed) const {
  if (!encoder_) {
    failed = true;
    return {};
  }
  try {
    std::vector<float> embedding = encoder_->encode(bgr);
    if (embedding.size() != settings_.embedding_dimension) {
      throw DimensionMismatch("Room embedding dimension mismatch. Expected " +
                              std::to_string(settings_.embedding_dimension) + ", got " +
                              std::to_string(embedding.size()));
    }
    // A zero or non-finite output is a failed forward pass, not a width defect
    const float norm = l2_norm(embedding);
    if (!std::isfinite(norm) || norm <= 0.0f) {
      std::cerr << "Warning: image encoder returned a degenerate embedding (norm " << norm
                << "), using neutral embedding" << std::endl;
      failed = true;
      return {};
    }
    l2_normalize(embedding);
    return embedding;
  } catch (const DimensionMismatch &) {
    throw;
  } catch (const std::exception &e) {
    std::cerr << "Warning: image encoding failed, using neutral embedding: " << e.what()
              << std::endl;
    failed = true;
    return {};
  }
}

RoomSignature FeatureExtractor::analyze(const cv::Mat &image) const {
  const cv::Mat bgr = to_bgr(image);

  RoomSignature signature;
  bool detector_failed = false;
  bool encoder_failed = false;

  signature.detected_objects = detect_objects(bgr, detector_failed);
  signature.embedding = encode_image(bgr, encoder_failed);

  try {
    signature.palette = extract_palette(bgr, settings_.palette);
  } catch (const cv::Exception &e) {
    std::cerr << "Warning: palette extraction failed, using default palette: " << e.what()
              << std::endl;
    signature.palette = default_palette();
  }
  try {
    signature.lighting = analyze_lighting(bgr);
  } catch (const cv::Exception &e) {
    std::cerr << "Warning: lighting analysis failed, using defaults: " << e.what() << std::endl;
    signature.lighting = LightingDescriptor{};
  }

  signature.wall_spaces = detect_wall_spaces(signature.detected_objects, bgr.cols, bgr.rows);
  signature.degraded = detector_failed || encoder_failed;

  if (encoder_failed) {
    signature.embedding = uniform_unit_vector(settings_.embedding_dimension);
    signature.style = "Contemporary";
  } else {
    signature.style = classify_style(signature.detected_objects);
  }
  // Any missing or failed model leaves the signature without a confidence
  signature.confidence_score =
      signature.degraded
          ? 0.0f
          : compute_confidence(signature.detected_objects, signature.palette, true);
  return signature;
}

}  // namespace artmatch_core
