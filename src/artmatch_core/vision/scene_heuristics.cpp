#include "artmatch_core/vision/scene_heuristics.hpp"

#include <algorithm>

namespace artmatch_core {

namespace {

bool is_furniture(const std::string &label) {
  return label == "couch" || label == "chair" || label == "bed" || label == "dining table";
}

bool has_label(const std::vector<DetectedObject> &objects, const std::string &label) {
  return std::any_of(objects.begin(), objects.end(),
                     [&](const DetectedObject &o) { return o.label == label; });
}

float overlap_area(const BoundingBox &a, const BoundingBox &b) {
  const float w = std::min(a.x2, b.x2) - std::max(a.x1, b.x1);
  const float h = std::min(a.y2, b.y2) - std::max(a.y1, b.y1);
  return (w > 0.0f && h > 0.0f) ? w * h : 0.0f;
}

}  // namespace

std::string classify_style(const std::vector<DetectedObject> &objects) {
  if (objects.empty()) {
    return "Contemporary";
  }

  int furniture_count = 0;
  int plant_count = 0;
  for (const auto &object : objects) {
    if (is_furniture(object.label)) furniture_count++;
    if (object.label.find("plant") != std::string::npos) plant_count++;
  }

  if (furniture_count <= 3) {
    if (has_label(objects, "laptop") || has_label(objects, "tv") || has_label(objects, "book")) {
      return "Modern Minimalist";
    }
    return "Minimalist";
  }
  if (plant_count >= 2) {
    return "Bohemian";
  }
  if (furniture_count >= 5) {
    return "Traditional";
  }
  if (has_label(objects, "chair") && has_label(objects, "lamp")) {
    return "Industrial";
  }
  return "Contemporary";
}

float compute_confidence(const std::vector<DetectedObject> &objects,
                         const std::vector<PaletteColor> &palette, bool has_model_embedding) {
  float object_confidence = 0.3f;
  if (!objects.empty()) {
    float total = 0.0f;
    for (const auto &object : objects) {
      total += object.confidence;
    }
    object_confidence = total / static_cast<float>(objects.size());
  }
  const float palette_confidence = std::min(static_cast<float>(palette.size()) / 5.0f, 1.0f);
  const float embedding_confidence = has_model_embedding ? 0.9f : 0.5f;

  const float score =
      0.5f * object_confidence + 0.2f * palette_confidence + 0.3f * embedding_confidence;
  return std::clamp(score, 0.0f, 1.0f);
}

std::vector<WallSpace> detect_wall_spaces(const std::vector<DetectedObject> &objects,
                                          int image_width, int image_height) {
  const float w = static_cast<float>(image_width);
  const float h = static_cast<float>(image_height);

  if (objects.empty()) {
    return {WallSpace{"center_wall", BoundingBox{0.2f * w, 0.2f * h, 0.8f * w, 0.8f * h},
                      "large"}};
  }

  const struct {
    const char *location;
    float left;
    float right;
  } regions[] = {{"left_wall", 0.05f, 0.35f},
                 {"center_wall", 0.35f, 0.65f},
                 {"right_wall", 0.65f, 0.95f}};

  std::vector<WallSpace> spaces;
  for (const auto &region : regions) {
    BoundingBox box{region.left * w, 0.1f * h, region.right * w, 0.5f * h};
    if (box.area() <= 0.0f) {
      continue;
    }
    float covered = 0.0f;
    for (const auto &object : objects) {
      covered += overlap_area(box, object.bbox);
    }
    // Overlapping detections are counted twice
    const float coverage = std::min(1.0f, covered / box.area());
    if (coverage >= 0.25f) {
      continue;
    }
    std::string size = coverage < 0.05f ? "large" : (coverage < 0.15f ? "medium" : "small");
    spaces.push_back(WallSpace{region.location, box, size});
  }
  return spaces;
}

}  // namespace artmatch_core
