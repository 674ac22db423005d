#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace artmatch_core {

struct BoundingBox {
  float x1 = 0.0f;
  float y1 = 0.0f;
  float x2 = 0.0f;
  float y2 = 0.0f;

  float width() const { return x2 - x1; }
  float height() const { return y2 - y1; }
  float area() const { return width() * height(); }
};

struct Point {
  float x = 0.0f;
  float y = 0.0f;
};

struct DetectedObject {
  std::string label;
  float confidence = 0.0f;
  BoundingBox bbox;
  // Filled in by the extractor for the spatial heuristics
  float area = 0.0f;
  Point centroid;
};

struct PaletteColor {
  int r = 0;
  int g = 0;
  int b = 0;
  std::string hex;
  float percentage = 0.0f;  // share of sampled pixels, 0..100
  std::string name;
};

struct LightingDescriptor {
  std::string brightness = "Natural, Bright";
  std::string temperature = "Neutral";
  float avg_brightness = 140.0f;
  float contrast = 0.4f;
  float temperature_score = 0.0f;
  int min_luminance = 0;
  int max_luminance = 255;
};

// Blank wall region suitable for hanging art.
struct WallSpace {
  std::string location;
  BoundingBox bbox;
  std::string size;
};

struct RoomSignature {
  std::vector<float> embedding;
  std::vector<DetectedObject> detected_objects;
  std::vector<PaletteColor> palette;
  LightingDescriptor lighting;
  std::vector<WallSpace> wall_spaces;
  std::string style = "Contemporary";
  float confidence_score = 0.0f;
  // True when a model was unavailable or inference failed for this image
  bool degraded = false;
};

void to_json(nlohmann::json &j, const BoundingBox &box);
void to_json(nlohmann::json &j, const DetectedObject &object);
void to_json(nlohmann::json &j, const PaletteColor &color);
void to_json(nlohmann::json &j, const LightingDescriptor &lighting);
void to_json(nlohmann::json &j, const WallSpace &wall_space);
// The embedding is omitted; callers that need it read it from the struct.
void to_json(nlohmann::json &j, const RoomSignature &signature);

}  // namespace artmatch_core
