#include "artmatch_core/types/room_signature.hpp"

namespace artmatch_core {

void to_json(nlohmann::json &j, const BoundingBox &box) {
  j = nlohmann::json::array({box.x1, box.y1, box.x2, box.y2});
}

void to_json(nlohmann::json &j, const DetectedObject &object) {
  j = nlohmann::json{{"label", object.label},
                     {"confidence", object.confidence},
                     {"bbox", object.bbox},
                     {"area", object.area},
                     {"center", {object.centroid.x, object.centroid.y}}};
}

void to_json(nlohmann::json &j, const PaletteColor &color) {
  j = nlohmann::json{{"r", color.r},
                     {"g", color.g},
                     {"b", color.b},
                     {"hex", color.hex},
                     {"percentage", color.percentage},
                     {"name", color.name}};
}

void to_json(nlohmann::json &j, const LightingDescriptor &lighting) {
  j = nlohmann::json{{"brightness", lighting.brightness},
                     {"temperature", lighting.temperature},
                     {"avg_brightness", lighting.avg_brightness},
                     {"contrast", lighting.contrast},
                     {"temperature_score", lighting.temperature_score},
                     {"dynamic_range",
                      {{"min", lighting.min_luminance},
                       {"max", lighting.max_luminance},
                       {"range", lighting.max_luminance - lighting.min_luminance}}}};
}

void to_json(nlohmann::json &j, const WallSpace &wall_space) {
  j = nlohmann::json{
      {"location", wall_space.location}, {"bbox", wall_space.bbox}, {"size", wall_space.size}};
}

void to_json(nlohmann::json &j, const RoomSignature &signature) {
  j = nlohmann::json{{"style", signature.style},
                     {"confidence_score", signature.confidence_score},
                     {"degraded", signature.degraded},
                     {"embedding_dimension", signature.embedding.size()},
                     {"palette", signature.palette},
                     {"lighting", signature.lighting},
                     {"detected_objects", signature.detected_objects},
                     {"wall_spaces", signature.wall_spaces}};
}

}  // namespace artmatch_core
