#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include "artmatch_core/types/catalog_item.hpp"
#include "artmatch_core/types/room_signature.hpp"

namespace artmatch_core {

enum class RecommendationOutcome { FULL, PARTIAL };

inline std::string to_string(RecommendationOutcome outcome) {
  switch (outcome) {
    case RecommendationOutcome::FULL:
      return "FULL";
    case RecommendationOutcome::PARTIAL:
      return "PARTIAL";
    default:
      return "UNKNOWN";
  }
}

// Provenance label for text assembled without any backend.
inline const std::string TEMPLATE_PROVENANCE = "template";

struct RecommendationCandidate {
  CatalogItem item;
  float distance = 0.0f;
  float match_score = 0.0f;  // 0..100, higher is closer
  std::string reasoning;
  std::string provenance;
};

// Optional constraints on retrieved catalog items. Bounds are inclusive and
// style is compared exactly.
struct RetrievalFilter {
  std::optional<double> min_price;
  std::optional<double> max_price;
  std::optional<std::string> style;

  bool active() const;
  bool matches(const ArtworkMetadata &metadata) const;
};

struct RecommendationRequest {
  cv::Mat image;  // decoded image, see decode_image()
  std::optional<std::string> room_style_hint;
  std::optional<std::vector<std::string>> color_hints;
  std::optional<size_t> k;
  RetrievalFilter filter;
};

struct RecommendationResult {
  std::vector<RecommendationCandidate> recommendations;
  RecommendationOutcome outcome = RecommendationOutcome::FULL;
  long long latency_ms = 0;
  RoomSignature signature;
  bool used_default_candidates = false;
};

// Monotonic, bounded transform of an index distance: 0 maps to 100 and the
// score falls towards 0 as the distance grows.
float distance_to_match_score(float distance);

// Inverse of distance_to_match_score, used for candidates that carry a fixed score.
float match_score_to_distance(float match_score);

void to_json(nlohmann::json &j, const RecommendationCandidate &candidate);
void to_json(nlohmann::json &j, const RecommendationResult &result);

}  // namespace artmatch_core
