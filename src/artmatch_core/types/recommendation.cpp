#include "artmatch_core/types/recommendation.hpp"

#include <algorithm>

namespace artmatch_core {

float distance_to_match_score(float distance) {
  if (!(distance > 0.0f)) {
    return 100.0f;
  }
  return std::clamp(100.0f / (1.0f + distance), 0.0f, 100.0f);
}

float match_score_to_distance(float match_score) {
  float clamped = std::clamp(match_score, 0.01f, 100.0f);
  return 100.0f / clamped - 1.0f;
}

bool RetrievalFilter::active() const {
  return min_price.has_value() || max_price.has_value() || style.has_value();
}

bool RetrievalFilter::matches(const ArtworkMetadata &metadata) const {
  if (min_price && metadata.price < *min_price) {
    return false;
  }
  if (max_price && metadata.price > *max_price) {
    return false;
  }
  return !style || metadata.style == *style;
}

void to_json(nlohmann::json &j, const RecommendationCandidate &candidate) {
  const ArtworkMetadata &metadata = candidate.item.metadata;
  j = nlohmann::json{{"id", candidate.item.id},
                     {"title", metadata.title},
                     {"artist", metadata.artist},
                     {"price", metadata.price},
                     {"image_url", metadata.image_url},
                     {"thumbnail_url", metadata.thumbnail_url},
                     {"tags", metadata.tags},
                     {"style", metadata.style},
                     {"medium", metadata.medium},
                     {"dimensions", metadata.dimensions},
                     {"match_score", candidate.match_score},
                     {"reasoning", candidate.reasoning},
                     {"provenance", candidate.provenance}};
}

void to_json(nlohmann::json &j, const RecommendationResult &result) {
  j = nlohmann::json{{"recommendations", result.recommendations},
                     {"total_matches", result.recommendations.size()},
                     {"outcome", to_string(result.outcome)},
                     {"latency_ms", result.latency_ms},
                     {"used_default_candidates", result.used_default_candidates},
                     {"room", result.signature}};
}

}  // namespace artmatch_core
