#pragma once

#include <memory>
#include <string>
#include <vector>

#include "artmatch_core/index/vector_index.hpp"
#include "artmatch_core/services/default_candidates.hpp"
#include "artmatch_core/services/reasoning_generator.hpp"
#include "artmatch_core/types/recommendation.hpp"
#include "artmatch_core/vision/feature_extractor.hpp"

namespace artmatch_core {

/**
 * @class RecommendationOrchestrator
 * @brief Runs one request through ANALYZE, RETRIEVE, ENRICH and RESPOND.
 *
 * Only UnprocessableImage and DimensionMismatch escape. An empty or failing
 * index, or a filter that no nearby item satisfies, is answered from the
 * default candidate set. Enrichment failures fall back to template text, and
 * a reasoning thread that cannot be started runs on the calling thread.
 * Defaults and fallback text mark the outcome PARTIAL. The result list is
 * never empty and its order is fixed at retrieval time.
 */
class RecommendationOrchestrator {
 public:
  static constexpr size_t MIN_K = 1;
  static constexpr size_t MAX_K = 50;
  // A filtered search looks this many times deeper before filtering
  static constexpr size_t FILTER_OVERFETCH = 3;

  RecommendationOrchestrator(std::shared_ptr<FeatureExtractor> extractor,
                             std::shared_ptr<VectorIndex> index,
                             std::shared_ptr<ReasoningGenerator> reasoning,
                             DefaultCandidateSet default_candidates, size_t default_top_k);

  RecommendationResult analyze_and_recommend(const RecommendationRequest &request) const;

 private:
  std::shared_ptr<FeatureExtractor> extractor_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<ReasoningGenerator> reasoning_;
  DefaultCandidateSet default_candidates_;
  size_t default_top_k_;

  size_t resolve_k(const RecommendationRequest &request) const;
  std::vector<RecommendationCandidate> retrieve(const RoomSignature &signature, size_t k,
                                                const RetrievalFilter &filter,
                                                bool &used_defaults) const;
  std::vector<RecommendationCandidate> serve_defaults(size_t k) const;
  bool enrich(std::vector<RecommendationCandidate> &candidates, const std::string &room_style,
              const std::vector<std::string> &colors) const;
};

}  // namespace artmatch_core
