#include "artmatch_core/services/recommendation_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace artmatch_core {

RecommendationOrchestrator::RecommendationOrchestrator(
    std::shared_ptr<FeatureExtractor> extractor, std::shared_ptr<VectorIndex> index,
    std::shared_ptr<ReasoningGenerator> reasoning, DefaultCandidateSet default_candidates,
    size_t default_top_k)
    : extractor_(std::move(extractor)),
      index_(std::move(index)),
      reasoning_(std::move(reasoning)),
      default_candidates_(std::move(default_candidates)),
      default_top_k_(std::clamp(default_top_k, MIN_K, MAX_K)) {
  if (!extractor_ || !index_ || !reasoning_) {
    throw std::invalid_argument("Orchestrator requires an extractor, an index and a generator");
  }
  if (extractor_->embedding_dimension() != index_->dimension()) {
    throw DimensionMismatch("Feature extractor produces " +
                            std::to_string(extractor_->embedding_dimension()) +
                            "-dim embeddings but the index holds " +
                            std::to_string(index_->dimension()) + "-dim vectors");
  }
}

size_t RecommendationOrchestrator::resolve_k(const RecommendationRequest &request) const {
  if (!request.k) {
    return default_top_k_;
  }
  return std::clamp(*request.k, MIN_K, MAX_K);
}

std::vector<RecommendationCandidate> RecommendationOrchestrator::serve_defaults(size_t k) const {
  std::vector<RecommendationCandidate> candidates;
  for (auto &fallback : default_candidates_.select(k)) {
    RecommendationCandidate candidate;
    candidate.item = std::move(fallback.item);
    candidate.match_score = fallback.match_score;
    candidate.distance = match_score_to_distance(fallback.match_score);
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

std::vector<RecommendationCandidate> RecommendationOrchestrator::retrieve(
    const RoomSignature &signature, size_t k, const RetrievalFilter &filter,
    bool &used_defaults) const {
  used_defaults = true;
  std::vector<IndexHit> hits;
  try {
    hits = index_->search(signature.embedding, filter.active() ? k * FILTER_OVERFETCH : k);
  } catch (const EmptyIndexError &) {
    std::cerr << "Catalog index is empty, serving " << std::min(k, default_candidates_.size())
              << " default candidates" << std::endl;
    return serve_defaults(k);
  } catch (const VectorIndexError &e) {
    std::cerr << "Warning: " << e.what() << ", serving default candidates" << std::endl;
    return serve_defaults(k);
  }

  std::vector<RecommendationCandidate> candidates;
  for (auto &hit : hits) {
    if (candidates.size() >= k) {
      break;
    }
    if (!filter.matches(hit.item.metadata)) {
      continue;
    }
    RecommendationCandidate candidate;
    candidate.item = std::move(hit.item);
    candidate.distance = hit.distance;
    candidate.match_score = distance_to_match_score(hit.distance);
    candidates.push_back(std::move(candidate));
  }
  if (candidates.empty()) {
    std::cerr << "No catalog items among " << hits.size()
              << " nearest match the filter, serving default candidates" << std::endl;
    return serve_defaults(k);
  }
  used_defaults = false;
  return candidates;
}

bool RecommendationOrchestrator::enrich(std::vector<RecommendationCandidate> &candidates,
                                        const std::string &room_style,
                                        const std::vector<std::string> &colors) const {
  std::vector<std::future<Reasoning>> pending;
  pending.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    ReasoningInput input;
    input.artwork_title = candidate.item.metadata.title;
    input.artwork_style = candidate.item.metadata.style;
    input.room_style = room_style;
    input.colors = colors;
    input.match_score = candidate.match_score;
    auto task = [this, input] { return reasoning_->explain(input); };
    try {
      pending.push_back(std::async(std::launch::async, task));
    } catch (const std::system_error &e) {
      // No thread available, run this candidate on the calling thread at get()
      std::cerr << "Warning: could not start reasoning thread (" << e.what() << ")" << std::endl;
      pending.push_back(std::async(std::launch::deferred, task));
    }
  }

  // Results attach by position, so completion order cannot reorder the list
  bool all_preferred = true;
  for (size_t i = 0; i < candidates.size(); ++i) {
    Reasoning reasoning = pending[i].get();
    candidates[i].reasoning = std::move(reasoning.text);
    candidates[i].provenance = std::move(reasoning.provenance);
    all_preferred = all_preferred && reasoning.from_preferred;
  }
  return all_preferred;
}

RecommendationResult RecommendationOrchestrator::analyze_and_recommend(
    const RecommendationRequest &request) const {
  const auto start = std::chrono::steady_clock::now();
  const size_t k = resolve_k(request);

  RecommendationResult result;

  // ANALYZE
  result.signature = extractor_->analyze(request.image);

  // RETRIEVE
  result.recommendations =
      retrieve(result.signature, k, request.filter, result.used_default_candidates);

  // ENRICH
  const std::string room_style =
      request.room_style_hint && !request.room_style_hint->empty() ? *request.room_style_hint
                                                                   : result.signature.style;
  std::vector<std::string> colors;
  if (request.color_hints && !request.color_hints->empty()) {
    colors = *request.color_hints;
  } else {
    for (const auto &color : result.signature.palette) {
      colors.push_back(color.hex);
    }
  }
  const bool all_preferred = enrich(result.recommendations, room_style, colors);

  // RESPOND
  result.outcome = (all_preferred && !result.used_default_candidates)
                       ? RecommendationOutcome::FULL
                       : RecommendationOutcome::PARTIAL;
  result.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count();
  return result;
}

}  // namespace artmatch_core
