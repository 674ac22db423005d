#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "artmatch_core/services/recommendation_orchestrator.hpp"
#include "artmatch_core/types/embedding.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace artmatch_core {

using artmatch_tests::MockImageEncoder;
using artmatch_tests::MockObjectDetector;
using artmatch_tests::MockTextBackend;
using artmatch_tests::MockVectorIndex;
using artmatch_tests::TestUtilities;
using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::Throw;
using testing::Eq;

class RecommendationOrchestratorTest : public ::testing::Test {
 protected:
  static constexpr size_t kDimension = 8;

  void SetUp() override {
    detector_ = std::make_shared<NiceMock<MockObjectDetector>>();
    encoder_ = std::make_shared<NiceMock<MockImageEncoder>>(kDimension);
    // The room always embeds to the first axis
    ON_CALL(*encoder_, encode(_)).WillByDefault(Return(TestUtilities::unit_vector(kDimension, 0)));

    FeatureExtractorSettings settings;
    settings.embedding_dimension = kDimension;
    extractor_ = std::make_shared<FeatureExtractor>(detector_, encoder_, settings);
    index_ = std::make_shared<VectorIndex>(kDimension);

    request_.image = TestUtilities::solid_image(120, 90, cv::Scalar(180, 170, 160));
  }

  void seed_catalog() {
    index_->add({TestUtilities::create_test_item("far", TestUtilities::vector_at_squared_distance(0.9f, kDimension), "Far", "Industrial"),
                 TestUtilities::create_test_item("near", TestUtilities::vector_at_squared_distance(0.1f, kDimension), "Near", "Modern"),
                 TestUtilities::create_test_item("mid", TestUtilities::vector_at_squared_distance(0.5f, kDimension), "Mid", "Abstract")});
  }

  // Same three items, priced near=500, mid=150, far=80
  void seed_priced_catalog() {
    auto far = TestUtilities::create_test_item("far", TestUtilities::vector_at_squared_distance(0.9f, kDimension), "Far", "Industrial");
    auto near = TestUtilities::create_test_item("near", TestUtilities::vector_at_squared_distance(0.1f, kDimension), "Near", "Modern");
    auto mid = TestUtilities::create_test_item("mid", TestUtilities::vector_at_squared_distance(0.5f, kDimension), "Mid", "Abstract");
    far.metadata.price = 80.0;
    near.metadata.price = 500.0;
    mid.metadata.price = 150.0;
    index_->add({far, near, mid});
  }

  std::unique_ptr<RecommendationOrchestrator> make_orchestrator(
      std::vector<std::shared_ptr<TextBackend>> backends,
      ReasoningSettings settings = ReasoningSettings{}, size_t default_top_k = 3) {
    auto generator = std::make_shared<ReasoningGenerator>(std::move(backends), settings);
    return std::make_unique<RecommendationOrchestrator>(
        extractor_, index_, generator, DefaultCandidateSet::builtin(), default_top_k);
  }

  std::unique_ptr<RecommendationOrchestrator> make_orchestrator_over(
      std::shared_ptr<VectorIndex> index, std::vector<std::shared_ptr<TextBackend>> backends) {
    auto generator = std::make_shared<ReasoningGenerator>(std::move(backends), ReasoningSettings{});
    return std::make_unique<RecommendationOrchestrator>(
        extractor_, std::move(index), generator, DefaultCandidateSet::builtin(), 3);
  }

  std::shared_ptr<NiceMock<MockObjectDetector>> detector_;
  std::shared_ptr<NiceMock<MockImageEncoder>> encoder_;
  std::shared_ptr<FeatureExtractor> extractor_;
  std::shared_ptr<VectorIndex> index_;
  RecommendationRequest request_;
};

TEST_F(RecommendationOrchestratorTest, FullOutcomeWhenPreferredBackendAnswers) {
  seed_catalog();
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  auto orchestrator = make_orchestrator({backend});
  request_.k = 2;

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_EQ(result.outcome, RecommendationOutcome::FULL);
  EXPECT_FALSE(result.used_default_candidates);
  ASSERT_EQ(result.recommendations.size(), 2u);
  EXPECT_EQ(result.recommendations[0].item.id, "near");
  EXPECT_EQ(result.recommendations[1].item.id, "mid");
  EXPECT_GT(result.recommendations[0].match_score, result.recommendations[1].match_score);
  EXPECT_NEAR(result.recommendations[0].match_score, 100.0f / 1.1f, 1e-2);
  for (const auto &candidate : result.recommendations) {
    EXPECT_EQ(candidate.provenance, "ollama");
    EXPECT_EQ(candidate.reasoning, "Generated reasoning.");
  }
  EXPECT_GE(result.latency_ms, 0);
}

TEST_F(RecommendationOrchestratorTest, NoBackendsYieldsTemplateTextAndPartialOutcome) {
  seed_catalog();
  auto orchestrator = make_orchestrator({});

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_EQ(result.outcome, RecommendationOutcome::PARTIAL);
  ASSERT_EQ(result.recommendations.size(), 3u);
  for (const auto &candidate : result.recommendations) {
    EXPECT_EQ(candidate.provenance, "template");
    EXPECT_FALSE(candidate.reasoning.empty());
  }
}

TEST_F(RecommendationOrchestratorTest, FallbackOnOneCandidateKeepsCountAndMarksPartial) {
  seed_catalog();
  auto preferred = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  auto backup = std::make_shared<NiceMock<MockTextBackend>>("groq");
  ON_CALL(*preferred, attempt(_)).WillByDefault([](const GenerationRequest &request) -> std::string {
    if (request.input.artwork_title == "Mid") {
      throw BackendRejected("blocked");
    }
    return "Local text.";
  });
  ON_CALL(*backup, attempt(_)).WillByDefault(Return("Remote text."));
  auto orchestrator = make_orchestrator({preferred, backup});

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_EQ(result.outcome, RecommendationOutcome::PARTIAL);
  ASSERT_EQ(result.recommendations.size(), 3u);
  EXPECT_EQ(result.recommendations[0].provenance, "ollama");
  EXPECT_EQ(result.recommendations[1].provenance, "groq");
  EXPECT_EQ(result.recommendations[1].item.id, "mid");
  EXPECT_EQ(result.recommendations[2].provenance, "ollama");
}

TEST_F(RecommendationOrchestratorTest, EnrichmentCompletionOrderDoesNotReorderResults) {
  seed_catalog();
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  // The best match finishes last
  ON_CALL(*backend, attempt(_)).WillByDefault([](const GenerationRequest &request) {
    if (request.input.artwork_title == "Near") {
      std::this_thread::sleep_for(std::chrono::milliseconds(60));
    }
    return "About " + request.input.artwork_title;
  });
  auto orchestrator = make_orchestrator({backend});

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  ASSERT_EQ(result.recommendations.size(), 3u);
  EXPECT_EQ(result.recommendations[0].item.id, "near");
  EXPECT_EQ(result.recommendations[0].reasoning, "About Near");
  EXPECT_EQ(result.recommendations[1].reasoning, "About Mid");
  EXPECT_EQ(result.recommendations[2].reasoning, "About Far");
}

TEST_F(RecommendationOrchestratorTest, TimeoutsAreBoundedAndEveryCandidateGetsText) {
  seed_catalog();
  const auto timeout = std::chrono::milliseconds(40);
  auto slow_a = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  auto slow_b = std::make_shared<NiceMock<MockTextBackend>>("groq");
  auto time_out = [](const GenerationRequest &request) -> std::string {
    std::this_thread::sleep_for(request.timeout);
    throw BackendTimeout("deadline exceeded");
  };
  // Exactly one attempt per backend per candidate, no retries
  EXPECT_CALL(*slow_a, attempt(_)).Times(3).WillRepeatedly(time_out);
  EXPECT_CALL(*slow_b, attempt(_)).Times(3).WillRepeatedly(time_out);

  ReasoningSettings settings;
  settings.timeout = timeout;
  auto orchestrator = make_orchestrator({slow_a, slow_b}, settings);
  request_.k = 3;

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_EQ(result.outcome, RecommendationOutcome::PARTIAL);
  ASSERT_EQ(result.recommendations.size(), 3u);
  for (const auto &candidate : result.recommendations) {
    EXPECT_EQ(candidate.provenance, "template");
    EXPECT_FALSE(candidate.reasoning.empty());
  }
  // k x backends x timeout, plus headroom for analysis and thread start-up
  const long long bound = 3 * 2 * timeout.count();
  EXPECT_LE(result.latency_ms, bound + 500);
}

TEST_F(RecommendationOrchestratorTest, EmptyIndexServesDefaultCandidates) {
  auto orchestrator = make_orchestrator({});
  request_.k = 2;

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_TRUE(result.used_default_candidates);
  EXPECT_EQ(result.outcome, RecommendationOutcome::PARTIAL);
  ASSERT_EQ(result.recommendations.size(), 2u);
  EXPECT_EQ(result.recommendations[0].item.id, "artwork_001");
  EXPECT_FLOAT_EQ(result.recommendations[0].match_score, 95.0f);
  EXPECT_EQ(result.recommendations[1].item.id, "artwork_002");
}

TEST_F(RecommendationOrchestratorTest, EmptyIndexIsPartialEvenWithWorkingBackend) {
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  auto orchestrator = make_orchestrator({backend});

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_EQ(result.outcome, RecommendationOutcome::PARTIAL);
  EXPECT_EQ(result.recommendations.size(), 3u);
  EXPECT_EQ(result.recommendations[0].provenance, "ollama");
}

TEST_F(RecommendationOrchestratorTest, KIsClampedAndDefaulted) {
  seed_catalog();
  auto orchestrator = make_orchestrator({}, ReasoningSettings{}, 1);

  EXPECT_EQ(orchestrator->analyze_and_recommend(request_).recommendations.size(), 1u);

  request_.k = 0;
  EXPECT_EQ(orchestrator->analyze_and_recommend(request_).recommendations.size(), 1u);

  request_.k = 500;
  EXPECT_EQ(orchestrator->analyze_and_recommend(request_).recommendations.size(), 3u);
}

TEST_F(RecommendationOrchestratorTest, HintsFlowIntoReasoningInput) {
  seed_catalog();
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  EXPECT_CALL(*backend, attempt(_)).WillOnce([](const GenerationRequest &request) {
    EXPECT_EQ(request.input.room_style, "Scandinavian");
    EXPECT_EQ(request.input.colors, (std::vector<std::string>{"sage", "oak"}));
    return std::string("Fits.");
  });
  auto orchestrator = make_orchestrator({backend});
  request_.k = 1;
  request_.room_style_hint = "Scandinavian";
  request_.color_hints = std::vector<std::string>{"sage", "oak"};

  orchestrator->analyze_and_recommend(request_);
}

TEST_F(RecommendationOrchestratorTest, WithoutHintsUsesSignatureStyleAndPaletteHex) {
  seed_catalog();
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  EXPECT_CALL(*backend, attempt(_)).WillOnce([](const GenerationRequest &request) {
    EXPECT_EQ(request.input.room_style, "Contemporary");
    // Solid BGR (180, 170, 160) image
    EXPECT_EQ(request.input.colors, (std::vector<std::string>{"#a0aab4"}));
    return std::string("Fits.");
  });
  auto orchestrator = make_orchestrator({backend});
  request_.k = 1;

  orchestrator->analyze_and_recommend(request_);
}

TEST_F(RecommendationOrchestratorTest, UnreadableImageIsSurfaced) {
  seed_catalog();
  auto orchestrator = make_orchestrator({});
  request_.image = cv::Mat();

  EXPECT_THROW(orchestrator->analyze_and_recommend(request_), UnprocessableImage);
}

TEST_F(RecommendationOrchestratorTest, EncoderWidthMismatchIsSurfaced) {
  seed_catalog();
  ON_CALL(*encoder_, encode(_)).WillByDefault(Return(uniform_unit_vector(kDimension + 4)));
  auto orchestrator = make_orchestrator({});

  EXPECT_THROW(orchestrator->analyze_and_recommend(request_), DimensionMismatch);
}

TEST_F(RecommendationOrchestratorTest, ConstructorRejectsIndexOfOtherWidth) {
  auto generator = std::make_shared<ReasoningGenerator>(std::vector<std::shared_ptr<TextBackend>>{},
                                                        ReasoningSettings{});
  auto wide_index = std::make_shared<VectorIndex>(kDimension * 2);

  EXPECT_THROW(RecommendationOrchestrator(extractor_, wide_index, generator,
                                          DefaultCandidateSet::builtin(), 3),
               DimensionMismatch);
}

TEST_F(RecommendationOrchestratorTest, PriceFilterKeepsMatchingItemsInDistanceOrder) {
  // Arrange
  seed_priced_catalog();
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  auto orchestrator = make_orchestrator({backend});
  request_.k = 2;
  request_.filter.max_price = 200.0;

  // Act
  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  // Assert
  EXPECT_FALSE(result.used_default_candidates);
  EXPECT_EQ(result.outcome, RecommendationOutcome::FULL);
  ASSERT_EQ(result.recommendations.size(), 2u);
  EXPECT_EQ(result.recommendations[0].item.id, "mid");
  EXPECT_EQ(result.recommendations[1].item.id, "far");
}

TEST_F(RecommendationOrchestratorTest, StyleFilterReachesPastTheNearestK) {
  seed_priced_catalog();
  auto orchestrator = make_orchestrator({});
  request_.k = 1;
  request_.filter.style = "Industrial";

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_FALSE(result.used_default_candidates);
  ASSERT_EQ(result.recommendations.size(), 1u);
  EXPECT_EQ(result.recommendations[0].item.id, "far");
  EXPECT_NEAR(result.recommendations[0].match_score, 100.0f / 1.9f, 1e-2);
}

TEST_F(RecommendationOrchestratorTest, FilterMatchingNothingServesDefaults) {
  seed_priced_catalog();
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  auto orchestrator = make_orchestrator({backend});
  request_.k = 2;
  request_.filter.min_price = 1000.0;

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  EXPECT_TRUE(result.used_default_candidates);
  EXPECT_EQ(result.outcome, RecommendationOutcome::PARTIAL);
  ASSERT_EQ(result.recommendations.size(), 2u);
  EXPECT_EQ(result.recommendations[0].item.id, "artwork_001");
}

TEST_F(RecommendationOrchestratorTest, FilteredSearchOverFetchesThreeTimesK) {
  auto index = std::make_shared<NiceMock<MockVectorIndex>>(kDimension);
  auto cheap = TestUtilities::create_test_item("cheap", TestUtilities::unit_vector(kDimension, 1), "Cheap", "Modern");
  EXPECT_CALL(*index, search(_, Eq(6u)))
      .WillOnce(Return(std::vector<IndexHit>{IndexHit{2.0f, 0, cheap}}));
  auto orchestrator = make_orchestrator_over(index, {});
  request_.k = 2;
  request_.filter.max_price = 100.0;

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  ASSERT_EQ(result.recommendations.size(), 1u);
  EXPECT_EQ(result.recommendations[0].item.id, "cheap");
}

TEST_F(RecommendationOrchestratorTest, UnfilteredSearchAsksForExactlyK) {
  auto index = std::make_shared<NiceMock<MockVectorIndex>>(kDimension);
  auto item = TestUtilities::create_test_item("only", TestUtilities::unit_vector(kDimension, 0), "Only", "Modern");
  EXPECT_CALL(*index, search(_, Eq(2u)))
      .WillOnce(Return(std::vector<IndexHit>{IndexHit{0.0f, 0, item}}));
  auto orchestrator = make_orchestrator_over(index, {});
  request_.k = 2;

  RecommendationResult result = orchestrator->analyze_and_recommend(request_);

  ASSERT_EQ(result.recommendations.size(), 1u);
  EXPECT_FLOAT_EQ(result.recommendations[0].match_score, 100.0f);
}

TEST_F(RecommendationOrchestratorTest, IndexFailureServesDefaultsInsteadOfThrowing) {
  // Arrange
  auto index = std::make_shared<NiceMock<MockVectorIndex>>(kDimension);
  EXPECT_CALL(*index, search(_, _))
      .WillOnce(Throw(VectorIndexError("Faiss search failed: out of memory")));
  auto backend = std::make_shared<NiceMock<MockTextBackend>>("ollama");
  auto orchestrator = make_orchestrator_over(index, {backend});
  request_.k = 3;

  // Act
  RecommendationResult result;
  ASSERT_NO_THROW(result = orchestrator->analyze_and_recommend(request_));

  // Assert
  EXPECT_TRUE(result.used_default_candidates);
  EXPECT_EQ(result.outcome, RecommendationOutcome::PARTIAL);
  ASSERT_EQ(result.recommendations.size(), 3u);
  for (const auto &candidate : result.recommendations) {
    EXPECT_EQ(candidate.provenance, "ollama");
  }
}

}  // namespace artmatch_core
