#include <gtest/gtest.h>

#include <memory>

#include "artmatch_core/llm/backend_factory.hpp"
#include "../../common/mocks_test.hpp"

namespace artmatch_core {

TEST(BackendFactoryTest, BuildsBackendsInConfiguredOrderSkippingDisabled) {
  ReasoningConfig config;
  config.backends = {BackendConfig{"ollama", "", "", "", true},
                     BackendConfig{"groq", "", "", "gsk-key", true},
                     BackendConfig{"gemini", "", "", "g-key", false},
                     BackendConfig{"openai", "", "", "", true}};

  auto backends = make_text_backends(config, std::make_shared<artmatch_tests::MockHttpTransport>());

  ASSERT_EQ(backends.size(), 3u);
  EXPECT_EQ(backends[0]->name(), "ollama");
  EXPECT_EQ(backends[1]->name(), "groq");
  EXPECT_EQ(backends[2]->name(), "openai");
  EXPECT_TRUE(backends[0]->is_available());
  EXPECT_TRUE(backends[1]->is_available());
  // No credential resolved for openai
  EXPECT_FALSE(backends[2]->is_available());
}

TEST(BackendFactoryTest, EmptyConfigBuildsNothing) {
  EXPECT_TRUE(make_text_backends(ReasoningConfig{}, nullptr).empty());
}

TEST(BackendFactoryTest, UnknownTypeThrows) {
  ReasoningConfig config;
  config.backends = {BackendConfig{"carrier-pigeon", "", "", "", true}};

  EXPECT_THROW(make_text_backends(config, nullptr), std::invalid_argument);
}

}  // namespace artmatch_core
