#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace artmatch_core {

// One entry of the ordered reasoning preference list.
struct BackendConfig {
  std::string type;  // ollama, openai, groq or gemini
  std::string model;
  std::string base_url;
  std::string api_key;  // already resolved from api_key_env when that was given
  bool enabled = true;
};

struct ReasoningConfig {
  std::vector<BackendConfig> backends;
  int timeout_seconds = 20;
  int max_tokens = 150;
  float temperature = 0.7f;
};

struct DefaultCandidatesConfig {
  // Catalog item objects carrying a match_score. Empty means the built-in seed set.
  std::vector<nlohmann::json> items;
};

class Config {
 public:
  std::string catalog_db_path;
  size_t embedding_dimension;

  // Vision models. An empty path runs that stage degraded.
  std::string detector_model_path;
  std::string encoder_model_path;
  int detector_input_size;
  int encoder_input_size;
  float detection_confidence_threshold;
  int palette_clusters;
  int palette_sample_size;

  int default_top_k;
  ReasoningConfig reasoning;
  DefaultCandidatesConfig default_candidates;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }
    Config config;

    try {
      config.catalog_db_path =
          json_config.value("catalog_db_path", std::string("./data/catalog.db"));
      config.embedding_dimension = json_config.value("embedding_dimension", size_t{512});

      config.detector_model_path = json_config.value("detector_model_path", std::string(""));
      config.encoder_model_path = json_config.value("encoder_model_path", std::string(""));
      config.detector_input_size = json_config.value("detector_input_size", 640);
      config.encoder_input_size = json_config.value("encoder_input_size", 224);
      config.detection_confidence_threshold =
          json_config.value("detection_confidence_threshold", 0.3f);
      config.palette_clusters = json_config.value("palette_clusters", 5);
      config.palette_sample_size = json_config.value("palette_sample_size", 200);
      config.default_top_k = json_config.value("default_top_k", 3);

      if (json_config.contains("reasoning")) {
        config.reasoning = parse_reasoning(json_config.at("reasoning"));
      }
      if (json_config.contains("default_candidates")) {
        const auto &defaults = json_config.at("default_candidates");
        if (defaults.contains("items")) {
          if (!defaults.at("items").is_array() || defaults.at("items").empty()) {
            throw std::runtime_error("default_candidates.items must be a non-empty array");
          }
          for (const auto &item : defaults.at("items")) {
            config.default_candidates.items.push_back(item);
          }
        }
      }
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  static ReasoningConfig parse_reasoning(const nlohmann::json &json_reasoning) {
    ReasoningConfig reasoning;
    reasoning.timeout_seconds = json_reasoning.value("timeout_seconds", 20);
    reasoning.max_tokens = json_reasoning.value("max_tokens", 150);
    reasoning.temperature = json_reasoning.value("temperature", 0.7f);

    if (json_reasoning.contains("backends")) {
      for (const auto &entry : json_reasoning.at("backends")) {
        BackendConfig backend;
        backend.type = entry.value("type", std::string(""));
        backend.model = entry.value("model", std::string(""));
        backend.base_url = entry.value("base_url", std::string(""));
        backend.enabled = entry.value("enabled", true);
        backend.api_key = entry.value("api_key", std::string(""));
        // Credentials are resolved once here so the running core never reads the environment
        if (backend.api_key.empty() && entry.contains("api_key_env")) {
          const std::string variable = entry.at("api_key_env").get<std::string>();
          if (const char *value = std::getenv(variable.c_str())) {
            backend.api_key = value;
          }
        }
        reasoning.backends.push_back(std::move(backend));
      }
    }
    return reasoning;
  }

  void validate() const {
    if (catalog_db_path.empty()) {
      throw std::runtime_error("catalog_db_path cannot be empty");
    }
    if (embedding_dimension == 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (detector_input_size <= 0 || encoder_input_size <= 0) {
      throw std::runtime_error("Model input sizes must be greater than 0");
    }
    if (detection_confidence_threshold < 0.0f || detection_confidence_threshold > 1.0f) {
      throw std::runtime_error("detection_confidence_threshold must be between 0 and 1");
    }
    if (palette_clusters < 1) {
      throw std::runtime_error("palette_clusters must be at least 1");
    }
    if (palette_sample_size < 1) {
      throw std::runtime_error("palette_sample_size must be at least 1");
    }
    if (default_top_k < 1 || default_top_k > 50) {
      throw std::runtime_error("default_top_k must be between 1 and 50");
    }
    if (reasoning.timeout_seconds < 1 || reasoning.timeout_seconds > 120) {
      throw std::runtime_error("reasoning.timeout_seconds must be between 1 and 120");
    }
    if (reasoning.max_tokens < 1) {
      throw std::runtime_error("reasoning.max_tokens must be at least 1");
    }
    for (const auto &backend : reasoning.backends) {
      if (backend.type != "ollama" && backend.type != "openai" && backend.type != "groq" &&
          backend.type != "gemini") {
        throw std::runtime_error("Unknown reasoning backend type: '" + backend.type + "'");
      }
    }
  }
};

}  // namespace artmatch_core
