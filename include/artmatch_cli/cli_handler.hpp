#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "artmatch_core/config.hpp"
#include "artmatch_core/services/recommendation_orchestrator.hpp"

namespace artmatch_cli
{

  enum class Command
  {
    Recommend,
    Analyze,
    CatalogAdd,
    CatalogCount,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string config_path;
    std::string image_path;
    std::string items_file;
    std::optional<int> top_k;
    std::optional<std::string> room_style;
    std::optional<std::vector<std::string>> colors;
    artmatch_core::RetrievalFilter filter;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &default_config_path);
    ~CliHandler() = default;

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]) const;

    // Execute command, writing JSON to stdout
    void execute_command(const CliOptions &options);

  private:
    std::string default_config_path_;

    // Command handlers
    void handle_recommend_command(const CliOptions &options);
    void handle_analyze_command(const CliOptions &options);
    void handle_catalog_add_command(const CliOptions &options);
    void handle_catalog_count_command(const CliOptions &options);
    void handle_help_command();

    // Wiring
    artmatch_core::Config load_config(const CliOptions &options) const;
    std::shared_ptr<artmatch_core::FeatureExtractor> make_extractor(const artmatch_core::Config &config) const;
    std::shared_ptr<artmatch_core::ImageEncoder> make_encoder(const artmatch_core::Config &config) const;
    std::unique_ptr<artmatch_core::RecommendationOrchestrator> make_orchestrator(const artmatch_core::Config &config) const;

    // Helper methods
    static std::vector<unsigned char> read_file_bytes(const std::string &path);
    static std::vector<std::string> split_list(const std::string &value);
    static double parse_price(const std::string &flag, const std::string &value);
    void print_json_response(const nlohmann::json &response);
    void print_help();
  };

}
