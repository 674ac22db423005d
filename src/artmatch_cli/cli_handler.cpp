#include "artmatch_cli/cli_handler.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include "artmatch_core/db/catalog_store.hpp"
#include "artmatch_core/llm/backend_factory.hpp"
#include "artmatch_core/vision/image_decoder.hpp"

namespace artmatch_cli {

using namespace artmatch_core;

CliHandler::CliHandler(const std::string& default_config_path)
    : default_config_path_(default_config_path) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) const {
    CliOptions options;
    options.config_path = default_config_path_;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "recommend" || command == "r") {
        options.command = Command::Recommend;
    } else if (command == "analyze" || command == "a") {
        options.command = Command::Analyze;
    } else if (command == "catalog-add" || command == "ca") {
        options.command = Command::CatalogAdd;
    } else if (command == "catalog-count" || command == "cc") {
        options.command = Command::CatalogCount;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[i + 1];

        if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else if (flag == "--image" || flag == "-i") {
            options.image_path = value;
        } else if (flag == "--file" || flag == "-f") {
            options.items_file = value;
        } else if (flag == "--top-k" || flag == "-k") {
            try {
                options.top_k = std::stoi(value);
            } catch (const std::exception&) {
                throw CliError("--top-k expects an integer, got '" + value + "'");
            }
        } else if (flag == "--style" || flag == "-s") {
            options.room_style = value;
        } else if (flag == "--colors") {
            options.colors = split_list(value);
        } else if (flag == "--min-price") {
            options.filter.min_price = parse_price(flag, value);
        } else if (flag == "--max-price") {
            options.filter.max_price = parse_price(flag, value);
        } else if (flag == "--art-style") {
            options.filter.style = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    if ((options.command == Command::Recommend || options.command == Command::Analyze) &&
        options.image_path.empty()) {
        throw CliError(command + " requires an image. Usage: " + command + " --image <path>");
    }
    if (options.command == Command::CatalogAdd && options.items_file.empty()) {
        throw CliError("catalog-add requires an items file. Usage: catalog-add --file <items.json>");
    }
    if (options.top_k && *options.top_k < 1) {
        throw CliError("--top-k must be at least 1");
    }
    if (options.filter.min_price && options.filter.max_price &&
        *options.filter.min_price > *options.filter.max_price) {
        throw CliError("--min-price cannot exceed --max-price");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Recommend:
            handle_recommend_command(options);
            break;
        case Command::Analyze:
            handle_analyze_command(options);
            break;
        case Command::CatalogAdd:
            handle_catalog_add_command(options);
            break;
        case Command::CatalogCount:
            handle_catalog_count_command(options);
            break;
        case Command::Help:
            handle_help_command();
            break;
    }
}

Config CliHandler::load_config(const CliOptions& options) const {
    if (!std::filesystem::exists(options.config_path)) {
        std::cerr << "Warning: config file '" << options.config_path
                  << "' not found, using defaults" << std::endl;
        return Config::from_json(nlohmann::json::object());
    }
    return Config::from_file(options.config_path);
}

std::shared_ptr<ImageEncoder> CliHandler::make_encoder(const Config& config) const {
    if (config.encoder_model_path.empty()) {
        return nullptr;
    }
    try {
        return std::make_shared<DnnImageEncoder>(config.encoder_model_path, config.encoder_input_size,
                                                 config.embedding_dimension);
    } catch (const ModelLoadError& e) {
        std::cerr << "Warning: " << e.what() << std::endl;
        return nullptr;
    }
}

std::shared_ptr<FeatureExtractor> CliHandler::make_extractor(const Config& config) const {
    std::shared_ptr<ObjectDetector> detector;
    if (!config.detector_model_path.empty()) {
        try {
            detector = std::make_shared<YoloObjectDetector>(config.detector_model_path,
                                                            config.detector_input_size,
                                                            config.detection_confidence_threshold);
        } catch (const ModelLoadError& e) {
            std::cerr << "Warning: " << e.what() << std::endl;
        }
    }

    FeatureExtractorSettings settings;
    settings.embedding_dimension = config.embedding_dimension;
    settings.detection_confidence_threshold = config.detection_confidence_threshold;
    settings.palette.clusters = config.palette_clusters;
    settings.palette.sample_size = config.palette_sample_size;
    return std::make_shared<FeatureExtractor>(detector, make_encoder(config), settings);
}

std::unique_ptr<RecommendationOrchestrator> CliHandler::make_orchestrator(const Config& config) const {
    auto extractor = make_extractor(config);

    CatalogStore store(config.catalog_db_path, config.embedding_dimension);
    auto index = std::make_shared<VectorIndex>(config.embedding_dimension);
    index->load(store);
    std::cerr << "Loaded " << index->size() << " catalog items from " << config.catalog_db_path
              << std::endl;

    ReasoningSettings reasoning_settings;
    reasoning_settings.timeout = std::chrono::seconds(config.reasoning.timeout_seconds);
    reasoning_settings.max_tokens = config.reasoning.max_tokens;
    reasoning_settings.temperature = config.reasoning.temperature;
    auto transport = std::make_shared<CurlHttpTransport>();
    auto generator = std::make_shared<ReasoningGenerator>(
        make_text_backends(config.reasoning, transport), reasoning_settings);

    DefaultCandidateSet defaults = config.default_candidates.items.empty()
                                       ? DefaultCandidateSet::builtin()
                                       : DefaultCandidateSet::from_json(config.default_candidates.items);

    return std::make_unique<RecommendationOrchestrator>(extractor, index, generator, std::move(defaults),
                                                        static_cast<size_t>(config.default_top_k));
}

void CliHandler::handle_recommend_command(const CliOptions& options) {
    Config config = load_config(options);
    auto orchestrator = make_orchestrator(config);

    RecommendationRequest request;
    request.image = decode_image(read_file_bytes(options.image_path));
    request.room_style_hint = options.room_style;
    request.color_hints = options.colors;
    request.filter = options.filter;
    if (options.top_k) {
        request.k = static_cast<size_t>(*options.top_k);
    }

    RecommendationResult result = orchestrator->analyze_and_recommend(request);
    print_json_response(result);
}

void CliHandler::handle_analyze_command(const CliOptions& options) {
    Config config = load_config(options);
    auto extractor = make_extractor(config);
    RoomSignature signature = extractor->analyze(decode_image(read_file_bytes(options.image_path)));
    print_json_response(signature);
}

void CliHandler::handle_catalog_add_command(const CliOptions& options) {
    Config config = load_config(options);

    std::ifstream file_stream(options.items_file);
    if (!file_stream.is_open()) {
        throw CliError("Failed to open items file: " + options.items_file);
    }
    nlohmann::json entries;
    try {
        file_stream >> entries;
    } catch (const nlohmann::json::exception& e) {
        throw CliError("Failed to parse items file '" + options.items_file + "': " + e.what());
    }
    if (!entries.is_array()) {
        throw CliError("Items file must contain a JSON array");
    }

    // Entries may point at an image instead of carrying an embedding
    const auto base_dir = std::filesystem::path(options.items_file).parent_path();
    std::shared_ptr<ImageEncoder> encoder;
    std::vector<CatalogItem> items;
    for (const auto& entry : entries) {
        CatalogItem item;
        try {
            item = entry.get<CatalogItem>();
        } catch (const nlohmann::json::exception& e) {
            throw CliError("Invalid catalog item: " + std::string(e.what()));
        }
        if (item.embedding.empty() && entry.contains("image_path")) {
            if (!encoder) {
                encoder = make_encoder(config);
                if (!encoder) {
                    throw CliError("Item '" + item.id +
                                   "' has no embedding and no encoder model is configured");
                }
            }
            std::filesystem::path image_path = entry.at("image_path").get<std::string>();
            if (image_path.is_relative()) {
                image_path = base_dir / image_path;
            }
            item.embedding = encoder->encode(to_bgr(decode_image(read_file_bytes(image_path.string()))));
        }
        items.push_back(std::move(item));
    }

    CatalogStore store(config.catalog_db_path, config.embedding_dimension);
    store.add_items(items);
    print_json_response({{"added", items.size()}, {"total", store.count()}});
}

void CliHandler::handle_catalog_count_command(const CliOptions& options) {
    Config config = load_config(options);
    CatalogStore store(config.catalog_db_path, config.embedding_dimension);
    print_json_response({{"count", store.count()}, {"embedding_dimension", store.embedding_dimension()}});
}

void CliHandler::handle_help_command() {
    print_help();
}

std::vector<unsigned char> CliHandler::read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Failed to open image file: " + path);
    }
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(file),
                                      std::istreambuf_iterator<char>());
}

std::vector<std::string> CliHandler::split_list(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ',')) {
        const auto first = part.find_first_not_of(' ');
        const auto last = part.find_last_not_of(' ');
        if (first != std::string::npos) {
            parts.push_back(part.substr(first, last - first + 1));
        }
    }
    return parts;
}

double CliHandler::parse_price(const std::string& flag, const std::string& value) {
    double price = 0.0;
    size_t consumed = 0;
    try {
        price = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw CliError(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || !std::isfinite(price) || price < 0.0) {
        throw CliError(flag + " expects a non-negative number, got '" + value + "'");
    }
    return price;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
ArtMatch CLI - Artwork recommendations for room photos

Usage: artmatch_cli <command> [options]

Recommendation Commands:
  recommend, r  Analyze a room photo and recommend artworks
    --image, -i <path>     Room photo (JPEG, PNG, ...)
    --top-k, -k <num>      Number of recommendations (default: from config, max 50)
    --style, -s <style>    Room style hint, e.g. "Scandinavian"
    --colors <c1,c2,...>   Color hints used in the explanations
    --min-price <amount>   Only recommend artworks priced at least this much
    --max-price <amount>   Only recommend artworks priced at most this much
    --art-style <style>    Only recommend artworks of this exact style, e.g. "Modern"

  analyze, a    Print the room signature of a photo
    --image, -i <path>     Room photo

Catalog Commands:
  catalog-add, ca    Add artworks to the catalog
    --file, -f <path>      JSON array of items, each with an "embedding" or an "image_path"

  catalog-count, cc  Print the number of catalog items

General:
  --config, -c <path>  Config file (default: $ARTMATCH_CONFIG or artmatchrc.json)
  help, h       Show this help message

Examples:
  artmatch_cli recommend --image living_room.jpg --top-k 5
  artmatch_cli recommend --image bedroom.png --max-price 200 --art-style Abstract
  artmatch_cli catalog-add --file catalog/items.json
)" << std::endl;
}

}  // namespace artmatch_cli
