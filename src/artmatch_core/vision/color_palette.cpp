#include "artmatch_core/vision/color_palette.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <unordered_set>

namespace artmatch_core {

namespace {

struct NamedColor {
  int r;
  int g;
  int b;
  const char *name;
};

const NamedColor NAMED_COLORS[] = {
    {255, 255, 255, "White"}, {0, 0, 0, "Black"},        {128, 128, 128, "Gray"},
    {255, 0, 0, "Red"},       {0, 255, 0, "Green"},      {0, 0, 255, "Blue"},
    {255, 255, 0, "Yellow"},  {255, 165, 0, "Orange"},   {128, 0, 128, "Purple"},
    {255, 192, 203, "Pink"},  {165, 42, 42, "Brown"},    {0, 128, 128, "Teal"},
    {245, 245, 220, "Beige"}, {240, 230, 140, "Khaki"},
};

constexpr uint64_t KMEANS_SEED = 42;

float round_to_tenth(float value) {
  return std::round(value * 10.0f) / 10.0f;
}

}  // namespace

std::string to_hex(int r, int g, int b) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", r, g, b);
  return std::string(buffer);
}

std::string color_name(int r, int g, int b) {
  double min_distance = std::numeric_limits<double>::max();
  std::string closest = "Unknown";
  for (const auto &named : NAMED_COLORS) {
    double distance = std::sqrt(std::pow(r - named.r, 2) + std::pow(g - named.g, 2) +
                                std::pow(b - named.b, 2));
    if (distance < min_distance) {
      min_distance = distance;
      closest = named.name;
    }
  }

  const double brightness = (r + g + b) / 3.0;
  if (brightness > 200) {
    return "Light " + closest;
  }
  if (brightness < 50) {
    return "Dark " + closest;
  }
  return closest;
}

std::vector<PaletteColor> default_palette() {
  const struct {
    int r, g, b;
    float percentage;
  } swatches[] = {{255, 255, 255, 30.0f},
                  {229, 231, 235, 25.0f},
                  {156, 163, 175, 20.0f},
                  {31, 41, 55, 15.0f},
                  {245, 158, 11, 10.0f}};

  std::vector<PaletteColor> palette;
  for (const auto &swatch : swatches) {
    PaletteColor color;
    color.r = swatch.r;
    color.g = swatch.g;
    color.b = swatch.b;
    color.hex = to_hex(swatch.r, swatch.g, swatch.b);
    color.percentage = swatch.percentage;
    color.name = color_name(swatch.r, swatch.g, swatch.b);
    palette.push_back(std::move(color));
  }
  return palette;
}

std::vector<PaletteColor> extract_palette(const cv::Mat &bgr_image,
                                          const PaletteSettings &settings) {
  cv::Mat resized, rgb;
  const int side = std::max(1, settings.sample_size);
  cv::resize(bgr_image, resized, cv::Size(side, side), 0, 0, cv::INTER_AREA);
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);

  // Trim shadows and highlights so lighting artifacts do not dominate a cluster
  std::vector<cv::Vec3b> all_pixels(rgb.begin<cv::Vec3b>(), rgb.end<cv::Vec3b>());
  std::vector<cv::Vec3b> kept;
  kept.reserve(all_pixels.size());
  for (const auto &px : all_pixels) {
    const int lo = std::min({px[0], px[1], px[2]});
    const int hi = std::max({px[0], px[1], px[2]});
    if (lo > settings.dark_cutoff && hi < settings.bright_cutoff) {
      kept.push_back(px);
    }
  }
  const std::vector<cv::Vec3b> &pixels = kept.size() < settings.min_pixels ? all_pixels : kept;

  std::unordered_set<uint32_t> distinct;
  for (const auto &px : pixels) {
    distinct.insert((static_cast<uint32_t>(px[0]) << 16) | (static_cast<uint32_t>(px[1]) << 8) |
                    px[2]);
    if (distinct.size() >= static_cast<size_t>(settings.clusters)) {
      break;
    }
  }
  const int k = std::max(1, std::min(settings.clusters, static_cast<int>(distinct.size())));

  cv::Mat samples(static_cast<int>(pixels.size()), 3, CV_32F);
  for (size_t i = 0; i < pixels.size(); ++i) {
    float *row = samples.ptr<float>(static_cast<int>(i));
    row[0] = pixels[i][0];
    row[1] = pixels[i][1];
    row[2] = pixels[i][2];
  }

  cv::Mat labels, centers;
  cv::theRNG().state = KMEANS_SEED;
  cv::kmeans(samples, k, labels,
             cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT, 300, 1e-4),
             /*attempts*/ 3, cv::KMEANS_PP_CENTERS, centers);

  std::vector<int> counts(k, 0);
  for (int i = 0; i < labels.rows; ++i) {
    counts[labels.at<int>(i)]++;
  }

  std::vector<PaletteColor> palette;
  for (int c = 0; c < k; ++c) {
    if (counts[c] == 0) {
      continue;
    }
    PaletteColor color;
    color.r = std::clamp(static_cast<int>(centers.at<float>(c, 0)), 0, 255);
    color.g = std::clamp(static_cast<int>(centers.at<float>(c, 1)), 0, 255);
    color.b = std::clamp(static_cast<int>(centers.at<float>(c, 2)), 0, 255);
    color.hex = to_hex(color.r, color.g, color.b);
    color.percentage = round_to_tenth(100.0f * counts[c] / static_cast<float>(labels.rows));
    color.name = color_name(color.r, color.g, color.b);
    palette.push_back(std::move(color));
  }

  std::stable_sort(palette.begin(), palette.end(),
                   [](const PaletteColor &a, const PaletteColor &b) {
                     return a.percentage > b.percentage;
                   });
  return palette;
}

}  // namespace artmatch_core
