#include "artmatch_core/vision/lighting_analyzer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace artmatch_core {

namespace {

std::string brightness_bucket(double mean) {
  if (mean > 180) return "Very Bright";
  if (mean > 140) return "Natural, Bright";
  if (mean > 100) return "Moderate";
  if (mean > 60) return "Dim";
  return "Very Dim";
}

}  // namespace

LightingDescriptor analyze_lighting(const cv::Mat &bgr_image) {
  cv::Mat gray;
  cv::cvtColor(bgr_image, gray, cv::COLOR_BGR2GRAY);

  cv::Scalar mean, stddev;
  cv::meanStdDev(gray, mean, stddev);
  double min_lum = 0.0, max_lum = 0.0;
  cv::minMaxLoc(gray, &min_lum, &max_lum);

  LightingDescriptor lighting;
  lighting.avg_brightness = static_cast<float>(mean[0]);
  lighting.brightness = brightness_bucket(mean[0]);
  lighting.contrast =
      mean[0] > 0.0 ? static_cast<float>(std::min(1.0, stddev[0] / mean[0])) : 0.0f;
  lighting.min_luminance = static_cast<int>(min_lum);
  lighting.max_luminance = static_cast<int>(max_lum);

  // Channel means arrive in BGR order
  const cv::Scalar channel_means = cv::mean(bgr_image);
  const double blue = channel_means[0];
  const double red = channel_means[2];
  if (red > blue + 10) {
    lighting.temperature = "Warm";
    lighting.temperature_score = static_cast<float>((red - blue) / 255.0);
  } else if (blue > red + 10) {
    lighting.temperature = "Cool";
    lighting.temperature_score = static_cast<float>((blue - red) / 255.0);
  } else {
    lighting.temperature = "Neutral";
    lighting.temperature_score = 0.0f;
  }
  return lighting;
}

}  // namespace artmatch_core
