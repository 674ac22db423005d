#include "artmatch_core/vision/image_decoder.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <string>

#include "artmatch_core/types/errors.hpp"

namespace artmatch_core {

cv::Mat decode_image(const std::vector<unsigned char> &encoded) {
  if (encoded.empty()) {
    throw UnprocessableImage("Image buffer is empty");
  }
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    throw UnprocessableImage("Failed to decode image: " + std::string(e.what()));
  }
  if (decoded.empty()) {
    throw UnprocessableImage("Failed to decode image: unsupported or corrupt data");
  }
  return decoded;
}

cv::Mat to_bgr(const cv::Mat &image) {
  if (image.empty() || image.cols <= 0 || image.rows <= 0) {
    throw UnprocessableImage("Image is empty");
  }
  if (image.depth() != CV_8U) {
    throw UnprocessableImage("Unsupported image depth; expected 8-bit channels");
  }

  cv::Mat bgr;
  switch (image.channels()) {
    case 3:
      bgr = image;
      break;
    case 1:
      cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
      break;
    case 4:
      cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
      break;
    default:
      throw UnprocessableImage("Unsupported channel count: " + std::to_string(image.channels()));
  }
  return bgr;
}

}  // namespace artmatch_core
