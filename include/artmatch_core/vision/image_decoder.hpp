#pragma once

#include <opencv2/core.hpp>

#include <vector>

namespace artmatch_core {

// Decodes an encoded image (JPEG, PNG, ...) into a BGR matrix.
// Throws UnprocessableImage when the bytes are not a readable image.
cv::Mat decode_image(const std::vector<unsigned char> &encoded);

// Validates a decoded buffer and returns it as 8-bit, 3-channel BGR.
// Grayscale and BGRA inputs are converted; anything else throws UnprocessableImage.
cv::Mat to_bgr(const cv::Mat &image);

}  // namespace artmatch_core
