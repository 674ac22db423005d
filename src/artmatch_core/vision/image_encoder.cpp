#include "artmatch_core/vision/image_encoder.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>

#include "artmatch_core/types/embedding.hpp"
#include "artmatch_core/types/errors.hpp"

namespace artmatch_core {

namespace {
// CLIP image normalization constants, RGB order
const cv::Scalar CLIP_MEAN(0.48145466, 0.4578275, 0.40821073);
const cv::Scalar CLIP_STD(0.26862954, 0.26130258, 0.27577711);
}  // namespace

DnnImageEncoder::DnnImageEncoder(const std::string &model_path, int input_size,
                                 size_t expected_dimension)
    : input_size_(input_size), expected_dimension_(expected_dimension) {
  if (input_size_ <= 0 || expected_dimension_ == 0) {
    throw ModelLoadError("Encoder input size and dimension must be positive");
  }
  try {
    net_ = cv::dnn::readNetFromONNX(model_path);
  } catch (const cv::Exception &e) {
    throw ModelLoadError("Failed to load encoder model '" + model_path + "': " + e.what());
  }
  if (net_.empty()) {
    throw ModelLoadError("Encoder model '" + model_path + "' is empty");
  }

  // Check the output width once at load
  cv::Mat warmup(input_size_, input_size_, CV_8UC3, cv::Scalar(127, 127, 127));
  std::vector<float> warmup_output = run(preprocess(warmup));
  if (warmup_output.size() != expected_dimension_) {
    throw DimensionMismatch("Encoder '" + model_path + "' produces " +
                            std::to_string(warmup_output.size()) +
                            "-dim embeddings, deployment expects " +
                            std::to_string(expected_dimension_));
  }
  std::cerr << "Loaded image encoder from " << model_path << " (" << expected_dimension_
            << "-dim)" << std::endl;
}

cv::Mat DnnImageEncoder::preprocess(const cv::Mat &bgr_image) const {
  cv::Mat rgb, resized, normalized;
  cv::cvtColor(bgr_image, rgb, cv::COLOR_BGR2RGB);
  cv::resize(rgb, resized, cv::Size(input_size_, input_size_), 0, 0, cv::INTER_CUBIC);
  resized.convertTo(normalized, CV_32FC3, 1.0 / 255.0);
  cv::subtract(normalized, CLIP_MEAN, normalized);
  cv::divide(normalized, CLIP_STD, normalized);
  return cv::dnn::blobFromImage(normalized);
}

std::vector<float> DnnImageEncoder::run(const cv::Mat &blob) {
  cv::Mat output;
  {
    std::lock_guard<std::mutex> lock(net_mutex_);
    net_.setInput(blob);
    output = net_.forward();
  }
  if (!output.isContinuous()) {
    output = output.clone();
  }
  const float *data = output.ptr<float>();
  return std::vector<float>(data, data + output.total());
}

std::vector<float> DnnImageEncoder::encode(const cv::Mat &bgr_image) {
  std::vector<float> embedding = run(preprocess(bgr_image));
  if (embedding.size() != expected_dimension_) {
    throw DimensionMismatch("Encoder output dimension mismatch. Expected " +
                            std::to_string(expected_dimension_) + ", got " +
                            std::to_string(embedding.size()));
  }
  l2_normalize(embedding);
  return embedding;
}

}  // namespace artmatch_core
