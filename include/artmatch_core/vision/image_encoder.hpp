#pragma once

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace artmatch_core {

class ImageEncoder {
 public:
  virtual ~ImageEncoder() = default;

  // Returns one global embedding for the image, L2-normalized.
  virtual std::vector<float> encode(const cv::Mat &bgr_image) = 0;

  // Width of every vector returned by encode().
  virtual size_t dimension() const = 0;
};

/**
 * @class DnnImageEncoder
 * @brief CLIP-style image encoder (ONNX vision tower) run through OpenCV DNN.
 *
 * The model's output width is checked against the deployment dimension when
 * the model is loaded, and again on every call. A disagreement raises
 * DimensionMismatch rather than padding or truncating the vector.
 */
class DnnImageEncoder : public ImageEncoder {
 public:
  // Throws ModelLoadError for an unreadable model, DimensionMismatch for a wrong width.
  DnnImageEncoder(const std::string &model_path, int input_size, size_t expected_dimension);

  std::vector<float> encode(const cv::Mat &bgr_image) override;
  size_t dimension() const override { return expected_dimension_; }

 private:
  cv::dnn::Net net_;
  std::mutex net_mutex_;
  int input_size_;
  size_t expected_dimension_;

  cv::Mat preprocess(const cv::Mat &bgr_image) const;
  std::vector<float> run(const cv::Mat &blob);
};

}  // namespace artmatch_core
