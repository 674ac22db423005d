#pragma once

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include <mutex>
#include <string>
#include <vector>

#include "artmatch_core/types/errors.hpp"
#include "artmatch_core/types/room_signature.hpp"

namespace artmatch_core {

class ObjectDetector {
 public:
  virtual ~ObjectDetector() = default;

  // Returns raw detections in image coordinates. Label filtering is left to the caller.
  virtual std::vector<DetectedObject> detect(const cv::Mat &bgr_image) = 0;
};

/**
 * @class YoloObjectDetector
 * @brief YOLOv8 ONNX detector run through OpenCV DNN.
 *
 * Expects the standard COCO export with an output tensor of shape
 * [1, 84, N]: four box coordinates followed by 80 class scores.
 */
class YoloObjectDetector : public ObjectDetector {
 public:
  // Throws ModelLoadError if the model cannot be read.
  YoloObjectDetector(const std::string &model_path, int input_size, float score_threshold,
                     float nms_threshold = 0.45f);

  std::vector<DetectedObject> detect(const cv::Mat &bgr_image) override;

  static const std::vector<std::string> &coco_labels();

 private:
  cv::dnn::Net net_;
  std::mutex net_mutex_;  // cv::dnn::Net::forward is not reentrant
  int input_size_;
  float score_threshold_;
  float nms_threshold_;
};

}  // namespace artmatch_core
