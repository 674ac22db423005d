#include "artmatch_core/vision/object_detector.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <stdexcept>

namespace artmatch_core {

YoloObjectDetector::YoloObjectDetector(const std::string &model_path, int input_size,
                                       float score_threshold, float nms_threshold)
    : input_size_(input_size), score_threshold_(score_threshold), nms_threshold_(nms_threshold) {
  if (input_size_ <= 0) {
    throw ModelLoadError("Detector input size must be positive");
  }
  try {
    net_ = cv::dnn::readNetFromONNX(model_path);
  } catch (const cv::Exception &e) {
    throw ModelLoadError("Failed to load detector model '" + model_path + "': " + e.what());
  }
  if (net_.empty()) {
    throw ModelLoadError("Detector model '" + model_path + "' is empty");
  }
  std::cerr << "Loaded YOLO detector from " << model_path << std::endl;
}

std::vector<DetectedObject> YoloObjectDetector::detect(const cv::Mat &bgr_image) {
  cv::Mat blob = cv::dnn::blobFromImage(bgr_image, 1.0 / 255.0, cv::Size(input_size_, input_size_),
                                        cv::Scalar(), /*swapRB*/ true, /*crop*/ false);
  cv::Mat output;
  {
    std::lock_guard<std::mutex> lock(net_mutex_);
    net_.setInput(blob);
    output = net_.forward();
  }

  // [1, 84, N] -> N rows of 84 values
  if (output.dims != 3 || output.size[1] < 5) {
    throw std::runtime_error("Unexpected detector output shape");
  }
  const int attributes = output.size[1];
  const int proposals = output.size[2];
  cv::Mat rows = cv::Mat(attributes, proposals, CV_32F, output.ptr<float>()).t();

  const float x_factor = static_cast<float>(bgr_image.cols) / static_cast<float>(input_size_);
  const float y_factor = static_cast<float>(bgr_image.rows) / static_cast<float>(input_size_);
  const auto &labels = coco_labels();

  std::vector<cv::Rect> boxes;
  std::vector<float> scores;
  std::vector<int> class_ids;
  for (int i = 0; i < rows.rows; ++i) {
    cv::Mat class_scores = rows.row(i).colRange(4, attributes);
    cv::Point class_id;
    double max_score = 0.0;
    cv::minMaxLoc(class_scores, nullptr, &max_score, nullptr, &class_id);
    if (max_score < score_threshold_) {
      continue;
    }
    const float *row = rows.ptr<float>(i);
    const float cx = row[0] * x_factor;
    const float cy = row[1] * y_factor;
    const float w = row[2] * x_factor;
    const float h = row[3] * y_factor;
    boxes.emplace_back(static_cast<int>(cx - w / 2), static_cast<int>(cy - h / 2),
                       static_cast<int>(w), static_cast<int>(h));
    scores.push_back(static_cast<float>(max_score));
    class_ids.push_back(class_id.x);
  }

  std::vector<int> kept;
  cv::dnn::NMSBoxes(boxes, scores, score_threshold_, nms_threshold_, kept);

  const cv::Rect image_rect(0, 0, bgr_image.cols, bgr_image.rows);
  std::vector<DetectedObject> detections;
  detections.reserve(kept.size());
  for (int idx : kept) {
    cv::Rect box = boxes[idx] & image_rect;
    DetectedObject object;
    object.label = class_ids[idx] < static_cast<int>(labels.size()) ? labels[class_ids[idx]]
                                                                    : "unknown";
    object.confidence = scores[idx];
    object.bbox = BoundingBox{static_cast<float>(box.x), static_cast<float>(box.y),
                              static_cast<float>(box.x + box.width),
                              static_cast<float>(box.y + box.height)};
    detections.push_back(std::move(object));
  }
  return detections;
}

const std::vector<std::string> &YoloObjectDetector::coco_labels() {
  static const std::vector<std::string> labels = {
      "person",        "bicycle",      "car",           "motorcycle",    "airplane",
      "bus",           "train",        "truck",         "boat",          "traffic light",
      "fire hydrant",  "stop sign",    "parking meter", "bench",         "bird",
      "cat",           "dog",          "horse",         "sheep",         "cow",
      "elephant",      "bear",         "zebra",         "giraffe",       "backpack",
      "umbrella",      "handbag",      "tie",           "suitcase",      "frisbee",
      "skis",          "snowboard",    "sports ball",   "kite",          "baseball bat",
      "baseball glove", "skateboard",  "surfboard",     "tennis racket", "bottle",
      "wine glass",    "cup",          "fork",          "knife",         "spoon",
      "bowl",          "banana",       "apple",         "sandwich",      "orange",
      "broccoli",      "carrot",       "hot dog",       "pizza",         "donut",
      "cake",          "chair",        "couch",         "potted plant",  "bed",
      "dining table",  "toilet",       "tv",            "laptop",        "mouse",
      "remote",        "keyboard",     "cell phone",    "microwave",     "oven",
      "toaster",       "sink",         "refrigerator",  "book",          "clock",
      "vase",          "scissors",     "teddy bear",    "hair drier",    "toothbrush"};
  return labels;
}

}  // namespace artmatch_core
