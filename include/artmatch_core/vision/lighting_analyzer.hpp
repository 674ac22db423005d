#pragma once

#include <opencv2/core.hpp>

#include "artmatch_core/types/room_signature.hpp"

namespace artmatch_core {

// Brightness bucket, color temperature and contrast of a BGR image.
LightingDescriptor analyze_lighting(const cv::Mat &bgr_image);

}  // namespace artmatch_core
