#pragma once

#include <string>
#include <vector>

#include "artmatch_core/types/room_signature.hpp"

namespace artmatch_core {

// Rule-based style label from the composition of detected objects.
std::string classify_style(const std::vector<DetectedObject> &objects);

// Overall certainty of a signature in [0, 1].
float compute_confidence(const std::vector<DetectedObject> &objects,
                         const std::vector<PaletteColor> &palette, bool has_model_embedding);

/**
 * @brief Candidate blank wall regions for hanging art.
 *
 * The upper band of the image (10% to 50% of the height) is split into left,
 * center and right regions. A region is kept when detections cover less than
 * a quarter of it. With no detections at all the center wall is reported.
 */
std::vector<WallSpace> detect_wall_spaces(const std::vector<DetectedObject> &objects,
                                          int image_width, int image_height);

}  // namespace artmatch_core
