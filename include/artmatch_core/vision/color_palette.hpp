#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

#include "artmatch_core/types/room_signature.hpp"

namespace artmatch_core {

struct PaletteSettings {
  int clusters = 5;
  int sample_size = 200;    // the image is resampled to sample_size x sample_size
  int dark_cutoff = 20;     // pixels whose darkest channel is at or below this are trimmed
  int bright_cutoff = 235;  // pixels whose brightest channel is at or above this are trimmed
  size_t min_pixels = 100;  // below this many survivors, all pixels are clustered
};

// Dominant colors of the image, most dominant first. Deterministic for a given image.
std::vector<PaletteColor> extract_palette(const cv::Mat &bgr_image,
                                          const PaletteSettings &settings = {});

// Neutral fallback used when clustering cannot run.
std::vector<PaletteColor> default_palette();

std::string to_hex(int r, int g, int b);

// Approximate human-readable name, e.g. "Light Gray" or "Teal".
std::string color_name(int r, int g, int b);

}  // namespace artmatch_core
