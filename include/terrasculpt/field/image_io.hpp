#pragma once

/**
 * @file image_io.hpp
 * @brief Pixel transforms between field buffers and 8-bit images
 *
 * Only the numeric mapping lives here; encoding to PNG or similar is the
 * caller's business. Pixel buffers are row-major, N x N.
 */

#include <cstdint>
#include <span>
#include <vector>

namespace terrasculpt {

/// One byte per cell: floor(h / maxHeight * 255) clamped to [0, 255],
/// where maxHeight is the largest height (1 if none is positive)
[[nodiscard]] std::vector<uint8_t> exportHeightImage(std::span<const float> heights);

/// Three bytes (RGB) per cell: floor(c * 255) per channel
[[nodiscard]] std::vector<uint8_t> exportColorImage(std::span<const float> colors);

/// Grayscale samples from an RGBA8 image: (r + g + b) / 3 / 255 per pixel.
/// Throws std::invalid_argument unless pixels.size() == resolution^2 * 4.
[[nodiscard]] std::vector<float> grayscaleFromRgba8(std::span<const uint8_t> pixels, int32_t resolution);

}  // namespace terrasculpt
