#include "terrasculpt/field/image_io.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace terrasculpt {

namespace {

uint8_t toByte(float normalized) {
    float v = std::floor(normalized * 255.0f);
    if (!(v > 0.0f)) return 0;  // also maps NaN to 0
    return static_cast<uint8_t>(std::min(v, 255.0f));
}

}  // namespace

std::vector<uint8_t> exportHeightImage(std::span<const float> heights) {
    float maxHeight = 0.0f;
    for (float h : heights) {
        maxHeight = std::max(maxHeight, h);
    }
    if (maxHeight == 0.0f) {
        maxHeight = 1.0f;
    }

    std::vector<uint8_t> pixels;
    pixels.reserve(heights.size());
    for (float h : heights) {
        pixels.push_back(toByte(h / maxHeight));
    }
    return pixels;
}

std::vector<uint8_t> exportColorImage(std::span<const float> colors) {
    std::vector<uint8_t> pixels;
    pixels.reserve(colors.size());
    for (float c : colors) {
        pixels.push_back(toByte(c));
    }
    return pixels;
}

std::vector<float> grayscaleFromRgba8(std::span<const uint8_t> pixels, int32_t resolution) {
    size_t cells = resolution > 0 ? static_cast<size_t>(resolution) * static_cast<size_t>(resolution) : 0;
    if (cells == 0 || pixels.size() != cells * 4) {
        throw std::invalid_argument("grayscaleFromRgba8: expected " + std::to_string(cells * 4) +
                                    " bytes for resolution " + std::to_string(resolution) +
                                    ", got " + std::to_string(pixels.size()));
    }

    std::vector<float> samples(cells);
    for (size_t i = 0; i < cells; ++i) {
        float sum = static_cast<float>(pixels[i * 4]) + static_cast<float>(pixels[i * 4 + 1]) +
                    static_cast<float>(pixels[i * 4 + 2]);
        samples[i] = sum / 3.0f / 255.0f;
    }
    return samples;
}

}  // namespace terrasculpt
