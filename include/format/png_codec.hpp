#pragma once

#include <cstdint>
#include <vector>

#include "io/image_types.hpp"

namespace tissueseg {

inline constexpr uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

bool has_png_signature(const std::vector<uint8_t>& bytes);

// Lossless 8-bit RGBA PNG (alpha preserved). Throws EncodingError.
std::vector<uint8_t> encode_png(const RgbaImage& im);

// Any PNG to 8-bit RGBA. Throws EncodingError.
RgbaImage decode_png_rgba(const std::vector<uint8_t>& bytes);

// Any PNG to one gray channel at its stored depth (8 or 16 bits). Samples are
// used as stored with no gamma conversion; colour becomes 0.299R + 0.587G +
// 0.114B, alpha is dropped without compositing. Throws EncodingError.
Image decode_png_gray(const std::vector<uint8_t>& bytes);

} // namespace tissueseg
