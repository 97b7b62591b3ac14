#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tissueseg {

// RFC 4648 standard alphabet, '=' padded, no line breaks.
std::string base64_encode(const std::vector<uint8_t>& data);

// Strict decode. Throws EncodingError on characters outside the alphabet,
// a length that is not a multiple of 4, or padding anywhere but the tail.
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace tissueseg
