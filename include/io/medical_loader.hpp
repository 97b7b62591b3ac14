#pragma once

#include <string>
#include "io/image_types.hpp"

namespace tissueseg {

// Loader:
// - PNG (any colour type; reduced to one gray channel, alpha dropped)
// - PGM (P5) 8/16-bit
// - DICOM (DCMTK) uncompressed single-frame MONOCHROME2, 8/16-bit;
//   a directory is read as a series and its first slice by InstanceNumber is used
// Throws InputError; kind() tells a missing path from a bad file.
Image load_medical(const std::string& path);

// 8-bit images pass through; deeper ones are min/max rescaled to [0,255].
GrayImage to_gray8(const Image& im);

// load_medical + to_gray8.
GrayImage load_grayscale(const std::string& path);

} // namespace tissueseg
