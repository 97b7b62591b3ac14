#pragma once

#include <string>

#include "segment/mask_document.hpp"
#include "segment/tissue_masks.hpp"

namespace tissueseg {

struct SegmentationResult {
    int width = 0;
    int height = 0;
    TissueStats stats;
    std::string json;
};

// Image grid -> JSON text. Nothing touches the filesystem.
SegmentationResult segment_image(const GrayImage& src,
                                 const ThresholdTable& table = ThresholdTable::reference());

// load -> classify -> encode -> write. The output file is only created once
// all three masks have been encoded. Throws InputError / EncodingError / OutputError.
SegmentationResult segment_file(const std::string& in_path, const std::string& out_path);

} // namespace tissueseg
