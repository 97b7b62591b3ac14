#include "segment/pipeline.hpp"

#include "io/file_io.hpp"
#include "io/medical_loader.hpp"

#include <iostream>

namespace tissueseg {

SegmentationResult segment_image(const GrayImage& src, const ThresholdTable& table) {
    const TissueMasks masks = build_tissue_masks(src, table);

    SegmentationResult r;
    r.width = src.width;
    r.height = src.height;
    r.stats = count_tissue_pixels(masks);
#ifndef NDEBUG
    std::cerr << "classified " << r.stats.total() << " px: bg=" << r.stats.background
              << " csf=" << r.stats.csf << " gm=" << r.stats.gm << " wm=" << r.stats.wm << "\n";
#endif
    r.json = to_json(encode_mask_document(masks));
    return r;
}

SegmentationResult segment_file(const std::string& in_path, const std::string& out_path) {
    const GrayImage src = load_grayscale(in_path);
    SegmentationResult r = segment_image(src);
    write_text(out_path, r.json);
    return r;
}

} // namespace tissueseg
