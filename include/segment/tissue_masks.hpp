#pragma once

#include <cstddef>

#include "io/image_types.hpp"
#include "segment/threshold_table.hpp"

namespace tissueseg {

// One RGBA layer per tissue. A pixel is opaque black in at most one layer;
// background pixels are transparent in all three.
struct TissueMasks {
    RgbaImage wm;
    RgbaImage gm;
    RgbaImage csf;

    // nullptr for TissueLabel::Background
    RgbaImage* mask_for(TissueLabel label);
    const RgbaImage* mask_for(TissueLabel label) const;
};

struct TissueStats {
    size_t background = 0;
    size_t csf = 0;
    size_t gm = 0;
    size_t wm = 0;

    size_t total() const { return background + csf + gm + wm; }
};

// Throws InputError(Empty) for an empty or inconsistent grid.
TissueMasks build_tissue_masks(const GrayImage& src,
                               const ThresholdTable& table = ThresholdTable::reference());

// Opaque pixel count per mask; background is whatever none of them claims.
// Throws EncodingError if the layers differ in size.
TissueStats count_tissue_pixels(const TissueMasks& masks);

} // namespace tissueseg
