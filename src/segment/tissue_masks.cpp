#include "segment/tissue_masks.hpp"

#include "core/errors.hpp"

#include <string>

namespace tissueseg {

RgbaImage* TissueMasks::mask_for(TissueLabel label) {
    switch (label) {
        case TissueLabel::Wm:  return &wm;
        case TissueLabel::Gm:  return &gm;
        case TissueLabel::Csf: return &csf;
        case TissueLabel::Background: break;
    }
    return nullptr;
}

const RgbaImage* TissueMasks::mask_for(TissueLabel label) const {
    switch (label) {
        case TissueLabel::Wm:  return &wm;
        case TissueLabel::Gm:  return &gm;
        case TissueLabel::Csf: return &csf;
        case TissueLabel::Background: break;
    }
    return nullptr;
}

TissueMasks build_tissue_masks(const GrayImage& src, const ThresholdTable& table) {
    if (src.empty()) throw InputError(InputError::Kind::Empty, "segment: source image is empty");
    if (src.pixels.size() != static_cast<size_t>(src.width) * static_cast<size_t>(src.height)) {
        throw InputError(InputError::Kind::Empty, "segment: pixel buffer size mismatch (" +
                         std::to_string(src.pixels.size()) + " for " + std::to_string(src.width) +
                         "x" + std::to_string(src.height) + ")");
    }

    TissueMasks m;
    m.wm = RgbaImage(src.width, src.height);
    m.gm = RgbaImage(src.width, src.height);
    m.csf = RgbaImage(src.width, src.height);

    // Per-pixel decision only; no neighbourhood, no ordering dependency.
    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < src.width; ++x) {
            RgbaImage* dst = m.mask_for(table.classify(src.at(y, x)));
            if (dst) dst->set(y, x, kOpaqueBlack);
        }
    }
    return m;
}

TissueStats count_tissue_pixels(const TissueMasks& masks) {
    const size_t n = masks.wm.pixel_count();
    if (masks.gm.pixel_count() != n || masks.csf.pixel_count() != n) {
        throw EncodingError("segment: masks differ in size");
    }

    TissueStats s;
    for (size_t i = 0; i < n; ++i) {
        const size_t a = i * RgbaImage::kChannels + 3; // alpha
        const bool wm = masks.wm.data[a] != 0;
        const bool gm = masks.gm.data[a] != 0;
        const bool csf = masks.csf.data[a] != 0;
        if (wm) ++s.wm;
        if (gm) ++s.gm;
        if (csf) ++s.csf;
        if (!wm && !gm && !csf) ++s.background;
    }
    return s;
}

} // namespace tissueseg
