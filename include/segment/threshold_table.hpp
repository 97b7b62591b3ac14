#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

namespace tissueseg {

enum class TissueLabel : uint8_t {
    Background = 0,
    Csf = 1,
    Gm = 2,
    Wm = 3,
};

// "wm", "gm", "csf"; "background" for the unlabelled bin.
const char* label_name(TissueLabel label);

struct ThresholdBin {
    uint8_t upper;      // inclusive
    TissueLabel label;
};

// Ordered partition of [0,255] into labelled bins. A value belongs to the
// first bin whose upper bound it does not exceed, so every boundary value
// lands in the lower bin.
class ThresholdTable {
public:
    // Throws std::invalid_argument unless bounds strictly ascend and end at 255.
    explicit ThresholdTable(std::vector<ThresholdBin> bins);
    ThresholdTable(std::initializer_list<ThresholdBin> bins)
        : ThresholdTable(std::vector<ThresholdBin>(bins)) {}

    // 0..15 background, 16..60 CSF, 61..130 GM, 131..255 WM.
    static const ThresholdTable& reference();

    TissueLabel classify(uint8_t v) const { return lut_[v]; }

    const std::vector<ThresholdBin>& bins() const { return bins_; }

private:
    std::vector<ThresholdBin> bins_;
    TissueLabel lut_[256];
};

} // namespace tissueseg
