#include "segment/threshold_table.hpp"

#include <stdexcept>
#include <string>

namespace tissueseg {

const char* label_name(TissueLabel label) {
    switch (label) {
        case TissueLabel::Background: return "background";
        case TissueLabel::Csf:        return "csf";
        case TissueLabel::Gm:         return "gm";
        case TissueLabel::Wm:         return "wm";
    }
    return "unknown";
}

ThresholdTable::ThresholdTable(std::vector<ThresholdBin> bins) : bins_(std::move(bins)) {
    if (bins_.empty()) throw std::invalid_argument("threshold table: no bins");
    for (size_t i = 1; i < bins_.size(); ++i) {
        if (bins_[i].upper <= bins_[i - 1].upper) {
            throw std::invalid_argument("threshold table: bounds must strictly ascend (bin " +
                                        std::to_string(i) + ")");
        }
    }
    if (bins_.back().upper != 255) {
        throw std::invalid_argument("threshold table: last bin must end at 255");
    }

    // Expand to a 256-entry lookup so classify() is a single load.
    size_t b = 0;
    for (int v = 0; v < 256; ++v) {
        while (v > bins_[b].upper) ++b;
        lut_[v] = bins_[b].label;
    }
}

const ThresholdTable& ThresholdTable::reference() {
    static const ThresholdTable table{
        {15, TissueLabel::Background},
        {60, TissueLabel::Csf},
        {130, TissueLabel::Gm},
        {255, TissueLabel::Wm},
    };
    return table;
}

} // namespace tissueseg
