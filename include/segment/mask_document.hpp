#pragma once

#include <string>

#include "segment/tissue_masks.hpp"

namespace tissueseg {

// Three base64-encoded PNG masks, as written to the output JSON.
struct MaskDocument {
    std::string wm;
    std::string gm;
    std::string csf;
};

// PNG + base64 per mask. Throws EncodingError.
MaskDocument encode_mask_document(const TissueMasks& masks);

// {"wm":...,"gm":...,"csf":...}, keys in that order, compact.
std::string to_json(const MaskDocument& doc);

// Exactly the three string keys; anything else is an EncodingError.
MaskDocument parse_mask_document(const std::string& json_text);

// base64 + PNG decode of all three layers. Throws EncodingError.
TissueMasks decode_mask_document(const MaskDocument& doc);

} // namespace tissueseg
