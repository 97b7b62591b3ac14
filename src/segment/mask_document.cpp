#include "segment/mask_document.hpp"

#include "core/errors.hpp"
#include "format/base64.hpp"
#include "format/png_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace tissueseg {
namespace {

constexpr const char* kKeys[] = {"wm", "gm", "csf"};

std::string encode_layer(const RgbaImage& mask, const char* name) {
    try {
        const std::vector<uint8_t> png = encode_png(mask);
#ifndef NDEBUG
        std::cerr << "encode " << name << ": " << mask.width << "x" << mask.height
                  << " -> " << png.size() << " PNG bytes\n";
#endif
        return base64_encode(png);
    } catch (const EncodingError& e) {
        throw EncodingError(std::string("encode ") + name + ": " + e.what());
    }
}

RgbaImage decode_layer(const std::string& b64, const char* name) {
    try {
        return decode_png_rgba(base64_decode(b64));
    } catch (const EncodingError& e) {
        throw EncodingError(std::string("decode ") + name + ": " + e.what());
    }
}

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) throw EncodingError(std::string("mask document: missing key '") + key + "'");
    if (!it->is_string()) throw EncodingError(std::string("mask document: '") + key + "' is not a string");
    return it->get<std::string>();
}

} // namespace

MaskDocument encode_mask_document(const TissueMasks& masks) {
    MaskDocument doc;
    doc.wm = encode_layer(masks.wm, "wm");
    doc.gm = encode_layer(masks.gm, "gm");
    doc.csf = encode_layer(masks.csf, "csf");
    return doc;
}

std::string to_json(const MaskDocument& doc) {
    nlohmann::ordered_json j;
    j["wm"] = doc.wm;
    j["gm"] = doc.gm;
    j["csf"] = doc.csf;
    return j.dump();
}

MaskDocument parse_mask_document(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw EncodingError(std::string("mask document: invalid JSON: ") + e.what());
    }
    if (!j.is_object()) throw EncodingError("mask document: top level is not an object");

    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char* k : kKeys) known = known || it.key() == k;
        if (!known) throw EncodingError("mask document: unexpected key '" + it.key() + "'");
    }

    MaskDocument doc;
    doc.wm = string_field(j, "wm");
    doc.gm = string_field(j, "gm");
    doc.csf = string_field(j, "csf");
    return doc;
}

TissueMasks decode_mask_document(const MaskDocument& doc) {
    TissueMasks m;
    m.wm = decode_layer(doc.wm, "wm");
    m.gm = decode_layer(doc.gm, "gm");
    m.csf = decode_layer(doc.csf, "csf");
    if (m.gm.width != m.wm.width || m.gm.height != m.wm.height ||
        m.csf.width != m.wm.width || m.csf.height != m.wm.height) {
        throw EncodingError("mask document: layers differ in size");
    }
    return m;
}

} // namespace tissueseg
