#include "format/base64.hpp"

#include "core/errors.hpp"

#include <array>

namespace tissueseg {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int8_t kInvalid = -1;

std::array<int8_t, 256> make_reverse_table() {
    std::array<int8_t, 256> t{};
    t.fill(kInvalid);
    for (int i = 0; i < 64; ++i) {
        t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return t;
}

} // namespace

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8) |
                           static_cast<uint32_t>(data[i + 2]);
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.push_back(kAlphabet[(v >> 6) & 0x3F]);
        out.push_back(kAlphabet[v & 0x3F]);
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        const uint32_t v = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const uint32_t v = (static_cast<uint32_t>(data[i]) << 16) |
                           (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(v >> 18) & 0x3F]);
        out.push_back(kAlphabet[(v >> 12) & 0x3F]);
        out.push_back(kAlphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    static const std::array<int8_t, 256> rev = make_reverse_table();

    if (encoded.size() % 4 != 0) {
        throw EncodingError("base64: length is not a multiple of 4");
    }

    std::vector<uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
        const bool last = (i + 4 == encoded.size());
        int pad = 0;
        uint32_t v = 0;
        for (size_t k = 0; k < 4; ++k) {
            const char c = encoded[i + k];
            if (c == '=') {
                // only the final one or two characters may be padding
                if (!last || k < 2) throw EncodingError("base64: misplaced padding");
                ++pad;
                v <<= 6;
                continue;
            }
            if (pad > 0) throw EncodingError("base64: data after padding");
            const int8_t d = rev[static_cast<unsigned char>(c)];
            if (d == kInvalid) throw EncodingError("base64: invalid character");
            v = (v << 6) | static_cast<uint32_t>(d);
        }

        out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    return out;
}

} // namespace tissueseg
