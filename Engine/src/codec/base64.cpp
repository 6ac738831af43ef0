#include <codec/base64.hpp>
#include <core/errors.hpp>
#include <array>

namespace Engram {

namespace {

inline constexpr char k_base64_lut[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint8_t k_invalid = 0xFF;

std::array<uint8_t, 256> make_reverse_lut() {
    std::array<uint8_t, 256> lut;
    lut.fill(k_invalid);
    for (uint8_t i = 0; i < 64; ++i) {
        lut[static_cast<uint8_t>(k_base64_lut[i])] = i;
    }
    return lut;
}

} // namespace

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t triple = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | bytes[i + 2];
        out.push_back(k_base64_lut[(triple >> 18) & 0x3F]);
        out.push_back(k_base64_lut[(triple >> 12) & 0x3F]);
        out.push_back(k_base64_lut[(triple >> 6) & 0x3F]);
        out.push_back(k_base64_lut[triple & 0x3F]);
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t triple = uint32_t(bytes[i]) << 16;
        out.push_back(k_base64_lut[(triple >> 18) & 0x3F]);
        out.push_back(k_base64_lut[(triple >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t triple = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
        out.push_back(k_base64_lut[(triple >> 18) & 0x3F]);
        out.push_back(k_base64_lut[(triple >> 12) & 0x3F]);
        out.push_back(k_base64_lut[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
    static const std::array<uint8_t, 256> reverse = make_reverse_lut();

    if (text.size() % 4 != 0) {
        throw EngramError(ErrorKind::MalformedEncoding,
            "base64 length " + std::to_string(text.size()) + " is not a multiple of 4");
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        size_t padding = 0;
        if (i + 4 == text.size() && text[i + 3] == '=') {
            padding = (text[i + 2] == '=') ? 2 : 1;
        }

        uint32_t quad = 0;
        for (size_t j = 0; j < 4 - padding; ++j) {
            uint8_t value = reverse[static_cast<uint8_t>(text[i + j])];
            if (value == k_invalid) {
                throw EngramError(ErrorKind::MalformedEncoding,
                    "invalid base64 character at offset " + std::to_string(i + j));
            }
            quad = (quad << 6) | value;
        }
        quad <<= 6 * padding;

        out.push_back(static_cast<uint8_t>((quad >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((quad >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(quad & 0xFF));
    }
    return out;
}

} // namespace Engram
