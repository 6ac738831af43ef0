#include <codec/bit_codec.hpp>

namespace Engram {

BitVector bytes_to_bits(const std::vector<uint8_t>& bytes) {
    BitVector bits;
    bits.reserve(bytes.size() * 8);
    for (uint8_t byte : bytes) {
        for (int shift = 7; shift >= 0; --shift) {
            bits.push_back(static_cast<uint8_t>((byte >> shift) & 1));
        }
    }
    return bits;
}

std::vector<uint8_t> bits_to_bytes(const BitVector& bits) {
    std::vector<uint8_t> bytes((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] > 1) {
            throw EngramError(ErrorKind::MalformedEncoding,
                "bit " + std::to_string(i) + " has value " + std::to_string(bits[i]));
        }
        if (bits[i]) {
            bytes[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
    }
    return bytes;
}

} // namespace Engram
