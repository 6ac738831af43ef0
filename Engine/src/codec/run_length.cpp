#include <codec/run_length.hpp>
#include <codec/base64.hpp>

namespace Engram {

std::vector<uint8_t> rle_encode(const BitVector& bits) {
    if (!is_binary(bits)) {
        throw EngramError(ErrorKind::MalformedEncoding, "run-length input is not a binary vector");
    }

    std::vector<uint8_t> encoded;
    if (bits.empty()) return encoded;

    uint8_t current = bits[0];
    uint8_t count = 1;
    for (size_t i = 1; i < bits.size(); ++i) {
        if (bits[i] == current && count < k_max_run) {
            ++count;
            continue;
        }
        encoded.push_back(count);
        encoded.push_back(current);
        current = bits[i];
        count = 1;
    }
    encoded.push_back(count);
    encoded.push_back(current);
    return encoded;
}

BitVector rle_decode(const std::vector<uint8_t>& encoded) {
    if (encoded.size() % 2 != 0) {
        throw EngramError(ErrorKind::MalformedEncoding,
            "run-length data has odd length " + std::to_string(encoded.size()) +
            "; expected (count, value) pairs");
    }

    BitVector decoded;
    for (size_t i = 0; i < encoded.size(); i += 2) {
        uint8_t count = encoded[i];
        uint8_t value = encoded[i + 1];
        if (value > 1) {
            throw EngramError(ErrorKind::MalformedEncoding,
                "run-length value " + std::to_string(value) + " at pair " +
                std::to_string(i / 2) + " is not 0 or 1");
        }
        decoded.insert(decoded.end(), count, value);
    }
    return decoded;
}

std::string encode_key(const BitVector& key) {
    return base64_encode(rle_encode(key));
}

BitVector decode_key(const std::string& encoded) {
    return rle_decode(base64_decode(encoded));
}

} // namespace Engram
