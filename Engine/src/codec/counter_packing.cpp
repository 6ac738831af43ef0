#include <codec/counter_packing.hpp>
#include <codec/base64.hpp>
#include <core/errors.hpp>

namespace Engram {

std::vector<uint8_t> pack_counters(const CounterMatrix& counters) {
    std::vector<uint8_t> bytes;
    bytes.reserve(static_cast<size_t>(counters.size()));

    for (Eigen::Index row = 0; row < counters.rows(); ++row) {
        for (Eigen::Index col = 0; col < counters.cols(); ++col) {
            int32_t value = counters(row, col);
            if (value < -128 || value > 127) {
                throw EngramError(ErrorKind::CounterOverflow,
                    "counter [" + std::to_string(row) + "][" + std::to_string(col) +
                    "] = " + std::to_string(value) + " does not fit a signed byte");
            }
            bytes.push_back(static_cast<uint8_t>(value < 0 ? value + 256 : value));
        }
    }
    return bytes;
}

CounterMatrix unpack_counters(const std::vector<uint8_t>& bytes, size_t rows, size_t cols) {
    if (bytes.size() != rows * cols) {
        throw EngramError(ErrorKind::MalformedEncoding,
            "counter blob holds " + std::to_string(bytes.size()) + " bytes, expected " +
            std::to_string(rows) + " x " + std::to_string(cols));
    }

    CounterMatrix counters(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    int32_t* out = counters.data();
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i] = bytes[i] > 127 ? int32_t(bytes[i]) - 256 : int32_t(bytes[i]);
    }
    return counters;
}

std::string encode_counters(const CounterMatrix& counters) {
    return base64_encode(pack_counters(counters));
}

CounterMatrix decode_counters(const std::string& encoded, size_t rows, size_t cols) {
    return unpack_counters(base64_decode(encoded), rows, cols);
}

} // namespace Engram
