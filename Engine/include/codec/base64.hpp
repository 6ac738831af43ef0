#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Engram {

// Standard alphabet (RFC 4648), '=' padded.
std::string base64_encode(const std::vector<uint8_t>& bytes);

// Strict decode: length must be a multiple of 4, padding only at the end.
// @throws EngramError(MalformedEncoding)
std::vector<uint8_t> base64_decode(const std::string& text);

} // namespace Engram
