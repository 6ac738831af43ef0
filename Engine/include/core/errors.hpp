/**
 * @file errors.hpp
 * @brief Error kinds raised by the memory engine and the bundle codec
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Engram {

enum class ErrorKind {
    MalformedEncoding,
    CounterOverflow,
    LengthMismatch,
    SourceUnavailable,
    UnknownFile,
    DimensionMismatch,
    InvalidConfiguration
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedEncoding:    return "MalformedEncoding";
        case ErrorKind::CounterOverflow:      return "CounterOverflow";
        case ErrorKind::LengthMismatch:       return "LengthMismatch";
        case ErrorKind::SourceUnavailable:    return "SourceUnavailable";
        case ErrorKind::UnknownFile:          return "UnknownFile";
        case ErrorKind::DimensionMismatch:    return "DimensionMismatch";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
    }
    return "Unknown";
}

/**
 * @brief Exception carrying an ErrorKind
 *
 * what() is "<Kind>: <message>" so the kind survives when the
 * exception is flattened to a string (C interop, tool output).
 */
class EngramError : public std::runtime_error {
public:
    EngramError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace Engram
