#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace phoenix {

    enum class ErrorKind : uint8_t {
        Corruption,       // free-list cycle, invalid scale constants, bad node
        SizeMismatch,     // buffer shorter than the layout it must contain
        DataUnavailable,  // collaborator returned fewer buffers than requested
        VersionMismatch   // header discriminant differs from the expected schema
    };

    inline std::string_view to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Corruption: return "corruption";
            case ErrorKind::SizeMismatch: return "size mismatch";
            case ErrorKind::DataUnavailable: return "data unavailable";
            case ErrorKind::VersionMismatch: return "version mismatch";
        }
        return "unknown";
    }

    // Function: DecodeError
    // Description: Raised by every decode-time failure. Never caught inside the core.
    class DecodeError : public std::runtime_error {
    public:
        DecodeError(ErrorKind kind, const std::string& message)
            : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
    };

}
