#pragma once

#include <stdexcept>
#include <string>

namespace tissueseg {

// Source image could not be turned into a grayscale grid.
class InputError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,    // path does not exist
        Unreadable,  // exists but cannot be opened/read
        Malformed,   // not a supported or valid image
        Empty,       // zero width/height or inconsistent buffer
    };

    InputError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* to_string(InputError::Kind kind);

// A mask could not be serialized (PNG or base64 layer).
class EncodingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The result could not be written to its destination.
class OutputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tissueseg
