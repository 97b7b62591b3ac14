#include "core/errors.hpp"

namespace tissueseg {

const char* to_string(InputError::Kind kind) {
    switch (kind) {
        case InputError::Kind::NotFound:   return "not found";
        case InputError::Kind::Unreadable: return "unreadable";
        case InputError::Kind::Malformed:  return "malformed";
        case InputError::Kind::Empty:      return "empty";
    }
    return "unknown";
}

} // namespace tissueseg
