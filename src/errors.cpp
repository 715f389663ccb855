#include "errors.hpp"

namespace fenrom {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::Malformed: return "malformed";
        case ErrorKind::OutOfBounds: return "out of bounds";
        case ErrorKind::RecordTooLarge: return "record too large";
        case ErrorKind::Io: return "i/o error";
    }
    return "unknown";
}

} // namespace fenrom
