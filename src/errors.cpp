#include "partfetch/errors.hpp"

namespace partfetch {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidRange:
            return "InvalidRange";
        case ErrorKind::Connection:
            return "ConnectionError";
        case ErrorKind::Stream:
            return "StreamError";
        case ErrorKind::PartFile:
            return "PartFileError";
    }
    return "UnknownError";
}

} // namespace partfetch
