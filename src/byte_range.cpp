#include "partfetch/byte_range.hpp"

#include "partfetch/errors.hpp"

#include <fmt/format.h>

namespace partfetch {

ByteRange ByteRange::make(std::uint64_t start, std::uint64_t end) {
    if (start >= end) {
        throw InvalidRange(fmt::format("start byte {} must be smaller than end byte {}", start, end));
    }
    return ByteRange{start, end};
}

ByteRange ByteRange::advancedBy(std::uint64_t offset) const {
    if (offset >= length()) {
        throw InvalidRange(fmt::format("cannot advance range {}-{} by {} bytes", start_, end_, offset));
    }
    return ByteRange{start_ + offset, end_};
}

std::string ByteRange::curlRange() const {
    return fmt::format("{}-{}", start_, end_);
}

std::string ByteRange::headerValue() const {
    return fmt::format("bytes={}-{}", start_, end_);
}

} // namespace partfetch
