#pragma once

#include <cstdint>
#include <string>

namespace partfetch {

// Inclusive span [start, end] of a remote resource.
class ByteRange {
public:
    // Throws InvalidRange unless start < end.
    [[nodiscard]] static ByteRange make(std::uint64_t start, std::uint64_t end);

    [[nodiscard]] std::uint64_t start() const noexcept { return start_; }
    [[nodiscard]] std::uint64_t end() const noexcept { return end_; }
    [[nodiscard]] std::uint64_t length() const noexcept { return end_ - start_ + 1; }

    // Remainder after the first `offset` bytes. A resumed remainder may
    // shrink to a single byte (start == end). Throws InvalidRange when
    // offset >= length().
    [[nodiscard]] ByteRange advancedBy(std::uint64_t offset) const;

    [[nodiscard]] std::string curlRange() const;
    [[nodiscard]] std::string headerValue() const;

    bool operator==(const ByteRange& other) const noexcept {
        return start_ == other.start_ && end_ == other.end_;
    }
    bool operator!=(const ByteRange& other) const noexcept { return !(*this == other); }

private:
    ByteRange(std::uint64_t start, std::uint64_t end) noexcept : start_(start), end_(end) {}

    std::uint64_t start_;
    std::uint64_t end_;
};

} // namespace partfetch
