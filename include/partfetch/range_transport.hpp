#pragma once

#include "byte_range.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace partfetch {

struct ResourceInfo {
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
};

// One open ranged response. Reads block until data arrives or the stream
// ends.
class RangeConnection {
public:
    virtual ~RangeConnection() = default;

    // Final response status; 0 when the scheme has no status codes.
    [[nodiscard]] virtual long statusCode() const = 0;

    // Bytes the remote announced for this response, if it announced any.
    [[nodiscard]] virtual std::optional<std::uint64_t> contentLength() const = 0;

    // Returns 0 at end of stream. Throws StreamError when the transfer fails.
    virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

class RangeTransport {
public:
    virtual ~RangeTransport() = default;

    // Throws ConnectionError.
    [[nodiscard]] virtual ResourceInfo probe(const std::string& url) = 0;

    // Requests `range` and returns once the response headers are in.
    // Throws ConnectionError.
    [[nodiscard]] virtual std::unique_ptr<RangeConnection> connect(const std::string& url,
                                                                   const ByteRange& range) = 0;
};

using RangeTransportPtr = std::shared_ptr<RangeTransport>;

} // namespace partfetch
