#pragma once

#include "range_transport.hpp"

#include <memory>
#include <string>

namespace partfetch {

struct CurlOptions {
    std::string user_agent{"partfetch/0.1"};
    long connect_timeout_seconds{30};
    bool follow_redirects{true};
};

class CurlTransport final : public RangeTransport {
public:
    // Sets up libcurl once per process; call before starting threads.
    // Throws ConnectionError.
    static void initializeGlobal();

    explicit CurlTransport(CurlOptions options = {});
    ~CurlTransport() override;

    [[nodiscard]] ResourceInfo probe(const std::string& url) override;
    [[nodiscard]] std::unique_ptr<RangeConnection> connect(const std::string& url,
                                                           const ByteRange& range) override;

private:
    class Connection;
    CurlOptions options_;
};

} // namespace partfetch
