#include "partfetch/curl_transport.hpp"

#include "partfetch/detail/curl_utils.hpp"
#include "partfetch/errors.hpp"
#include "partfetch/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace partfetch {

namespace {

constexpr std::size_t kMaxBuffered = 256 * 1024;
constexpr int kPollTimeoutMs = 1000;

std::string describe(CURLcode code, const char* error_buffer) {
    if (error_buffer && error_buffer[0] != '\0') {
        return fmt::format("{} ({})", curl_easy_strerror(code), error_buffer);
    }
    return curl_easy_strerror(code);
}

void applyCommonOptions(CURL* curl, const std::string& url, const CurlOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
}

} // namespace

// Pull-style view of one ranged transfer. libcurl pushes body data into
// buffer_ from the write callback; read() drives the multi handle until
// the buffer holds data or the transfer is over.
class CurlTransport::Connection final : public RangeConnection {
public:
    Connection(const std::string& url, const ByteRange& range, const CurlOptions& options)
        : multi_(detail::makeCurlMultiHandle()),
          easy_(detail::makeCurlHandle()),
          follow_redirects_(options.follow_redirects) {
        if (!multi_ || !easy_) {
            throw ConnectionError("Failed to allocate curl handle");
        }

        CURL* curl = easy_.get();
        applyCommonOptions(curl, url, options);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.curlRange().c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &Connection::writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &Connection::headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_);

        const CURLMcode mc = curl_multi_add_handle(multi_.get(), curl);
        if (mc != CURLM_OK) {
            throw ConnectionError(fmt::format("curl multi error: {}", curl_multi_strerror(mc)));
        }
        attached_ = true;
    }

    ~Connection() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void waitForHeaders() {
        while (!headers_done_ && !finished_) {
            pump();
        }

        // Once the headers are in, a failed transfer surfaces from read()
        // after the bytes that did arrive.
        if (!headers_done_ && result_ != CURLE_OK) {
            throw ConnectionError(fmt::format("curl error: {}", describe(result_, error_buffer_)));
        }

        curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status_);
        curl_off_t length = -1;
        curl_easy_getinfo(easy_.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length >= 0) {
            content_length_ = static_cast<std::uint64_t>(length);
        }
        connected_ = true;
    }

    [[nodiscard]] long statusCode() const override { return status_; }

    [[nodiscard]] std::optional<std::uint64_t> contentLength() const override { return content_length_; }

    std::size_t read(char* buffer, std::size_t size) override {
        while (pending() == 0 && !finished_) {
            if (paused_) {
                paused_ = false;
                const CURLcode rc = curl_easy_pause(easy_.get(), CURLPAUSE_CONT);
                if (rc != CURLE_OK) {
                    throw StreamError(fmt::format("cannot resume transfer: {}", curl_easy_strerror(rc)));
                }
            }
            pump();
        }

        if (pending() > 0) {
            const std::size_t count = std::min(size, pending());
            std::memcpy(buffer, buffer_.data() + read_pos_, count);
            read_pos_ += count;
            if (read_pos_ == buffer_.size()) {
                buffer_.clear();
                read_pos_ = 0;
            }
            return count;
        }

        // A body shorter than its Content-Length is an early end of stream.
        if (result_ == CURLE_PARTIAL_FILE) {
            logger()->debug("transfer ended early: {}", describe(result_, error_buffer_));
            return 0;
        }
        if (result_ != CURLE_OK) {
            throw StreamError(fmt::format("transfer failed: {}", describe(result_, error_buffer_)));
        }
        return 0;
    }

private:
    [[nodiscard]] std::size_t pending() const noexcept { return buffer_.size() - read_pos_; }

    void pump() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc == CURLM_OK && running == 0) {
            collectResult();
            return;
        }
        if (mc == CURLM_OK) {
            mc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
        }
        if (mc != CURLM_OK) {
            const auto message = fmt::format("curl multi error: {}", curl_multi_strerror(mc));
            if (connected_) {
                throw StreamError(message);
            }
            throw ConnectionError(message);
        }
    }

    void collectResult() {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                result_ = msg->data.result;
            }
        }
        finished_ = true;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<Connection*>(userdata);
        const size_t total = size * nmemb;
        if (self->pending() >= kMaxBuffered) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->headers_done_ = true;
        self->buffer_.append(ptr, total);
        return total;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<Connection*>(userdata);
        const size_t total = size * nitems;

        // An empty line closes one header block; redirects and interim
        // responses are followed by another one.
        if (total <= 2 && (total == 0 || buffer[0] == '\r' || buffer[0] == '\n')) {
            long code = 0;
            curl_easy_getinfo(self->easy_.get(), CURLINFO_RESPONSE_CODE, &code);
            const bool interim = code / 100 == 1;
            const bool redirect = self->follow_redirects_ && code / 100 == 3;
            if (!interim && !redirect) {
                self->headers_done_ = true;
            }
        }
        return total;
    }

    detail::CurlMultiHandle multi_;
    detail::CurlHandle easy_;
    bool follow_redirects_;
    bool attached_{false};

    char error_buffer_[CURL_ERROR_SIZE]{};
    // Body bytes from the write callback; read() consumes from read_pos_.
    // read_pos_ is back at zero whenever the callback runs.
    std::string buffer_;
    std::size_t read_pos_{0};
    bool headers_done_{false};
    bool connected_{false};
    bool paused_{false};
    bool finished_{false};
    CURLcode result_{CURLE_OK};
    long status_{0};
    std::optional<std::uint64_t> content_length_;
};

namespace {

// Owns curl_global_init for the life of the process.
struct CurlGlobal {
    CurlGlobal() {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw ConnectionError(fmt::format("libcurl initialization failed: {}", curl_easy_strerror(rc)));
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

void CurlTransport::initializeGlobal() {
    static const CurlGlobal global;
}

CurlTransport::CurlTransport(CurlOptions options) : options_(std::move(options)) {
    initializeGlobal();
}

CurlTransport::~CurlTransport() = default;

ResourceInfo CurlTransport::probe(const std::string& url) {
    ResourceInfo info;
    auto curl = detail::makeCurlHandle();
    if (!curl) {
        throw ConnectionError("Failed to allocate curl handle");
    }

    char error_buffer[CURL_ERROR_SIZE]{};
    std::string headers;
    applyCommonOptions(curl.get(), url, options_);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION,
        +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
            out->append(ptr, size * nmemb);
            return size * nmemb;
        });
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ConnectionError(fmt::format("cannot reach {}: {}", url, describe(res, error_buffer)));
    }

    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0) {
        info.content_length = static_cast<std::uint64_t>(length);
    }

    std::transform(headers.begin(), headers.end(), headers.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    info.accepts_ranges = headers.find("accept-ranges: bytes") != std::string::npos;

    logger()->debug("probed {}: length {}, ranges {}", url,
                    info.content_length ? std::to_string(*info.content_length) : "unknown",
                    info.accepts_ranges ? "yes" : "no");
    return info;
}

std::unique_ptr<RangeConnection> CurlTransport::connect(const std::string& url, const ByteRange& range) {
    auto connection = std::make_unique<Connection>(url, range, options_);
    connection->waitForHeaders();
    logger()->debug("connected to {} for bytes {}: status {}", url, range.curlRange(),
                    connection->statusCode());
    return connection;
}

} // namespace partfetch
