#pragma once

#include <memory>

#include <curl/curl.h>

namespace partfetch::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlMultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;

[[nodiscard]] inline CurlHandle makeCurlHandle() {
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

[[nodiscard]] inline CurlMultiHandle makeCurlMultiHandle() {
    return CurlMultiHandle{curl_multi_init(), &curl_multi_cleanup};
}

} // namespace partfetch::detail
