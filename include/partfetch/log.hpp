#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace partfetch {

// Process-wide logger named "partfetch", writing to stderr so stdout stays
// free for the progress panel.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace partfetch
