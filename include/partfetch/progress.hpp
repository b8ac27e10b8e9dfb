#pragma once

#include "errors.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace partfetch {

using Clock = std::chrono::steady_clock;

struct WorkerFault {
    ErrorKind kind{ErrorKind::Stream};
    int part_index{-1};
    std::string message;
};

// Bytes and time accumulated over one measurement window.
struct WindowSample {
    std::uint64_t bytes{0};
    std::chrono::nanoseconds elapsed{0};

    [[nodiscard]] double bytesPerSecond() const {
        if (elapsed.count() <= 0) {
            return 0.0;
        }
        return static_cast<double>(bytes) / std::chrono::duration<double>(elapsed).count();
    }
};

struct ProgressSnapshot {
    std::uint64_t total_downloaded_bytes{0};
    std::uint64_t window_bytes{0};
    std::chrono::nanoseconds window_elapsed{0};
    std::uint32_t window_sample_count{0};
    WindowSample last_sample;
    std::uint64_t sequence{0};
    std::optional<WorkerFault> first_error;
};

// Shared accounting for every worker of one download session. All state
// lives behind one mutex; observers block on waitForUpdate().
class ProgressAggregate {
public:
    // The window resets once it holds `window_samples` chunks. The default
    // of 1 yields an instantaneous per-chunk rate.
    explicit ProgressAggregate(std::uint32_t window_samples = 1);

    ProgressAggregate(const ProgressAggregate&) = delete;
    ProgressAggregate& operator=(const ProgressAggregate&) = delete;

    void addResumedBytes(std::uint64_t bytes);

    void recordChunk(std::uint64_t bytes);
    void recordChunk(std::uint64_t bytes, Clock::time_point completed_at);

    // Returns false when a fault was already latched; the stored one wins.
    bool recordError(WorkerFault fault);

    [[nodiscard]] ProgressSnapshot snapshot() const;
    [[nodiscard]] std::uint64_t totalDownloadedBytes() const;
    [[nodiscard]] std::optional<WorkerFault> firstError() const;
    [[nodiscard]] Clock::time_point startTime() const noexcept { return start_; }

    // Blocks until an update newer than `seen_sequence` is published or
    // the timeout expires.
    [[nodiscard]] ProgressSnapshot waitForUpdate(std::uint64_t seen_sequence,
                                                 std::chrono::milliseconds timeout) const;

private:
    [[nodiscard]] ProgressSnapshot snapshotLocked() const;

    const std::uint32_t window_samples_;
    const Clock::time_point start_;

    mutable std::mutex mutex_;
    mutable std::condition_variable updated_;

    Clock::time_point last_chunk_at_;
    std::uint64_t total_downloaded_bytes_{0};
    std::uint64_t window_bytes_{0};
    std::chrono::nanoseconds window_elapsed_{0};
    std::uint32_t window_sample_count_{0};
    WindowSample last_sample_;
    std::uint64_t sequence_{0};
    std::optional<WorkerFault> first_error_;
};

} // namespace partfetch
