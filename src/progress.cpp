#include "partfetch/progress.hpp"

#include <algorithm>
#include <utility>

namespace partfetch {

ProgressAggregate::ProgressAggregate(std::uint32_t window_samples)
    : window_samples_(std::max<std::uint32_t>(1, window_samples)),
      start_(Clock::now()),
      last_chunk_at_(start_) {}

void ProgressAggregate::addResumedBytes(std::uint64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total_downloaded_bytes_ += bytes;
        ++sequence_;
    }
    updated_.notify_all();
}

void ProgressAggregate::recordChunk(std::uint64_t bytes) {
    recordChunk(bytes, Clock::now());
}

void ProgressAggregate::recordChunk(std::uint64_t bytes, Clock::time_point completed_at) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Chunks from different workers may arrive with slightly out of
        // order timestamps; never count negative time.
        const auto elapsed = std::max(std::chrono::nanoseconds::zero(),
                                      std::chrono::duration_cast<std::chrono::nanoseconds>(
                                          completed_at - last_chunk_at_));
        last_chunk_at_ = std::max(last_chunk_at_, completed_at);

        total_downloaded_bytes_ += bytes;
        window_bytes_ += bytes;
        window_elapsed_ += elapsed;
        ++window_sample_count_;

        if (window_sample_count_ >= window_samples_) {
            last_sample_ = WindowSample{window_bytes_, window_elapsed_};
            window_bytes_ = 0;
            window_elapsed_ = std::chrono::nanoseconds::zero();
            window_sample_count_ = 0;
        }
        ++sequence_;
    }
    updated_.notify_all();
}

bool ProgressAggregate::recordError(WorkerFault fault) {
    bool stored = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!first_error_) {
            first_error_ = std::move(fault);
            stored = true;
        }
        ++sequence_;
    }
    updated_.notify_all();
    return stored;
}

ProgressSnapshot ProgressAggregate::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked();
}

std::uint64_t ProgressAggregate::totalDownloadedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_downloaded_bytes_;
}

std::optional<WorkerFault> ProgressAggregate::firstError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_error_;
}

ProgressSnapshot ProgressAggregate::waitForUpdate(std::uint64_t seen_sequence,
                                                  std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    updated_.wait_for(lock, timeout, [&] { return sequence_ > seen_sequence; });
    return snapshotLocked();
}

ProgressSnapshot ProgressAggregate::snapshotLocked() const {
    ProgressSnapshot snap;
    snap.total_downloaded_bytes = total_downloaded_bytes_;
    snap.window_bytes = window_bytes_;
    snap.window_elapsed = window_elapsed_;
    snap.window_sample_count = window_sample_count_;
    snap.last_sample = last_sample_;
    snap.sequence = sequence_;
    snap.first_error = first_error_;
    return snap;
}

} // namespace partfetch
