#include "partfetch/part_worker.hpp"

#include "partfetch/errors.hpp"
#include "partfetch/log.hpp"

#include <utility>
#include <vector>

#include <fmt/format.h>

namespace partfetch {

namespace {

constexpr long kOk = 200;
constexpr long kPartialContent = 206;

} // namespace

PartWorker::PartWorker(PartAssignment assignment, ProgressAggregate& progress, RangeTransport& transport)
    : url_(std::move(assignment.url)),
      range_(ByteRange::make(assignment.start_byte, assignment.end_byte)),
      part_size_(assignment.part_size),
      part_index_(assignment.part_index),
      resume_requested_(assignment.resume),
      part_file_path_(makePartFilePath(assignment.part_prefix, url_, part_index_)),
      progress_(progress),
      transport_(transport) {
    if (resume_requested_) {
        resume_ = probeResume(part_file_path_, range_.length());
    }

    if (resume_.isResumed()) {
        downloaded_bytes_ = resume_.offset;
        if (resume_.offset == range_.length()) {
            already_complete_ = true;
        } else {
            range_ = range_.advancedBy(resume_.offset);
        }
    }
}

void PartWorker::run() {
    try {
        if (already_complete_) {
            logger()->debug("part {} already complete ({} bytes)", part_index_, downloaded_bytes_);
            progress_.addResumedBytes(resume_.offset);
            return;
        }

        auto connection = transport_.connect(url_, range_);
        if (!acceptsStatus(*connection)) {
            throw ConnectionError(
                fmt::format("unexpected HTTP {} for Range {}", connection->statusCode(), range_.headerValue()));
        }

        streamToFile(*connection);
    } catch (const DownloadError& ex) {
        logger()->error("part {} failed: {}", part_index_, ex.what());
        progress_.recordError(WorkerFault{ex.kind(), part_index_, ex.what()});
    }
}

// 206 is the normal answer. A plain 200 still carries the right bytes when the
// range starts at zero and the body is exactly the range.
bool PartWorker::acceptsStatus(const RangeConnection& connection) const {
    const long status = connection.statusCode();
    if (status == 0 || status == kPartialContent) {
        return true;
    }
    return status == kOk && range_.start() == 0 && connection.contentLength() == range_.length();
}

std::uint64_t PartWorker::expectedTotal(const RangeConnection& connection) const {
    // The remote only reports what it sends now; resumed bytes are on disk.
    const auto announced = connection.contentLength();
    return announced.value_or(range_.length()) + resume_.offset;
}

void PartWorker::streamToFile(RangeConnection& connection) {
    const std::uint64_t expected_total = expectedTotal(connection);

    if (resume_.offset > 0) {
        progress_.addResumedBytes(resume_.offset);
    }

    PartFileWriter writer(part_file_path_, resume_.isResumed() ? PartFileWriter::Mode::Append
                                                               : PartFileWriter::Mode::Truncate);
    std::vector<char> chunk(kChunkSize);

    while (downloaded_bytes_ < expected_total) {
        const std::size_t received = connection.read(chunk.data(), chunk.size());
        if (received == 0) {
            logger()->warn("part {} stream ended early: {} of {} bytes", part_index_, downloaded_bytes_,
                           expected_total);
            break;
        }

        writer.append(chunk.data(), received);
        downloaded_bytes_ += received;
        progress_.recordChunk(received);
    }

    writer.close();
}

} // namespace partfetch
