#pragma once

#include "byte_range.hpp"
#include "part_file.hpp"
#include "progress.hpp"
#include "range_transport.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace partfetch {

struct PartAssignment {
    std::string url;
    std::uint64_t start_byte{0};
    std::uint64_t end_byte{0};
    // Total bytes the part file holds once complete.
    std::uint64_t part_size{0};
    int part_index{0};
    bool resume{false};
    // Part files are named <part_prefix>.<file name>.part<index>.
    std::string part_prefix;
};

// Downloads one byte range into its own part file and reports every chunk
// to the shared aggregate. A worker makes exactly one pass; build a new
// one to retry.
class PartWorker {
public:
    static constexpr std::size_t kChunkSize = 8 * 1024;

    // Throws InvalidRange. When resuming, an existing part file shifts the
    // requested range past the bytes already on disk.
    PartWorker(PartAssignment assignment, ProgressAggregate& progress, RangeTransport& transport);

    PartWorker(const PartWorker&) = delete;
    PartWorker& operator=(const PartWorker&) = delete;

    // Download faults are latched into the aggregate and end the pass.
    void run();

    [[nodiscard]] std::uint64_t downloadedBytes() const noexcept { return downloaded_bytes_; }
    [[nodiscard]] std::uint64_t partSize() const noexcept { return part_size_; }
    [[nodiscard]] std::uint64_t resumeOffset() const noexcept { return resume_.offset; }
    [[nodiscard]] bool resumeRequested() const noexcept { return resume_requested_; }
    [[nodiscard]] int partIndex() const noexcept { return part_index_; }
    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }
    [[nodiscard]] const std::string& partFilePath() const noexcept { return part_file_path_; }

    // True when the part file already held the whole span at construction.
    [[nodiscard]] bool alreadyComplete() const noexcept { return already_complete_; }

private:
    void streamToFile(RangeConnection& connection);
    [[nodiscard]] bool acceptsStatus(const RangeConnection& connection) const;
    [[nodiscard]] std::uint64_t expectedTotal(const RangeConnection& connection) const;

    std::string url_;
    ByteRange range_;
    std::uint64_t part_size_;
    int part_index_;
    bool resume_requested_;
    std::string part_file_path_;
    ResumeState resume_;
    bool already_complete_{false};
    std::uint64_t downloaded_bytes_{0};

    ProgressAggregate& progress_;
    RangeTransport& transport_;
};

} // namespace partfetch
