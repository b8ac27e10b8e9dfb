#pragma once

#include "byte_range.hpp"
#include "progress.hpp"
#include "range_transport.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace partfetch {

struct DownloadOptions {
    std::string url;
    std::filesystem::path destination;
    // Directory that receives the part files.
    std::filesystem::path temp_dir;
    int part_count{8};
    bool resume{false};
    bool show_progress{true};
};

struct DownloadResult {
    std::filesystem::path destination;
    std::uint64_t content_length{0};
    std::uint64_t downloaded_bytes{0};
    std::optional<WorkerFault> fault;

    [[nodiscard]] bool ok() const noexcept { return !fault.has_value(); }
};

// Equal inclusive ranges covering [0, content_length); the last one takes
// the remainder. The part count shrinks so every range holds two bytes.
[[nodiscard]] std::vector<ByteRange> splitRanges(std::uint64_t content_length, int part_count);

// Concatenates `part_paths` in order into `destination`. Throws PartFileError.
void mergeParts(const std::vector<std::string>& part_paths, const std::filesystem::path& destination);

class DownloadManager {
public:
    DownloadManager(DownloadOptions options, RangeTransportPtr transport);

    // Throws ConnectionError when the resource cannot be probed and
    // InvalidRange when it cannot be split. Worker faults are returned in
    // the result; their part files stay on disk for a later resume.
    DownloadResult run();

    [[nodiscard]] const DownloadOptions& options() const noexcept { return options_; }

private:
    void renderProgressLoop(const ProgressAggregate& progress, std::vector<std::future<void>>& pending,
                            std::uint64_t total_bytes) const;
    static std::string buildProgressPanel(const ProgressSnapshot& snapshot, std::uint64_t total_bytes,
                                          std::size_t part_count);
    static std::string formatSize(std::uint64_t bytes);
    static bool allFinished(std::vector<std::future<void>>& pending);
    static void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    [[nodiscard]] std::string partPrefix() const;

    DownloadOptions options_;
    RangeTransportPtr transport_;
};

} // namespace partfetch
