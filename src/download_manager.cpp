#include "partfetch/download_manager.hpp"

#include "partfetch/errors.hpp"
#include "partfetch/log.hpp"
#include "partfetch/part_file.hpp"
#include "partfetch/part_worker.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace partfetch {

namespace {

constexpr auto kRedrawInterval = std::chrono::milliseconds(100);
constexpr std::size_t kMergeBufferSize = 64 * 1024;

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

} // namespace

std::vector<ByteRange> splitRanges(std::uint64_t content_length, int part_count) {
    std::uint64_t parts = static_cast<std::uint64_t>(std::max(1, part_count));
    parts = std::max<std::uint64_t>(1, std::min(parts, content_length / 2));

    const std::uint64_t part_size = content_length / parts;
    std::vector<ByteRange> ranges;
    ranges.reserve(parts);
    for (std::uint64_t i = 0; i < parts; ++i) {
        const std::uint64_t start = i * part_size;
        const std::uint64_t end = (i + 1 == parts) ? content_length - 1 : start + part_size - 1;
        ranges.push_back(ByteRange::make(start, end));
    }
    return ranges;
}

void mergeParts(const std::vector<std::string>& part_paths, const std::filesystem::path& destination) {
    PartFileWriter out(destination.string(), PartFileWriter::Mode::Truncate);
    std::vector<char> buffer(kMergeBufferSize);

    try {
        for (const auto& path : part_paths) {
            FilePtr in{std::fopen(path.c_str(), "rb")};
            if (!in) {
                throw PartFileError(fmt::format("cannot open part file {}: {}", path, std::strerror(errno)));
            }

            std::size_t count = 0;
            while ((count = std::fread(buffer.data(), 1, buffer.size(), in.get())) > 0) {
                out.append(buffer.data(), count);
            }
            if (std::ferror(in.get())) {
                throw PartFileError(fmt::format("failed to read part file {}", path));
            }
        }
        out.close();
    } catch (const PartFileError&) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        throw;
    }
}

DownloadManager::DownloadManager(DownloadOptions options, RangeTransportPtr transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("DownloadManager requires a transport");
    }
}

std::string DownloadManager::partPrefix() const {
    if (options_.temp_dir.empty()) {
        return {};
    }
    return (options_.temp_dir / "").string();
}

DownloadResult DownloadManager::run() {
    DownloadResult result;
    result.destination = options_.destination;

    const auto info = transport_->probe(options_.url);
    if (!info.content_length || *info.content_length == 0) {
        throw ConnectionError(fmt::format("{} did not report a content length", options_.url));
    }
    if (!info.accepts_ranges) {
        logger()->warn("{} does not advertise byte ranges", options_.url);
    }
    result.content_length = *info.content_length;

    const auto ranges = splitRanges(result.content_length, options_.part_count);

    if (!options_.temp_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(options_.temp_dir, ec);
        if (ec) {
            throw PartFileError(fmt::format("cannot create temp directory {}: {}", options_.temp_dir.string(),
                                            ec.message()));
        }
    }

    ProgressAggregate progress;
    const std::string prefix = partPrefix();

    std::vector<std::unique_ptr<PartWorker>> workers;
    workers.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        PartAssignment assignment;
        assignment.url = options_.url;
        assignment.start_byte = ranges[i].start();
        assignment.end_byte = ranges[i].end();
        assignment.part_size = ranges[i].length();
        assignment.part_index = static_cast<int>(i);
        assignment.resume = options_.resume;
        assignment.part_prefix = prefix;
        workers.push_back(std::make_unique<PartWorker>(std::move(assignment), progress, *transport_));
    }

    logger()->info("downloading {} ({}) in {} parts{}", options_.url, formatSize(result.content_length),
                   workers.size(), options_.resume ? ", resuming" : "");

    std::vector<std::future<void>> pending;
    pending.reserve(workers.size());
    for (auto& worker : workers) {
        pending.push_back(std::async(std::launch::async, [w = worker.get()] { w->run(); }));
    }

    if (options_.show_progress) {
        renderProgressLoop(progress, pending, result.content_length);
    }
    for (auto& task : pending) {
        task.get();
    }

    result.downloaded_bytes = progress.totalDownloadedBytes();
    if (auto fault = progress.firstError()) {
        logger()->error("download failed in part {}: {}", fault->part_index, fault->message);
        result.fault = std::move(fault);
        return result;
    }

    std::vector<std::string> part_paths;
    part_paths.reserve(workers.size());
    for (const auto& worker : workers) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(worker->partFilePath(), ec);
        const std::uint64_t on_disk = ec ? 0 : size;
        // A stale file of the right size does not count unless this run accounted for every byte.
        if (on_disk != worker->partSize() || worker->downloadedBytes() != worker->partSize()) {
            result.fault = WorkerFault{ErrorKind::Stream, worker->partIndex(),
                                       fmt::format("part {} incomplete: {} of {} bytes on disk, {} received",
                                                   worker->partIndex(), on_disk, worker->partSize(),
                                                   worker->downloadedBytes())};
            logger()->error("{}", result.fault->message);
            return result;
        }
        part_paths.push_back(worker->partFilePath());
    }

    mergeParts(part_paths, options_.destination);
    logger()->info("merged {} parts into {}", part_paths.size(), options_.destination.string());

    for (const auto& path : part_paths) {
        std::error_code ec;
        if (!std::filesystem::remove(path, ec) && ec) {
            logger()->warn("cannot delete part file {}: {}", path, ec.message());
        }
    }
    return result;
}

void DownloadManager::renderProgressLoop(const ProgressAggregate& progress, std::vector<std::future<void>>& pending,
                                         std::uint64_t total_bytes) const {
    std::size_t previous_lines = 0;
    std::uint64_t seen = 0;
    Clock::time_point last_draw{};

    while (true) {
        const auto snapshot = progress.waitForUpdate(seen, kRedrawInterval);
        seen = snapshot.sequence;

        const bool finished = allFinished(pending);
        const auto now = Clock::now();
        if (finished || now - last_draw >= kRedrawInterval) {
            redrawPanel(buildProgressPanel(snapshot, total_bytes, pending.size()), previous_lines);
            last_draw = now;
        }
        if (finished) {
            break;
        }
    }
}

std::string DownloadManager::buildProgressPanel(const ProgressSnapshot& snapshot, std::uint64_t total_bytes,
                                                std::size_t part_count) {
    constexpr std::size_t kBarCells = 30;
    const std::uint64_t done = std::min(snapshot.total_downloaded_bytes, total_bytes);
    const std::size_t filled = total_bytes > 0 ? static_cast<std::size_t>(done * kBarCells / total_bytes) : 0;
    const unsigned percent = total_bytes > 0 ? static_cast<unsigned>(done * 100 / total_bytes) : 0;

    std::string panel = fmt::format("partfetch: {} parts, {} of {}\n", part_count,
                                    formatSize(snapshot.total_downloaded_bytes), formatSize(total_bytes));
    panel += fmt::format("  [{}{}] {:>3}%  {}/s\n", std::string(filled, '#'), std::string(kBarCells - filled, '.'),
                         percent, formatSize(static_cast<std::uint64_t>(snapshot.last_sample.bytesPerSecond())));
    if (snapshot.first_error) {
        const auto& fault = *snapshot.first_error;
        panel += fmt::format("  part {} failed ({}): {}\n", fault.part_index, toString(fault.kind), fault.message);
    }
    return panel;
}

std::string DownloadManager::formatSize(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

bool DownloadManager::allFinished(std::vector<std::future<void>>& pending) {
    return std::all_of(pending.begin(), pending.end(), [](std::future<void>& task) {
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
}

// Moves the cursor back over the previous panel before printing the new one.
void DownloadManager::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    std::string frame;
    if (previous_lines > 0) {
        frame = fmt::format("\x1b[{}A\r\x1b[0J", previous_lines);
    }
    frame += panel;
    std::fwrite(frame.data(), 1, frame.size(), stdout);
    std::fflush(stdout);
    previous_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

} // namespace partfetch
