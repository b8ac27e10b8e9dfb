#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace partfetch {

// Last path segment of `url` without query or fragment; "download" when
// the URL carries no usable name.
[[nodiscard]] std::string urlFileName(const std::string& url);

// <prefix>.<file name>.part<index>
[[nodiscard]] std::string makePartFilePath(const std::string& prefix, const std::string& url, int part_index);

struct ResumeState {
    enum class Kind { Fresh, Resumed };

    Kind kind{Kind::Fresh};
    std::uint64_t offset{0};

    [[nodiscard]] static ResumeState fresh() noexcept { return {}; }
    [[nodiscard]] static ResumeState resumed(std::uint64_t offset) noexcept { return {Kind::Resumed, offset}; }

    [[nodiscard]] bool isResumed() const noexcept { return kind == Kind::Resumed; }
};

// Measures an existing part file. Anything that prevents trusting it
// (missing, unreadable, longer than the span) yields Fresh.
[[nodiscard]] ResumeState probeResume(const std::string& part_path, std::uint64_t span_length);

class PartFileWriter {
public:
    enum class Mode { Truncate, Append };

    // The file is not touched until the first append, which opens it with
    // `first_write_mode`. Later appends go to the same handle.
    PartFileWriter(std::string path, Mode first_write_mode);

    void append(const char* data, std::size_t size);
    void close();

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytes_written_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void open();

    std::string path_;
    Mode first_write_mode_;
    std::unique_ptr<FILE, FileDeleter> file_{};
    std::uint64_t bytes_written_{0};
};

} // namespace partfetch
