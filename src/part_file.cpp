#include "partfetch/part_file.hpp"

#include "partfetch/errors.hpp"
#include "partfetch/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace partfetch {

std::string urlFileName(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto slash = path.find('/', scheme + 3);
        path = (slash == std::string::npos) ? std::string{} : path.substr(slash);
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    const auto last = path.find_last_of('/');
    std::string name = (last == std::string::npos) ? path : path.substr(last + 1);
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

std::string makePartFilePath(const std::string& prefix, const std::string& url, int part_index) {
    return fmt::format("{}.{}.part{}", prefix, urlFileName(url), part_index);
}

ResumeState probeResume(const std::string& part_path, std::uint64_t span_length) {
    std::error_code ec;
    const auto length = std::filesystem::file_size(part_path, ec);
    if (ec) {
        logger()->debug("no usable part file {} ({}), starting fresh", part_path, ec.message());
        return ResumeState::fresh();
    }

    if (length > span_length) {
        logger()->info("part file {} holds {} bytes but the part spans {}, starting fresh",
                       part_path, length, span_length);
        return ResumeState::fresh();
    }

    logger()->debug("resuming {} from byte {}", part_path, length);
    return ResumeState::resumed(length);
}

PartFileWriter::PartFileWriter(std::string path, Mode first_write_mode)
    : path_(std::move(path)), first_write_mode_(first_write_mode) {}

void PartFileWriter::open() {
    const char* mode = (first_write_mode_ == Mode::Truncate) ? "wb" : "ab";
    file_.reset(std::fopen(path_.c_str(), mode));
    if (!file_) {
        throw PartFileError(fmt::format("cannot open part file {}: {}", path_, std::strerror(errno)));
    }
}

void PartFileWriter::append(const char* data, std::size_t size) {
    if (!file_) {
        open();
    }

    const std::size_t written = std::fwrite(data, 1, size, file_.get());
    if (written != size || std::fflush(file_.get()) != 0) {
        throw PartFileError(fmt::format("failed to write part file {}: {}", path_, std::strerror(errno)));
    }
    bytes_written_ += written;
}

void PartFileWriter::close() {
    if (!file_) {
        return;
    }
    if (std::fclose(file_.release()) != 0) {
        throw PartFileError(fmt::format("failed to close part file {}: {}", path_, std::strerror(errno)));
    }
}

} // namespace partfetch
