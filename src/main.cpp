#include "partfetch/curl_transport.hpp"
#include "partfetch/download_manager.hpp"
#include "partfetch/errors.hpp"
#include "partfetch/log.hpp"
#include "partfetch/part_file.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr int kMaxParts = 64;

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-t <parts>] [-T <temp-dir>] [-o <name>] [-r] [-q] [-v] <url>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -t <parts>       Number of parts downloaded in parallel (default: 8)\n"
              << "  -T <temp-dir>    Directory for part files (default: download directory)\n"
              << "  -o <name>        Output file name (default: taken from the URL)\n"
              << "  -r               Resume from part files left by an earlier run\n"
              << "  -q               Hide the progress panel and log warnings only\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        partfetch::CurlTransport::initializeGlobal();

        partfetch::DownloadOptions options;
        std::filesystem::path download_dir = std::filesystem::current_path();
        std::filesystem::path temp_dir;
        std::string output_name;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];
            const bool has_value = arg_index + 1 < argc;

            if (option == "-d" || option == "-t" || option == "-T" || option == "-o") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];

                if (option == "-d") {
                    download_dir = value;
                } else if (option == "-T") {
                    temp_dir = value;
                } else if (option == "-o") {
                    output_name = value;
                } else {
                    try {
                        options.part_count = std::stoi(value);
                    } catch (const std::exception&) {
                        throw std::runtime_error("Invalid part count: " + value);
                    }
                    if (options.part_count <= 0 || options.part_count > kMaxParts) {
                        throw std::runtime_error("Part count must be between 1 and " + std::to_string(kMaxParts));
                    }
                }
                arg_index += 2;
            } else if (option == "-r") {
                options.resume = true;
                ++arg_index;
            } else if (option == "-q") {
                options.show_progress = false;
                partfetch::setLogLevel(spdlog::level::warn);
                ++arg_index;
            } else if (option == "-v") {
                partfetch::setLogLevel(spdlog::level::debug);
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index != 1) {
            printUsage(argv[0]);
            return 1;
        }

        std::error_code ec;
        std::filesystem::create_directories(download_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: "
                + download_dir.string() + " - " + ec.message());
        }

        options.url = argv[arg_index];
        if (output_name.empty()) {
            output_name = partfetch::urlFileName(options.url);
        }
        options.destination = download_dir / output_name;
        options.temp_dir = temp_dir.empty() ? download_dir : temp_dir;

        partfetch::DownloadManager manager(std::move(options), std::make_shared<partfetch::CurlTransport>());
        const auto result = manager.run();
        if (!result.ok()) {
            std::cerr << "Download failed: part " << result.fault->part_index << ": "
                      << partfetch::toString(result.fault->kind) << ": " << result.fault->message << std::endl;
            std::cerr << "Part files were kept; rerun with -r to resume." << std::endl;
            return 1;
        }

        std::cout << "Saved " << result.destination.string() << " (" << result.content_length << " bytes)"
                  << std::endl;
    } catch (const partfetch::DownloadError& ex) {
        std::cerr << "Download failed: " << partfetch::toString(ex.kind()) << ": " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
