#include <catch2/catch.hpp>

#include "partfetch/errors.hpp"
#include "partfetch/part_file.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>

using partfetch::PartFileWriter;
using partfetch::ResumeState;
using partfetch::test::readFile;
using partfetch::test::TempDir;
using partfetch::test::writeFile;

TEST_CASE("urlFileName takes the last path segment") {
    REQUIRE(partfetch::urlFileName("http://example.com/pub/iso/image.iso") == "image.iso");
    REQUIRE(partfetch::urlFileName("https://example.com/f.tar.gz?token=abc#frag") == "f.tar.gz");
    REQUIRE(partfetch::urlFileName("http://example.com/releases/") == "releases");
    REQUIRE(partfetch::urlFileName("http://example.com/") == "download");
    REQUIRE(partfetch::urlFileName("http://example.com") == "download");
    REQUIRE(partfetch::urlFileName("file:///var/tmp/data.bin") == "data.bin");
}

TEST_CASE("Part file names are distinct per index") {
    const std::string url = "http://example.com/files/big.bin";
    REQUIRE(partfetch::makePartFilePath("/tmp/pf/", url, 0) == "/tmp/pf/.big.bin.part0");
    REQUIRE(partfetch::makePartFilePath("/tmp/pf/", url, 3) == "/tmp/pf/.big.bin.part3");
    REQUIRE(partfetch::makePartFilePath("", url, 1) == ".big.bin.part1");
}

TEST_CASE("probeResume measures an existing part file") {
    TempDir dir;
    const auto path = (dir.path() / ".f.part0").string();

    SECTION("missing file starts fresh") {
        const auto state = partfetch::probeResume(path, 100);
        REQUIRE(state.kind == ResumeState::Kind::Fresh);
        REQUIRE(state.offset == 0);
    }

    SECTION("partial file resumes after its bytes") {
        writeFile(path, std::string(40, 'x'));
        const auto state = partfetch::probeResume(path, 100);
        REQUIRE(state.isResumed());
        REQUIRE(state.offset == 40);
    }

    SECTION("empty file resumes from zero") {
        writeFile(path, "");
        const auto state = partfetch::probeResume(path, 100);
        REQUIRE(state.isResumed());
        REQUIRE(state.offset == 0);
    }

    SECTION("complete file resumes at the span end") {
        writeFile(path, std::string(100, 'x'));
        const auto state = partfetch::probeResume(path, 100);
        REQUIRE(state.isResumed());
        REQUIRE(state.offset == 100);
    }

    SECTION("oversized file is not trusted") {
        writeFile(path, std::string(101, 'x'));
        REQUIRE_FALSE(partfetch::probeResume(path, 100).isResumed());
    }

    SECTION("unmeasurable path is not trusted") {
        std::filesystem::create_directories(path);
        REQUIRE_FALSE(partfetch::probeResume(path, 100).isResumed());
    }
}

TEST_CASE("PartFileWriter honours its first-write mode") {
    TempDir dir;
    const auto path = (dir.path() / "part").string();
    writeFile(path, "previous run");

    SECTION("truncate replaces old content, then appends") {
        PartFileWriter writer(path, PartFileWriter::Mode::Truncate);
        REQUIRE(readFile(path) == "previous run");
        writer.append("abc", 3);
        writer.append("def", 3);
        writer.close();
        REQUIRE(readFile(path) == "abcdef");
        REQUIRE(writer.bytesWritten() == 6);
    }

    SECTION("append keeps old content") {
        PartFileWriter writer(path, PartFileWriter::Mode::Append);
        writer.append("!", 1);
        writer.close();
        REQUIRE(readFile(path) == "previous run!");
    }

    SECTION("nothing is touched without a write") {
        {
            PartFileWriter writer(path, PartFileWriter::Mode::Truncate);
        }
        REQUIRE(readFile(path) == "previous run");
    }
}

TEST_CASE("PartFileWriter reports unopenable paths") {
    TempDir dir;
    PartFileWriter writer((dir.path() / "missing" / "part").string(), PartFileWriter::Mode::Truncate);
    REQUIRE_THROWS_AS(writer.append("x", 1), partfetch::PartFileError);
}
