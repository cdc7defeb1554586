// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/disk/file_writer.hpp>
#include "support/temp_dir.hpp"

using namespace reel::disk;
using reel::core::ErrorKind;
using reel::test::TempDir;
using reel::test::read_file;

namespace fs = std::filesystem;

TEST_CASE("FileWriter basic operations", "[disk]") {
    TempDir dir;
    const auto path = dir / "data.bin";

    FileWriter writer;
    CHECK_FALSE(writer.is_open());
    REQUIRE_FALSE(writer.open(path));
    CHECK(writer.is_open());
    CHECK(writer.path() == path);

    const std::string part1 = "hello ";
    const std::string part2 = "segment";
    REQUIRE_FALSE(writer.write(part1.data(), part1.size()));
    REQUIRE_FALSE(writer.write(part2.data(), part2.size()));
    REQUIRE_FALSE(writer.sync());
    REQUIRE_FALSE(writer.close());
    CHECK_FALSE(writer.is_open());

    CHECK(read_file(path) == "hello segment");

    SECTION("Write after close fails") {
        CHECK(writer.write("x", 1) == DiskErrc::write_error);
    }

    SECTION("Moved-from writer is closed") {
        FileWriter first;
        REQUIRE_FALSE(first.open(dir / "other.bin"));
        FileWriter second = std::move(first);
        CHECK_FALSE(first.is_open());
        CHECK(second.is_open());
    }
}

TEST_CASE("FileWriter::open errors", "[disk]") {
    TempDir dir;
    FileWriter writer;
    auto ec = writer.open(dir / "missing" / "file.bin");
    REQUIRE(ec);
    CHECK(ec == DiskErrc::file_not_found);
    CHECK(ec == ErrorKind::io);
}

TEST_CASE("write_atomic", "[disk]") {
    TempDir dir;
    const auto path = dir / "001.ts";

    SECTION("Writes the final file and leaves no staging file") {
        REQUIRE_FALSE(write_atomic(path, "payload"));
        CHECK(read_file(path) == "payload");
        CHECK_FALSE(fs::exists(partial_path(path)));
    }

    SECTION("Replaces an existing file") {
        REQUIRE_FALSE(write_atomic(path, "old"));
        REQUIRE_FALSE(write_atomic(path, "new"));
        CHECK(read_file(path) == "new");
    }

    SECTION("A leftover staging file is overwritten") {
        reel::test::write_file(partial_path(path), "garbage from a crash");
        REQUIRE_FALSE(write_atomic(path, "payload"));
        CHECK(read_file(path) == "payload");
        CHECK_FALSE(fs::exists(partial_path(path)));
    }

    SECTION("Failure leaves no final file") {
        const auto bad = dir / "no-such-dir" / "002.ts";
        auto ec = write_atomic(bad, "payload");
        REQUIRE(ec);
        CHECK_FALSE(fs::exists(bad));
    }

    SECTION("Rename onto a directory fails and cleans up") {
        fs::create_directory(dir / "003.ts");
        fs::create_directory(dir / "003.ts" / "occupied");
        auto ec = write_atomic(dir / "003.ts", "payload");
        REQUIRE(ec);
        CHECK(ec == ErrorKind::io);
        CHECK_FALSE(fs::exists(partial_path(dir / "003.ts")));
    }
}

TEST_CASE("partial_path", "[disk]") {
    CHECK(partial_path("dir/001.ts") == fs::path("dir/001.ts.writing"));
}

TEST_CASE("Directory helpers", "[disk]") {
    TempDir dir;
    const auto nested = dir / "a" / "b";

    REQUIRE_FALSE(ensure_directory(nested));
    CHECK(fs::is_directory(nested));
    REQUIRE_FALSE(ensure_directory(nested));

    reel::test::write_file(nested / "stale.ts", "x");
    REQUIRE_FALSE(reset_directory(dir / "a"));
    CHECK(fs::is_directory(dir / "a"));
    CHECK(fs::is_empty(dir / "a"));
}

TEST_CASE("reset_directory empties the working directory in place", "[disk]") {
    TempDir dir;
    reel::test::write_file(dir / "precious.txt", "x");
    reel::test::write_file(dir / "record.json", "{}");
    REQUIRE_FALSE(ensure_directory(dir / "sub" / "deep"));
    reel::test::write_file(dir / "sub" / "deep" / "001.ts", "x");

    reel::test::ScopedWorkingDir cwd(dir.path());
    REQUIRE_FALSE(reset_directory("."));
    CHECK(fs::is_directory(dir.path()));
    CHECK(fs::is_empty(dir.path()));

    SECTION("Already empty") {
        CHECK_FALSE(reset_directory("."));
        CHECK(fs::is_empty(dir.path()));
    }
}
