// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/media/segment_downloader.hpp>
#include <reel/core/url.hpp>
#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>
#include "support/fake_fetch_client.hpp"
#include "support/temp_dir.hpp"

using namespace reel::media;
using namespace std::chrono_literals;
using reel::core::Errc;
using reel::test::FakeFetchClient;
using reel::test::TempDir;
using reel::test::read_file;

namespace fs = std::filesystem;

namespace {

constexpr const char* BASE = "https://cdn.example.com/vod/index.m3u8";

ResolvedPlaylist playlist_from(const std::string& text) {
    auto media = HLSParser::parse_media(text);
    REQUIRE(media.has_value());
    auto base = reel::core::Url::parse(BASE);
    REQUIRE(base.has_value());
    return ResolvedPlaylist(*base, std::move(*media), "sum");
}

// Playlist with `count` segments named 000.ts, 001.ts, ... all served by `client`
ResolvedPlaylist numbered_playlist(FakeFetchClient& client, int count) {
    std::string text = "#EXTM3U\n#EXT-X-TARGETDURATION:4\n";
    for (int i = 0; i < count; ++i) {
        char name[16];
        std::snprintf(name, sizeof(name), "%03d.ts", i);
        text += "#EXTINF:4,\n";
        text += name;
        text += "\n";
        client.serve(std::string("https://cdn.example.com/vod/") + name, std::string("data-") + name);
    }
    text += "#EXT-X-ENDLIST\n";
    return playlist_from(text);
}

} // namespace

TEST_CASE("SegmentDownloader fetches keys and segments", "[segments]") {
    FakeFetchClient client;
    client.serve("https://cdn.example.com/vod/keys/k1.bin", "KEY1");
    client.serve("https://cdn.example.com/vod/seg/001.ts", "one");
    client.serve("http://cdn/seg/002.ts", "two");

    auto playlist = playlist_from(
        "#EXTM3U\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"keys/k1.bin\"\n"
        "#EXTINF:4,\nseg/001.ts\n"
        "#EXTINF:4,\nhttp://cdn/seg/002.ts\n"
        "#EXT-X-ENDLIST\n");

    TempDir dir;
    SegmentDownloader downloader(client, {{"Referer", "https://example.com"}}, 4);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());

    CHECK(stats->keys == 1);
    CHECK(stats->total == 2);
    CHECK(stats->completed == 2);
    CHECK(stats->fetched == 2);
    CHECK(stats->skipped == 0);

    CHECK(read_file(dir / "k1.bin") == "KEY1");
    CHECK(read_file(dir / "001.ts") == "one");
    CHECK(read_file(dir / "002.ts") == "two");
    CHECK_FALSE(fs::exists(dir / "001.ts.writing"));
    CHECK(client.last_headers().at("Referer") == "https://example.com");
}

TEST_CASE("SegmentDownloader resumes from files on disk", "[segments]") {
    FakeFetchClient client;
    auto playlist = numbered_playlist(client, 3);
    TempDir dir;

    SECTION("Existing files are kept and not fetched") {
        reel::test::write_file(dir / "001.ts", "already here");

        SegmentDownloader downloader(client, {}, 2);
        auto stats = downloader.download(playlist, dir.path());
        REQUIRE(stats.has_value());

        CHECK(stats->fetched == 2);
        CHECK(stats->skipped == 1);
        CHECK(stats->completed == 3);
        CHECK(client.calls("https://cdn.example.com/vod/001.ts") == 0);
        CHECK(read_file(dir / "001.ts") == "already here");
    }

    SECTION("A leftover staging file does not count as done") {
        reel::test::write_file(dir / "001.ts.writing", "half");

        SegmentDownloader downloader(client, {}, 2);
        auto stats = downloader.download(playlist, dir.path());
        REQUIRE(stats.has_value());

        CHECK(stats->fetched == 3);
        CHECK(read_file(dir / "001.ts") == "data-001.ts");
        CHECK_FALSE(fs::exists(dir / "001.ts.writing"));
    }

    SECTION("Second run fetches nothing") {
        SegmentDownloader downloader(client, {}, 2);
        REQUIRE(downloader.download(playlist, dir.path()).has_value());
        client.reset_counts();

        auto stats = downloader.download(playlist, dir.path());
        REQUIRE(stats.has_value());
        CHECK(stats->skipped == 3);
        CHECK(client.total_calls() == 0);
    }
}

TEST_CASE("SegmentDownloader downloads keys before segments", "[segments]") {
    FakeFetchClient client;
    client.fail("https://keys.example.com/k.bin", make_error_code(Errc::not_found));
    client.serve("https://cdn.example.com/vod/001.ts", "one");

    auto playlist = playlist_from(
        "#EXTM3U\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"https://keys.example.com/k.bin\"\n"
        "#EXTINF:4,\n001.ts\n");

    TempDir dir;
    SegmentDownloader downloader(client, {}, 4);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE_FALSE(stats.has_value());
    CHECK(stats.error() == Errc::not_found);
    CHECK(client.calls_ending_with(".ts") == 0);
    CHECK_FALSE(fs::exists(dir / "001.ts"));
}

TEST_CASE("SegmentDownloader fetches rotated keys once each", "[segments]") {
    FakeFetchClient client;
    client.serve("https://cdn.example.com/vod/k1.bin", "K1");
    client.serve("https://cdn.example.com/vod/k2.bin", "K2");
    client.serve("https://cdn.example.com/vod/a.ts", "a");
    client.serve("https://cdn.example.com/vod/b.ts", "b");
    client.serve("https://cdn.example.com/vod/c.ts", "c");

    auto playlist = playlist_from(
        "#EXTM3U\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"k1.bin\"\n#EXTINF:4,\na.ts\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"k2.bin\"\n#EXTINF:4,\nb.ts\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"k1.bin\"\n#EXTINF:4,\nc.ts\n");

    TempDir dir;
    SegmentDownloader downloader(client, {}, 2);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());
    CHECK(stats->keys == 2);
    CHECK(client.calls("https://cdn.example.com/vod/k1.bin") == 1);
    CHECK(read_file(dir / "k2.bin") == "K2");
}

TEST_CASE("SegmentDownloader stops after the first failure", "[segments]") {
    FakeFetchClient client;
    auto playlist = numbered_playlist(client, 20);
    client.fail("https://cdn.example.com/vod/006.ts", make_error_code(Errc::server_error));
    client.latency(10ms);

    TempDir dir;
    SegmentDownloader downloader(client, {}, 4);
    auto stats = downloader.download(playlist, dir.path());

    REQUIRE_FALSE(stats.has_value());
    CHECK(stats.error() == Errc::server_error);
    CHECK(client.calls_ending_with(".ts") < 20);
    CHECK(client.calls_ending_with(".ts") <= 12);
    CHECK_FALSE(fs::exists(dir / "006.ts"));
    CHECK(read_file(dir / "000.ts") == "data-000.ts");
    CHECK_FALSE(fs::exists(dir / "019.ts"));
}

TEST_CASE("SegmentDownloader respects the concurrency bound", "[segments]") {
    FakeFetchClient client;
    auto playlist = numbered_playlist(client, 16);
    client.latency(5ms);

    TempDir dir;
    SegmentDownloader downloader(client, {}, 3);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());
    CHECK(stats->fetched == 16);
    CHECK(client.peak_in_flight() <= 3);
}

TEST_CASE("SegmentDownloader schedules duplicate URIs once", "[segments]") {
    FakeFetchClient client;
    client.serve("https://cdn.example.com/vod/001.ts", "one");
    client.serve("https://cdn.example.com/vod/002.ts", "two");

    auto playlist = playlist_from(
        "#EXTM3U\n"
        "#EXTINF:4,\n001.ts\n"
        "#EXTINF:4,\n002.ts\n"
        "#EXTINF:4,\n001.ts\n");

    TempDir dir;
    SegmentDownloader downloader(client, {}, 4);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());
    CHECK(stats->total == 2);
    CHECK(client.calls("https://cdn.example.com/vod/001.ts") == 1);
}

TEST_CASE("SegmentDownloader keeps segments that differ only by query", "[segments]") {
    FakeFetchClient client;
    client.serve("https://cdn.example.com/vod/get.php?seg=1", "DATA1");
    client.serve("https://cdn.example.com/vod/get.php?seg=2", "DATA2");
    client.serve("https://cdn.example.com/vod/get.php?seg=3", "DATA3");

    auto playlist = playlist_from(
        "#EXTM3U\n"
        "#EXTINF:4,\nget.php?seg=1\n"
        "#EXTINF:4,\nget.php?seg=2\n"
        "#EXTINF:4,\nget.php?seg=3\n"
        "#EXT-X-ENDLIST\n");

    TempDir dir;
    SegmentDownloader downloader(client, {}, 4);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());
    CHECK(stats->total == 3);
    CHECK(stats->fetched == 3);

    for (int i = 1; i <= 3; ++i) {
        const auto name = reel::core::local_file_name("get.php?seg=" + std::to_string(i));
        CHECK(read_file(dir / name) == "DATA" + std::to_string(i));
    }
    CHECK_FALSE(fs::exists(dir / "get.php"));
}

TEST_CASE("SegmentDownloader fetches keys that differ only by query", "[segments]") {
    FakeFetchClient client;
    client.serve("https://cdn.example.com/vod/key?id=1", "K1");
    client.serve("https://cdn.example.com/vod/key?id=2", "K2");
    client.serve("https://cdn.example.com/vod/a.ts", "a");
    client.serve("https://cdn.example.com/vod/b.ts", "b");

    auto playlist = playlist_from(
        "#EXTM3U\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"key?id=1\"\n#EXTINF:4,\na.ts\n"
        "#EXT-X-KEY:METHOD=AES-128,URI=\"key?id=2\"\n#EXTINF:4,\nb.ts\n");

    TempDir dir;
    SegmentDownloader downloader(client, {}, 2);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());
    CHECK(stats->keys == 2);
    CHECK(client.calls("https://cdn.example.com/vod/key?id=2") == 1);
    CHECK(read_file(dir / reel::core::local_file_name("key?id=1")) == "K1");
    CHECK(read_file(dir / reel::core::local_file_name("key?id=2")) == "K2");
}

TEST_CASE("SegmentDownloader refuses two URIs sharing a local name", "[segments]") {
    FakeFetchClient client;
    client.serve("https://cdn.example.com/vod/a/001.ts", "a");
    client.serve("https://cdn.example.com/vod/b/001.ts", "b");

    auto playlist = playlist_from("#EXTM3U\n#EXTINF:4,\na/001.ts\n#EXTINF:4,\nb/001.ts\n");

    TempDir dir;
    SegmentDownloader downloader(client, {}, 2);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE_FALSE(stats.has_value());
    CHECK(stats.error() == Errc::local_name_collision);
    CHECK(stats.error() == reel::core::ErrorKind::resolution);
    CHECK(client.total_calls() == 0);
}

TEST_CASE("SegmentDownloader reports progress", "[segments]") {
    FakeFetchClient client;
    auto playlist = numbered_playlist(client, 10);
    TempDir dir;
    reel::test::write_file(dir / "004.ts", "present");

    std::vector<std::size_t> seen;
    std::size_t reported_total = 0;

    SegmentDownloader downloader(client, {}, 4);
    downloader.callback([&](std::size_t completed, std::size_t total) {
        seen.push_back(completed);
        reported_total = total;
    });

    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());

    CHECK(reported_total == 10);
    REQUIRE(seen.size() == 10);
    // Each completed unit is counted exactly once
    std::sort(seen.begin(), seen.end());
    for (std::size_t i = 0; i < seen.size(); ++i) {
        CHECK(seen[i] == i + 1);
    }
}

TEST_CASE("SegmentDownloader rejects URIs without a file name", "[segments]") {
    FakeFetchClient client;
    auto playlist = playlist_from("#EXTM3U\n#EXTINF:4,\nhttp://cdn/dir/\n");

    TempDir dir;
    SegmentDownloader downloader(client, {}, 4);
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE_FALSE(stats.has_value());
    CHECK(stats.error() == Errc::unresolvable_uri);
    CHECK(client.total_calls() == 0);
}

TEST_CASE("SegmentDownloader handles an empty playlist", "[segments]") {
    FakeFetchClient client;
    auto playlist = playlist_from("#EXTM3U\n#EXT-X-ENDLIST\n");

    TempDir dir;
    SegmentDownloader downloader(client, {});
    auto stats = downloader.download(playlist, dir.path());
    REQUIRE(stats.has_value());
    CHECK(stats->total == 0);
    CHECK(stats->completed == 0);
}
