//
// Container walker: eager and lazy traversal, end of walk, truncation
//

#include <doctest/doctest.h>
#include <riffle/container_walker.hh>
#include <riffle/exceptions.hh>

#include <sstream>
#include <vector>

#include "test_utils.hh"

using namespace riffle;

namespace {
    void check_contiguous(const walk_result& result) {
        const auto& fd = result.format;
        std::uint64_t expected_start = result.metadata.data_offset;
        for (const auto& c : result.chunks) {
            CHECK(c.start_offset == expected_start);
            auto span = c.end_offset - c.start_offset - fd.field_width();
            CHECK(span % fd.alignment == 0);
            expected_start = c.end_offset;
        }
    }
}

TEST_SUITE("CONTAINER_WALKER") {
    TEST_CASE("minimal WAVE") {
        auto src = byte_builder{}.text("RIFF").u32le(36).text("WAVE")
                                 .text("fmt ").u32le(4).text("DATA").source();
        auto result = read_container(*src);

        CHECK(result.metadata.family == container_family::riff);
        CHECK(result.metadata.order == byte_order::little);
        CHECK(result.metadata.form_type == "WAVE");
        CHECK(result.metadata.declared_size == 36);

        REQUIRE(result.chunks.size() == 1);
        const auto& c = result.chunks[0];
        CHECK(c.identifier == "fmt ");
        CHECK(to_text(c.payload) == "DATA");
        CHECK(c.start_offset == 12);
        CHECK(c.end_offset == 20);

        // 36 declared bytes but only 12 present after the form type
        CHECK(result.truncated());
    }

    TEST_CASE("complete WAVE walks clean") {
        auto src = make_wave().source();
        auto result = read_container(*src);

        CHECK(result.status == walk_status::clean);
        CHECK_FALSE(result.truncated());
        REQUIRE(result.chunks.size() == 3);
        CHECK(result.chunks[0].identifier == "fmt ");
        CHECK(result.chunks[1].identifier == "note");
        CHECK(result.chunks[2].identifier == "data");
        CHECK(to_text(result.chunks[2].payload) == "PCMDATA!");
        check_contiguous(result);
    }

    TEST_CASE("odd payload shifts the next chunk by one byte") {
        auto src = make_wave().source();
        auto result = read_container(*src);
        REQUIRE(result.chunks.size() == 3);

        const auto& note = result.chunks[1];
        const auto& data = result.chunks[2];
        CHECK(note.payload_size() == 3);
        CHECK(data.start_offset == note.start_offset + 8 + 3 + 1);
    }

    TEST_CASE("declared size bounds the scan") {
        // Trailing bytes after the declared end are not chunks
        byte_builder chunks;
        chunks.riff_chunk("aaaa", "12");
        byte_builder data;
        data.text("RIFF").u32le(static_cast<std::uint32_t>(4 + chunks.size())).text("TEST");
        data.bytes.insert(data.bytes.end(), chunks.bytes.begin(), chunks.bytes.end());
        data.riff_chunk("xtra", "zz");

        auto src = data.source();
        auto result = read_container(*src);
        CHECK(result.status == walk_status::clean);
        REQUIRE(result.chunks.size() == 1);
        CHECK(result.chunks[0].identifier == "aaaa");
    }

    TEST_CASE("empty container") {
        auto src = byte_builder{}.text("FORM").u32be(4).text("AIFF").source();
        auto result = read_container(*src);
        CHECK(result.status == walk_status::clean);
        CHECK(result.chunks.empty());
    }

    TEST_CASE("oversized chunk truncates the walk") {
        byte_builder data;
        data.text("RIFF").u32le(100).text("WAVE")
            .riff_chunk("fmt ", "abcd")
            .text("data").u32le(1000).text("only a little");
        auto src = data.source();

        auto result = read_container(*src);
        CHECK(result.truncated());
        REQUIRE(result.chunks.size() == 1);
        CHECK(result.chunks[0].identifier == "fmt ");
        CHECK(to_text(result.chunks[0].payload) == "abcd");
    }

    TEST_CASE("truncation inside the first chunk header") {
        auto src = byte_builder{}.text("RIFF").u32le(20).text("WAVE").text("fm").source();
        auto result = read_container(*src);
        CHECK(result.truncated());
        CHECK(result.chunks.empty());
    }

    TEST_CASE("lazy walk") {
        auto src = make_wave().source();
        container_walker walker(*src);

        CHECK(walker.metadata().form_type == "WAVE");
        CHECK(walker.status() == walk_status::scanning);

        auto first = walker.next();
        REQUIRE(first.has_value());
        CHECK(first->identifier == "fmt ");
        CHECK_FALSE(walker.done());

        // The walker re-seeks to its own position every time
        src->seek(0);
        auto second = walker.next();
        REQUIRE(second.has_value());
        CHECK(second->identifier == "note");

        auto rest = walker.collect();
        REQUIRE(rest.chunks.size() == 1);
        CHECK(rest.chunks[0].identifier == "data");
        CHECK(rest.status == walk_status::clean);

        CHECK(walker.done());
        CHECK_FALSE(walker.next().has_value());
        CHECK_FALSE(walker.next().has_value());
    }

    TEST_CASE("lazy and eager walks agree") {
        auto bytes = make_wave();

        auto eager_src = bytes.source();
        auto eager = read_container(*eager_src);

        auto lazy_src = bytes.source();
        container_walker walker(*lazy_src);
        std::vector<chunk> lazy;
        for (const auto& c : walker) {
            lazy.push_back(c);
        }

        REQUIRE(lazy.size() == eager.chunks.size());
        for (std::size_t i = 0; i < lazy.size(); i++) {
            CHECK(lazy[i].identifier == eager.chunks[i].identifier);
            CHECK(lazy[i].start_offset == eager.chunks[i].start_offset);
            CHECK(lazy[i].end_offset == eager.chunks[i].end_offset);
            CHECK(lazy[i].payload == eager.chunks[i].payload);
        }
        CHECK(walker.status() == eager.status);
    }

    TEST_CASE("fresh walk over the same source") {
        auto src = make_wave().source();
        {
            container_walker walker(*src);
            walker.next();
        }
        auto result = read_container(*src);
        CHECK(result.chunks.size() == 3);
        CHECK(result.status == walk_status::clean);
    }

    TEST_CASE("embedded container") {
        byte_builder data;
        data.text("junk junk ");
        auto wave = make_wave();
        data.bytes.insert(data.bytes.end(), wave.bytes.begin(), wave.bytes.end());
        auto src = data.source();

        auto result = read_container(*src, parse_options{}, 10);
        CHECK(result.metadata.start_offset == 10);
        CHECK(result.status == walk_status::clean);
        REQUIRE(result.chunks.size() == 3);
        CHECK(result.chunks[0].start_offset == 22);
        check_contiguous(result);
    }

    TEST_CASE("chunks outlive their source") {
        std::vector<chunk> kept;
        {
            auto src = make_wave().source();
            kept = read_container(*src).chunks;
        }
        REQUIRE(kept.size() == 3);
        CHECK(to_text(kept[2].payload) == "PCMDATA!");
    }

    TEST_CASE("all backends produce the same walk") {
        auto bytes = make_wave();
        auto expected = [&] {
            auto src = bytes.source();
            return read_container(*src);
        }();

        auto compare = [&](source& src) {
            auto result = read_container(src);
            REQUIRE(result.chunks.size() == expected.chunks.size());
            for (std::size_t i = 0; i < result.chunks.size(); i++) {
                CHECK(result.chunks[i].identifier == expected.chunks[i].identifier);
                CHECK(result.chunks[i].payload == expected.chunks[i].payload);
                CHECK(result.chunks[i].end_offset == expected.chunks[i].end_offset);
            }
            CHECK(result.status == expected.status);
        };

        SUBCASE("stream") {
            std::istringstream stream(bytes.str());
            stream_source src(stream);
            compare(src);
        }

        SUBCASE("file") {
            auto path = write_scratch_file("walker_wave.wav", bytes.bytes);
            auto src = source::open(path);
            compare(*src);
        }

        SUBCASE("mapped") {
            auto path = write_scratch_file("walker_wave_mmap.wav", bytes.bytes);
            auto src = source::open(path, true);
            compare(*src);
        }
    }

    TEST_CASE("fatal errors leave the walker failed") {
        byte_builder data;
        data.text("RIFF").u32le(100).text("WAVE").riff_chunk("big ", std::string(40, 'x'));
        auto src = data.source();

        parse_options opts;
        opts.max_chunk_size = 16;
        container_walker walker(*src, opts);
        CHECK_THROWS_AS(walker.next(), parse_error);
        CHECK(walker.status() == walk_status::failed);
        CHECK_FALSE(walker.next().has_value());
    }

    TEST_CASE("unknown container fails on construction") {
        auto src = byte_builder{}.text("OggS").fill(32).source();
        CHECK_THROWS_AS(container_walker{*src}, invalid_container_error);
        src->reset();
        CHECK_THROWS_AS(read_container(*src), invalid_container_error);
    }
}
