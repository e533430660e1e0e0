//
// Source backends: contract shared by memory, stream, file and mapped sources
//

#include <doctest/doctest.h>
#include <riffle/source.hh>
#include <riffle/exceptions.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace riffle;

namespace {
    const std::string digits = "0123456789";

    std::string read_text(source& src, std::size_t n) {
        std::string out(n, '\0');
        out.resize(src.read(out.data(), n));
        return out;
    }

    // Every backend must pass this unchanged
    void check_source_contract(source& src) {
        REQUIRE(src.size() == 10);
        CHECK(src.tell() == 0);

        CHECK(read_text(src, 4) == "0123");
        CHECK(src.tell() == 4);
        CHECK(src.remaining() == 6);

        // Negative relative seek
        src.seek(-2, source::cur);
        CHECK(src.tell() == 2);
        CHECK(read_text(src, 2) == "23");

        // Seeking before the start clamps to 0
        src.seek(-100, source::cur);
        CHECK(src.tell() == 0);
        src.seek(-1, source::set);
        CHECK(src.tell() == 0);

        // From the end
        src.seek(-3, source::end);
        CHECK(src.tell() == 7);
        CHECK(read_text(src, 10) == "789");
        CHECK(src.tell() == 10);
        CHECK(read_text(src, 1).empty());

        // Past the end is allowed, reads come back empty
        src.seek(20, source::set);
        CHECK(src.tell() == 20);
        CHECK(src.remaining() == 0);
        CHECK(read_text(src, 4).empty());
        CHECK(src.tell() == 20);

        // Random reads leave the cursor alone
        src.seek(1, source::set);
        char buf[3] = {};
        CHECK(src.read_at(5, buf, 3) == 3);
        CHECK(std::string(buf, 3) == "567");
        CHECK(src.tell() == 1);
        CHECK(src.read_at(8, buf, 3) == 2);
        CHECK(src.read_at(10, buf, 3) == 0);
        CHECK(src.tell() == 1);

        src.reset();
        CHECK(src.tell() == 0);
        CHECK(src.read<std::uint16_t>(byte_order::little) == 0x3130);
        CHECK(src.read<std::uint16_t>(byte_order::big) == 0x3233);
        CHECK(src.read_fourcc() == "4567"_4cc);

        CHECK(to_text(src.read_bytes(10)) == "89");
        CHECK(to_text(src.read_bytes_at(3, 2)) == "34");
        CHECK(src.read_bytes_at(12, 2).empty());
    }

    std::vector<std::byte> digit_bytes() {
        return byte_builder{}.text(digits).bytes;
    }
}

TEST_SUITE("SOURCE") {
    TEST_CASE("memory source") {
        auto src = source::open(digit_bytes());
        CHECK(dynamic_cast<memory_source*>(src.get()) != nullptr);
        check_source_contract(*src);
    }

    TEST_CASE("memory source copied from a raw buffer") {
        auto src = source::open(digits.data(), digits.size());
        check_source_contract(*src);
    }

    TEST_CASE("stream source") {
        std::istringstream stream(digits);
        auto src = source::open(stream);
        CHECK(dynamic_cast<stream_source*>(src.get()) != nullptr);
        check_source_contract(*src);
    }

    TEST_CASE("stream source keeps its own cursor") {
        std::istringstream stream(digits);
        stream_source src(stream);

        CHECK(read_text(src, 3) == "012");
        stream.seekg(8);
        CHECK(read_text(src, 3) == "345");
    }

    TEST_CASE("file source") {
        auto path = write_scratch_file("source_digits.bin", digit_bytes());
        auto src = source::open(path);
        auto* file = dynamic_cast<file_source*>(src.get());
        REQUIRE(file != nullptr);
        CHECK(file->path() == path);
        check_source_contract(*src);
    }

    TEST_CASE("mapped source") {
        auto path = write_scratch_file("source_digits_mmap.bin", digit_bytes());
        auto src = source::open(path, true);
        CHECK(dynamic_cast<mapped_source*>(src.get()) != nullptr);
        check_source_contract(*src);
    }

    TEST_CASE("independent mapped sources over one file") {
        auto path = write_scratch_file("source_shared.bin", digit_bytes());
        mapped_source a(path);
        mapped_source b(path);

        a.seek(6);
        CHECK(read_text(b, 2) == "01");
        CHECK(read_text(a, 2) == "67");
        CHECK(b.tell() == 2);
    }

    TEST_CASE("empty sources") {
        SUBCASE("memory") {
            auto src = source::open(std::vector<std::byte>{});
            CHECK(src->size() == 0);
            CHECK(read_text(*src, 4).empty());
        }

        SUBCASE("mapped empty file") {
            auto path = write_scratch_file("source_empty.bin", {});
            mapped_source src(path);
            CHECK(src.size() == 0);
            CHECK(read_text(src, 4).empty());
        }
    }

    TEST_CASE("read_exact and typed reads throw at end of source") {
        auto src = source::open(digit_bytes());
        src->seek(8);
        CHECK_THROWS_AS(src->read_exact(3), end_of_source_error);
        CHECK(src->tell() == 8);

        src->seek(8);
        CHECK_THROWS_AS(src->read<std::uint32_t>(byte_order::little), end_of_source_error);

        src->seek(7);
        CHECK_THROWS_AS(src->read_fourcc(), end_of_source_error);
    }

    TEST_CASE("source normalization") {
        SUBCASE("existing source passes through") {
            auto original = source::open(digit_bytes());
            auto* raw = original.get();
            auto same = source::open(std::move(original));
            CHECK(same.get() == raw);
        }

        SUBCASE("null source") {
            CHECK_THROWS_AS(source::open(std::unique_ptr<source>{}), io_error);
        }

        SUBCASE("missing path") {
            auto missing = std::filesystem::path(UNITTEST_PATH_TO_SCRATCH_FILES) / "does_not_exist.bin";
            CHECK_THROWS_AS(source::open(missing), io_error);
            CHECK_THROWS_AS(source::open(missing, true), io_error);
            CHECK_THROWS_AS(mapped_source{missing}, io_error);
            CHECK_THROWS_AS(file_source{missing}, io_error);
        }

        SUBCASE("directory is not a source") {
            CHECK_THROWS_AS(source::open(std::filesystem::path(UNITTEST_PATH_TO_SCRATCH_FILES)), io_error);
        }

        SUBCASE("io_error is a riffle_error") {
            auto missing = std::filesystem::path(UNITTEST_PATH_TO_SCRATCH_FILES) / "missing_too.bin";
            CHECK_THROWS_AS(source::open(missing), riffle_error);
        }
    }
}
