#include <doctest/doctest.h>
#include <riffle/guid.hh>

#include <algorithm>
#include <cctype>

using namespace riffle;

TEST_SUITE("GUID") {
    TEST_CASE("Wave64 GUIDs render in canonical form") {
        CHECK(w64::riff.to_string() == "66666972-912E-11CF-A5D6-28DB04C10000");
        CHECK(w64::wave.to_string() == "65766177-ACF3-11D3-8CD1-00C04F8EDB8A");
        CHECK(w64::fmt.to_string() == "20746D66-ACF3-11D3-8CD1-00C04F8EDB8A");
        CHECK(w64::data.to_string() == "61746164-ACF3-11D3-8CD1-00C04F8EDB8A");
    }

    TEST_CASE("GUID text is uppercase and hyphenated") {
        guid g;
        for (std::size_t i = 0; i < g.bytes.size(); i++) {
            g.bytes[i] = static_cast<std::uint8_t>(0xA0 + i);
        }
        auto text = g.to_string();

        REQUIRE(text.size() == 36);
        CHECK(text[8] == '-');
        CHECK(text[13] == '-');
        CHECK(text[18] == '-');
        CHECK(text[23] == '-');
        CHECK(std::none_of(text.begin(), text.end(), [](char c) {
            return std::islower(static_cast<unsigned char>(c));
        }));

        // First three groups are little-endian on disk
        CHECK(text == "A3A2A1A0-A5A4-A7A6-A8A9-AAABACADAEAF");
    }

    TEST_CASE("GUID from_bytes and prefix") {
        const std::uint8_t raw[16] = {0x66, 0x6D, 0x74, 0x20, 0xF3, 0xAC, 0xD3, 0x11,
                                      0x8C, 0xD1, 0x00, 0xC0, 0x4F, 0x8E, 0xDB, 0x8A};
        auto g = guid::from_bytes(raw);

        CHECK(g == w64::fmt);
        CHECK(g != w64::data);
        CHECK(g.prefix() == "fmt "_4cc);
        CHECK(w64::riff.prefix() == "riff"_4cc);
    }

    TEST_CASE("zero GUID") {
        guid g;
        CHECK(g.to_string() == "00000000-0000-0000-0000-000000000000");
    }
}
