#include <doctest/doctest.h>
#include <pngchunk/crc32.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("CRC32") {
    TEST_CASE("crc32 known values") {
        SUBCASE("check value") {
            const std::string s = "123456789";
            CHECK(crc32(s.data(), s.size()) == 0xCBF43926u);
        }

        SUBCASE("empty input") {
            CHECK(crc32(nullptr, 0) == 0u);
            CHECK(crc32(std::vector<std::byte>{}) == 0u);
        }

        SUBCASE("PNG IEND chunk") {
            CHECK(crc32(to_bytes("IEND")) == 0xAE426082u);
        }

        SUBCASE("PNG IHDR chunk of a 1x1 RGBA image") {
            std::vector<std::byte> data = to_bytes("IHDR");
            append_be32(data, 1);   // width
            append_be32(data, 1);   // height
            for (int v : {8, 6, 0, 0, 0}) {
                data.push_back(static_cast<std::byte>(v));
            }
            CHECK(crc32(data) == 0x1F15C489u);
        }

        SUBCASE("pangram") {
            CHECK(crc32(to_bytes("The quick brown fox jumps over the lazy dog")) == 0x414FA339u);
        }
    }

    TEST_CASE("crc32 incremental update") {
        const std::string type = "RuSt";
        const std::string message(secret_message);
        const std::string whole = type + message;

        std::uint32_t incremental = crc32(type.data(), type.size());
        incremental = crc32_update(incremental, message.data(), message.size());

        CHECK(incremental == crc32(whole.data(), whole.size()));
        CHECK(incremental == secret_message_crc);

        SUBCASE("byte by byte") {
            std::uint32_t crc = 0;
            for (char c : whole) {
                crc = crc32_update(crc, &c, 1);
            }
            CHECK(crc == secret_message_crc);
        }

        SUBCASE("empty update is identity") {
            CHECK(crc32_update(incremental, nullptr, 0) == incremental);
        }
    }
}
