#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <set>
#include <string>

#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("Error kinds") {
    SUBCASE("names are stable and distinct") {
        const error_kind kinds[] = {
            error_kind::invalid_tag_byte, error_kind::wrong_tag_length,
            error_kind::too_short, error_kind::checksum_mismatch,
            error_kind::payload_too_large, error_kind::invalid_utf8,
            error_kind::limit_exceeded, error_kind::trailing_data
        };

        std::set<std::string_view> names;
        for (auto k : kinds) {
            names.insert(to_string(k));
        }
        CHECK(names.size() == 8);
        CHECK(to_string(error_kind::checksum_mismatch) == "checksum_mismatch");
        CHECK(to_string(error_kind::too_short) == "too_short");
    }

    SUBCASE("callers can branch on the kind of a base reference") {
        auto classify = [](const std::vector<std::byte>& wire) {
            try {
                (void)chunk::parse(wire);
                return std::string("ok");
            } catch (const chunk_error& e) {
                return std::string(to_string(e.kind()));
            }
        };

        CHECK(classify(make_wire(42, "RuSt", secret_message, secret_message_crc)) == "ok");
        CHECK(classify(make_wire(42, "RuSt", secret_message, 1)) == "checksum_mismatch");
        CHECK(classify(make_wire(42, "R8St", secret_message, secret_message_crc)) == "invalid_tag_byte");
        CHECK(classify(make_wire(43, "RuSt", secret_message, secret_message_crc)) == "too_short");
        CHECK(classify(to_bytes("short")) == "too_short");
    }

    SUBCASE("payload_too_large_error carries the size") {
        payload_too_large_error e(std::uint64_t(1) << 32, "too large");
        CHECK(e.size() == (std::uint64_t(1) << 32));
        CHECK(e.kind() == error_kind::payload_too_large);
        CHECK(std::string(e.what()) == "too large");
    }
}

TEST_CASE("Payload length field") {
    SUBCASE("sizes that fit are passed through") {
        CHECK(checked_length(0) == 0);
        CHECK(checked_length(42) == 42);
        CHECK(checked_length(0xFFFFFFFFu) == 0xFFFFFFFFu);
    }

    SUBCASE("one past the 32-bit range is rejected") {
        if constexpr (sizeof(std::size_t) > 4) {
            const std::size_t too_big = static_cast<std::size_t>(0xFFFFFFFFu) + 1;
            try {
                (void)checked_length(too_big);
                FAIL("Should have thrown exception");
            } catch (const payload_too_large_error& e) {
                CHECK(e.size() == (std::uint64_t(1) << 32));
                CHECK(e.kind() == error_kind::payload_too_large);
                std::string msg = e.what();
                CHECK(msg.find("4294967296") != std::string::npos);
            }
        }
    }
}
