#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    chunk testing_chunk() {
        return chunk::parse(make_wire(42, "RuSt", secret_message, secret_message_crc));
    }
}

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction") {
        SUBCASE("new chunk computes length and CRC") {
            chunk c(chunk_type::from_string("RuSt"), to_bytes(secret_message));
            CHECK(c.length() == 42);
            CHECK(c.crc() == secret_message_crc);
            CHECK(c.type() == chunk_type::from_string("RuSt"));
            CHECK(c.data() == to_bytes(secret_message));
            CHECK(c.encoded_size() == 54);
        }

        SUBCASE("text payload") {
            chunk a(chunk_type::from_string("RuSt"), secret_message);
            chunk b(chunk_type::from_string("RuSt"), to_bytes(secret_message));
            CHECK(a == b);
        }

        SUBCASE("empty payload") {
            chunk c(chunk_type::from_string("IEND"), std::vector<std::byte>{});
            CHECK(c.length() == 0);
            CHECK(c.crc() == 0xAE426082u);
            CHECK(c.data().empty());
            CHECK(c.encoded_size() == chunk::overhead);
        }

        SUBCASE("CRC covers type and payload") {
            std::vector<std::byte> payload = {std::byte(0x00), std::byte(0xFF), std::byte(0x7F)};
            chunk c(chunk_type::from_string("abCd"), payload);

            std::vector<std::byte> covered = to_bytes("abCd");
            covered.insert(covered.end(), payload.begin(), payload.end());
            CHECK(c.crc() == crc32(covered));
        }

        SUBCASE("same payload, different type, different CRC") {
            chunk a(chunk_type::from_string("RuSt"), secret_message);
            chunk b(chunk_type::from_string("RUSt"), secret_message);
            CHECK(a.crc() != b.crc());
            CHECK(a != b);
        }
    }

    TEST_CASE("chunk parsing") {
        SUBCASE("valid chunk from bytes") {
            chunk c = testing_chunk();
            CHECK(c.length() == 42);
            CHECK(c.type().to_string() == "RuSt");
            CHECK(c.data_as_string() == secret_message);
            CHECK(c.crc() == secret_message_crc);
        }

        SUBCASE("parse from raw pointer") {
            auto wire = make_wire(42, "RuSt", secret_message, secret_message_crc);
            chunk c = chunk::parse(wire.data(), wire.size());
            CHECK(c == testing_chunk());
        }

        SUBCASE("minimal chunk of exactly 12 bytes") {
            auto wire = make_wire(0, "IEND", "", 0xAE426082u);
            REQUIRE(wire.size() == 12);
            chunk c = chunk::parse(wire);
            CHECK(c.length() == 0);
            CHECK(c.type().to_string() == "IEND");
            CHECK(c.data().empty());
        }

        SUBCASE("wrong CRC is rejected") {
            auto wire = make_wire(42, "RuSt", secret_message, secret_message_crc - 1);
            CHECK_THROWS_AS(chunk::parse(wire), checksum_mismatch_error);
        }

        SUBCASE("binary payload") {
            std::vector<std::byte> payload;
            for (int i = 0; i < 256; i++) {
                payload.push_back(static_cast<std::byte>(i));
            }
            chunk original(chunk_type::from_string("biNa"), payload);
            chunk parsed = chunk::parse(original.serialize());
            CHECK(parsed.data() == payload);
        }
    }

    TEST_CASE("chunk serialization") {
        SUBCASE("wire layout") {
            chunk c(chunk_type::from_string("RuSt"), to_bytes(secret_message));
            CHECK(c.serialize() == make_wire(42, "RuSt", secret_message, secret_message_crc));
        }

        SUBCASE("length and CRC are big-endian") {
            chunk c(chunk_type::from_string("IEND"), std::vector<std::byte>{});
            std::vector<std::byte> expected = {
                std::byte(0x00), std::byte(0x00), std::byte(0x00), std::byte(0x00),
                std::byte('I'), std::byte('E'), std::byte('N'), std::byte('D'),
                std::byte(0xAE), std::byte(0x42), std::byte(0x60), std::byte(0x82)
            };
            CHECK(c.serialize() == expected);
        }

        SUBCASE("serialize_to appends") {
            chunk a(chunk_type::from_string("IHDR"), "header");
            chunk b(chunk_type::from_string("IEND"), std::vector<std::byte>{});

            std::vector<std::byte> out = to_bytes("prefix");
            a.serialize_to(out);
            b.serialize_to(out);

            CHECK(out.size() == 6 + a.encoded_size() + b.encoded_size());

            std::vector<std::byte> a_wire = a.serialize();
            CHECK(std::equal(a_wire.begin(), a_wire.end(), out.begin() + 6));
        }

        SUBCASE("round trip through parse") {
            for (std::string_view text : {"", "x", "hello", "This is where your secret message will be!"}) {
                chunk original(chunk_type::from_string("teSt"), text);
                chunk parsed = chunk::parse(original.serialize());
                CHECK(parsed == original);
                CHECK(parsed.length() == original.length());
                CHECK(parsed.type() == original.type());
                CHECK(parsed.crc() == original.crc());
                CHECK(parsed.data() == original.data());
            }
        }

        SUBCASE("serialize of a parsed chunk reproduces the input") {
            auto wire = make_wire(42, "RuSt", secret_message, secret_message_crc);
            CHECK(chunk::parse(wire).serialize() == wire);
        }
    }

    TEST_CASE("chunk tamper detection") {
        chunk original(chunk_type::from_string("RuSt"), to_bytes(secret_message));
        const std::vector<std::byte> wire = original.serialize();

        // Every single-bit flip after the length field is detected
        for (std::size_t i = 4; i < wire.size(); i++) {
            for (int bit = 0; bit < 8; bit++) {
                std::vector<std::byte> damaged = wire;
                damaged[i] ^= static_cast<std::byte>(1 << bit);

                const bool in_type = i < 8;
                const auto b = std::to_integer<std::uint8_t>(damaged[i]);
                const bool still_letter = chunk_type::is_letter(b);

                INFO("byte " << i << " bit " << bit);
                try {
                    (void)chunk::parse(damaged);
                    FAIL("Damaged chunk accepted");
                } catch (const checksum_mismatch_error& e) {
                    CHECK((!in_type || still_letter));
                    CHECK(e.found() != e.expected());
                } catch (const invalid_tag_byte_error& e) {
                    CHECK(in_type);
                    CHECK_FALSE(still_letter);
                    CHECK(e.position() == i - 4);
                }
            }
        }
    }
}
