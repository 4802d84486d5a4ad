/**
 * @file chunk_dump.cpp
 * @brief Builds a few chunks, walks their encoding and prints each field
 *
 * Shows construction, serialization, parsing of consecutive chunks with
 * a warning handler, and how each kind of damage is reported.
 */

#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

namespace {
    void print_chunk(const pngchunk::chunk& c, std::size_t offset) {
        const auto& type = c.type();

        std::cout << "Chunk " << type << " at offset " << offset << "\n";
        std::cout << "  length:   " << c.length() << "\n";
        std::cout << "  crc:      0x" << std::hex << std::setfill('0') << std::setw(8)
                  << c.crc() << std::dec << std::setfill(' ') << "\n";
        std::cout << "  critical: " << (type.is_critical() ? "yes" : "no")
                  << ", public: " << (type.is_public() ? "yes" : "no")
                  << ", reserved bit valid: " << (type.is_reserved_bit_valid() ? "yes" : "no")
                  << ", safe to copy: " << (type.is_safe_to_copy() ? "yes" : "no") << "\n";

        try {
            const std::string text = c.data_as_string();
            std::cout << "  text:     \"" << text << "\"\n";
        } catch (const pngchunk::invalid_utf8_error& e) {
            std::cout << "  binary payload (" << e.what() << ")\n";
        }
    }

    void try_parse(const std::string& label, const std::vector<std::byte>& wire) {
        try {
            auto c = pngchunk::chunk::parse(wire);
            std::cout << label << ": parsed " << c.type() << "\n";
        } catch (const pngchunk::chunk_error& e) {
            std::cout << label << ": " << pngchunk::to_string(e.kind()) << " - " << e.what() << "\n";
        }
    }
}

int main() {
    using pngchunk::chunk;
    using pngchunk::chunk_type;

    std::vector<std::byte> buffer;
    chunk(chunk_type::from_string("RuSt"), "This is where your secret message will be!").serialize_to(buffer);
    chunk(chunk_type::from_string("biNa"),
          std::vector<std::byte>{std::byte(0xDE), std::byte(0xAD), std::byte(0xBE), std::byte(0xEF)})
        .serialize_to(buffer);
    chunk(chunk_type::from_string("prvt"), "reserved bit set").serialize_to(buffer);
    chunk(chunk_type::from_string("IEND"), std::vector<std::byte>{}).serialize_to(buffer);

    pngchunk::parse_options options;
    std::size_t base = 0;
    options.on_warning = [&base](std::uint64_t offset,
                                 std::string_view category,
                                 std::string_view message) {
        std::cerr << "Warning at offset " << base + offset
                  << " [" << category << "]: " << message << "\n";
    };

    std::cout << "Buffer of " << buffer.size() << " bytes\n\n";

    try {
        while (base < buffer.size()) {
            auto parsed = chunk::parse_prefix(buffer.data() + base, buffer.size() - base, options);
            print_chunk(parsed.value, base);
            base += parsed.consumed;
        }
    } catch (const pngchunk::chunk_error& e) {
        std::cerr << "Error at offset " << base << ": " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nDamage detection\n";
    std::vector<std::byte> first(buffer.begin(), buffer.begin() + 54);

    auto flipped = first;
    flipped[20] ^= std::byte(0x01);
    try_parse("  payload bit flipped", flipped);

    auto bad_type = first;
    bad_type[5] = std::byte('1');
    try_parse("  type byte replaced ", bad_type);

    auto truncated = first;
    truncated.resize(40);
    try_parse("  truncated          ", truncated);

    return 0;
}
