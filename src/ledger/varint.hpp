#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace playtime
{
    constexpr std::size_t max_varint_length = 10;

    // Zig-zag signed varint, byte-compatible with Go's binary.PutVarint.
    [[nodiscard]] std::string encode_varint(std::int64_t value);

    // Decodes the leading varint of data. Trailing bytes after the terminating
    // byte are ignored (older ledgers padded values to max_varint_length).
    // Returns nullopt for empty, truncated or overflowing input.
    [[nodiscard]] std::optional<std::int64_t> decode_varint(std::span<const std::uint8_t> data);
    [[nodiscard]] std::optional<std::int64_t> decode_varint(const std::string& data);
}
