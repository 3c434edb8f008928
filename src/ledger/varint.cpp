#include "varint.hpp"

namespace playtime
{
    namespace
    {
        [[nodiscard]] std::optional<std::uint64_t> decode_uvarint(std::span<const std::uint8_t> data)
        {
            std::uint64_t value = 0;
            unsigned shift = 0;

            for (std::size_t i = 0; i < data.size(); ++i)
            {
                if (i == max_varint_length)
                {
                    return std::nullopt;
                }

                const std::uint8_t byte = data[i];
                if (byte < 0x80)
                {
                    // The tenth byte may only carry the top bit of the value.
                    if (i == max_varint_length - 1 && byte > 1)
                    {
                        return std::nullopt;
                    }
                    return value | (static_cast<std::uint64_t>(byte) << shift);
                }

                value |= static_cast<std::uint64_t>(byte & 0x7f) << shift;
                shift += 7;
            }

            return std::nullopt;
        }
    }

    std::string encode_varint(std::int64_t value)
    {
        auto zigzag = static_cast<std::uint64_t>(value) << 1;
        if (value < 0)
        {
            zigzag = ~zigzag;
        }

        std::string output;
        output.reserve(max_varint_length);
        while (zigzag >= 0x80)
        {
            output.push_back(static_cast<char>((zigzag & 0x7f) | 0x80));
            zigzag >>= 7;
        }
        output.push_back(static_cast<char>(zigzag));
        return output;
    }

    std::optional<std::int64_t> decode_varint(std::span<const std::uint8_t> data)
    {
        const auto raw = decode_uvarint(data);
        if (!raw)
        {
            return std::nullopt;
        }

        auto value = static_cast<std::int64_t>(*raw >> 1);
        if ((*raw & 1) != 0)
        {
            value = ~value;
        }
        return value;
    }

    std::optional<std::int64_t> decode_varint(const std::string& data)
    {
        return decode_varint(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
    }
}
