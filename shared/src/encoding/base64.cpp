#include "chunkdrive/encoding/base64.hpp"

#include <array>
#include <cstdint>

namespace chunkdrive::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr std::int8_t kInvalid = -1;

        constexpr std::array<std::int8_t, 256> make_reverse_table()
        {
            std::array<std::int8_t, 256> table{};
            for (auto &entry : table)
            {
                entry = kInvalid;
            }
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            return table;
        }

        constexpr auto kReverse = make_reverse_table();

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3)
        {
            const auto triple = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                                (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                                std::to_integer<std::uint32_t>(data[i + 2]);
            output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
            output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
            output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
            output.push_back(kAlphabet[triple & 0x3F]);
        }

        const auto rest = data.size() - i;
        if (rest == 1)
        {
            const auto triple = std::to_integer<std::uint32_t>(data[i]) << 16;
            output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
            output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
            output.append("==");
        }
        else if (rest == 2)
        {
            const auto triple = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                                (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
            output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
            output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
            output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
            output.push_back('=');
        }
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        while (!input.empty() && input.back() == '=')
        {
            input.remove_suffix(1);
        }
        if (input.size() % 4 == 1)
        {
            return std::nullopt;
        }

        std::vector<std::byte> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits = 0;
        for (const char ch : input)
        {
            const auto value = kReverse[static_cast<unsigned char>(ch)];
            if (value == kInvalid)
            {
                return std::nullopt;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits += 6;
            if (bits >= 8)
            {
                bits -= 8;
                output.push_back(static_cast<std::byte>((accumulator >> bits) & 0xFFu));
            }
        }
        return output;
    }

} // namespace chunkdrive::encoding
