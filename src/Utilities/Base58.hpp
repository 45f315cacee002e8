//----------------------------------------------------------------------------------------------------------------------
// File: Base58.hpp
// Description: Bitcoin alphabet Base58 encoding used for peer and content identifiers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Base58 {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t CharacterSpace = 58;
constexpr std::uint8_t InvalidCharacter = 0xff;

constexpr std::string_view Alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

[[nodiscard]] constexpr std::array<std::uint8_t, 128> GenerateDecodeMapping()
{
    std::array<std::uint8_t, 128> mapping{};
    mapping.fill(InvalidCharacter);
    for (std::size_t idx = 0; idx < Alphabet.size(); ++idx) {
        mapping[static_cast<std::size_t>(Alphabet[idx])] = static_cast<std::uint8_t>(idx);
    }
    return mapping;
}

constexpr std::array<std::uint8_t, 128> DecodeMapping = GenerateDecodeMapping();

[[nodiscard]] constexpr std::size_t EncodedSizeLimit(std::size_t size) { return ((size * 138) / 100) + 1; }
[[nodiscard]] constexpr std::size_t DecodedSizeLimit(std::size_t size) { return ((size * 733) / 1000) + 1; }

[[nodiscard]] std::string Encode(std::span<std::uint8_t const> source);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> Decode(std::string_view source);

//----------------------------------------------------------------------------------------------------------------------
} // Base58 namespace
//----------------------------------------------------------------------------------------------------------------------

inline std::string Base58::Encode(std::span<std::uint8_t const> source)
{
    // Each leading zero byte is represented by a leading '1' character.
    auto const zeros = static_cast<std::size_t>(
        std::ranges::distance(source.begin(), std::ranges::find_if(source, [] (auto byte) { return byte != 0; })));

    std::vector<std::uint8_t> digits(EncodedSizeLimit(source.size()), 0x00);
    std::size_t length = 0;

    for (auto const byte : source.subspan(zeros)) {
        std::uint32_t carry = byte;
        for (std::size_t idx = 0; idx < length; ++idx) {
            carry += static_cast<std::uint32_t>(digits[idx]) << 8;
            digits[idx] = static_cast<std::uint8_t>(carry % CharacterSpace);
            carry /= CharacterSpace;
        }

        while (carry) {
            digits[length++] = static_cast<std::uint8_t>(carry % CharacterSpace);
            carry /= CharacterSpace;
        }
    }

    std::string encoded(zeros, Alphabet.front());
    encoded.reserve(zeros + length);
    for (std::size_t idx = 0; idx < length; ++idx) {
        encoded.push_back(Alphabet[digits[length - idx - 1]]);
    }

    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::vector<std::uint8_t>> Base58::Decode(std::string_view source)
{
    auto const zeros = static_cast<std::size_t>(std::ranges::distance(
        source.begin(), std::ranges::find_if(source, [] (char c) { return c != Alphabet.front(); })));

    std::vector<std::uint8_t> bytes(DecodedSizeLimit(source.size()), 0x00);
    std::size_t length = 0;

    for (auto const character : source.substr(zeros)) {
        auto const index = static_cast<unsigned char>(character);
        if (index >= DecodeMapping.size() || DecodeMapping[index] == InvalidCharacter) { return {}; }

        std::uint32_t carry = DecodeMapping[index];
        for (std::size_t idx = 0; idx < length; ++idx) {
            carry += static_cast<std::uint32_t>(bytes[idx]) * CharacterSpace;
            bytes[idx] = static_cast<std::uint8_t>(carry & 0xff);
            carry >>= 8;
        }

        while (carry) {
            bytes[length++] = static_cast<std::uint8_t>(carry & 0xff);
            carry >>= 8;
        }
    }

    std::vector<std::uint8_t> decoded(zeros, 0x00);
    decoded.reserve(zeros + length);
    std::reverse_copy(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length), std::back_inserter(decoded));

    return decoded;
}

//----------------------------------------------------------------------------------------------------------------------
