//----------------------------------------------------------------------------------------------------------------------
// File: Identifier.hpp
// Description: Deterministic content identifiers. An identifier is the Base58 encoding of a sha2-256 multihash, the 
// same textual form as a version zero content identifier.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Content::Identifier {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint8_t HashCode = 0x12; // Note: The multihash code of sha2-256. 
constexpr std::uint8_t HashSize = 0x20;
constexpr std::size_t MultihashSize = HashSize + 2;
constexpr std::size_t EncodedSize = 46;

using Digest = std::array<std::uint8_t, HashSize>;

[[nodiscard]] std::optional<Digest> Hash(std::span<std::uint8_t const> buffer);
[[nodiscard]] std::optional<Digest> HashFile(std::filesystem::path const& path);

[[nodiscard]] std::string Encode(Digest const& digest);
[[nodiscard]] std::optional<std::string> FromBuffer(std::span<std::uint8_t const> buffer);

// Note: Only flat directories may be identified. The identifier depends on the names and the content of the entries,
// never on the location of the directory. 
[[nodiscard]] std::optional<std::string> FromDirectory(std::filesystem::path const& directory);

[[nodiscard]] bool IsValid(std::string_view identifier);

//----------------------------------------------------------------------------------------------------------------------
} // Content::Identifier namespace
//----------------------------------------------------------------------------------------------------------------------
