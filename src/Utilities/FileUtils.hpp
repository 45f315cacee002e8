//----------------------------------------------------------------------------------------------------------------------
// File: FileUtils.hpp
// Description: Filesystem helpers shared by the repository, staging and artifact writers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace FileUtils {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t TransferChunkSize = 64 * 1024;

[[nodiscard]] bool CreateFolderIfNoneExist(std::filesystem::path const& path);
[[nodiscard]] std::optional<std::filesystem::path> CreateTemporaryFolder(std::string_view prefix);
[[nodiscard]] bool LinkOrCopy(std::filesystem::path const& source, std::filesystem::path const& destination);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> ReadAll(std::istream& stream);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> ReadFile(std::filesystem::path const& path);
[[nodiscard]] bool WriteFile(std::filesystem::path const& path, std::vector<std::uint8_t> const& data);
[[nodiscard]] bool WriteStream(std::filesystem::path const& path, std::istream& stream);

//----------------------------------------------------------------------------------------------------------------------
} // FileUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::CreateFolderIfNoneExist(std::filesystem::path const& path)
{
    // If the directories exist, there is nothing to do.
    std::error_code error;
    if (std::filesystem::is_directory(path, error)) { return true; }

    // Create directories in the base path that do not exist. Only the owner may access the created folders.
    if (!std::filesystem::create_directories(path, error) || error) { return false; }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::filesystem::path> FileUtils::CreateTemporaryFolder(std::string_view prefix)
{
    std::error_code error;
    auto const base = std::filesystem::temp_directory_path(error);
    if (error) { return {}; }

    std::random_device device;
    std::uniform_int_distribution<std::uint32_t> distribution;
    for (std::uint32_t attempt = 0; attempt < 16; ++attempt) {
        auto const candidate = base / (std::string{ prefix } + "-" + std::to_string(distribution(device)));
        if (std::filesystem::create_directory(candidate, error) && !error) { return candidate; }
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::LinkOrCopy(std::filesystem::path const& source, std::filesystem::path const& destination)
{
    std::error_code error;
    std::filesystem::create_hard_link(source, destination, error);
    if (!error) { return true; }

    // Note: Hard links can not span file systems, in which case the artifact is copied into the destination.
    error.clear();
    std::filesystem::copy_file(source, destination, std::filesystem::copy_options::none, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::vector<std::uint8_t>> FileUtils::ReadAll(std::istream& stream)
{
    std::vector<std::uint8_t> data;
    std::array<char, TransferChunkSize> chunk;
    while (stream.read(chunk.data(), chunk.size()) || stream.gcount() > 0) {
        data.insert(data.end(), chunk.begin(), chunk.begin() + stream.gcount());
    }

    if (stream.bad()) { return {}; }
    return data;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::vector<std::uint8_t>> FileUtils::ReadFile(std::filesystem::path const& path)
{
    std::ifstream reader(path, std::ios::binary);
    if (reader.fail()) { return {}; }
    return ReadAll(reader);
}

//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::WriteFile(std::filesystem::path const& path, std::vector<std::uint8_t> const& data)
{
    std::ofstream writer(path, std::ios::binary | std::ios::trunc);
    if (writer.fail()) { return false; }
    writer.write(reinterpret_cast<char const*>(data.data()), static_cast<std::streamsize>(data.size()));
    return writer.good();
}

//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::WriteStream(std::filesystem::path const& path, std::istream& stream)
{
    std::ofstream writer(path, std::ios::binary | std::ios::trunc);
    if (writer.fail()) { return false; }

    std::array<char, TransferChunkSize> chunk;
    while (stream.read(chunk.data(), chunk.size()) || stream.gcount() > 0) {
        writer.write(chunk.data(), stream.gcount());
        if (!writer.good()) { return false; }
    }

    return !stream.bad();
}

//----------------------------------------------------------------------------------------------------------------------
