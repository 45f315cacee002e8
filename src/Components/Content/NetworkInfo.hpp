//----------------------------------------------------------------------------------------------------------------------
// File: NetworkInfo.hpp
// Description: The startup artifacts of a published network. The manifest and genesis are buffered, the image is kept 
// as an open stream as it may be large.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Content {
//----------------------------------------------------------------------------------------------------------------------

class NetworkInfo;

//----------------------------------------------------------------------------------------------------------------------
namespace Artifact {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Manifest = "manifest";
constexpr std::string_view Genesis = "genesis";
constexpr std::string_view Image = "image";

constexpr std::array<std::string_view, 3> All = { Manifest, Genesis, Image };

//----------------------------------------------------------------------------------------------------------------------
} // Artifact namespace
} // Content namespace
//----------------------------------------------------------------------------------------------------------------------

class Content::NetworkInfo final
{
public:
    using Buffer = std::vector<std::uint8_t>;

    NetworkInfo(Buffer&& manifest, Buffer&& genesis, std::unique_ptr<std::istream>&& upImage);

    NetworkInfo(NetworkInfo&& other) = default;
    NetworkInfo& operator=(NetworkInfo&& other) = default;
    NetworkInfo(NetworkInfo const& other) = delete;
    NetworkInfo& operator=(NetworkInfo const& other) = delete;

    [[nodiscard]] Buffer const& GetManifest() const;
    [[nodiscard]] Buffer const& GetGenesis() const;
    [[nodiscard]] std::istream& GetImage();

    [[nodiscard]] bool WriteManifest(std::filesystem::path const& path) const;
    [[nodiscard]] bool WriteGenesis(std::filesystem::path const& path) const;

    // Note: The image stream is consumed by the write. 
    [[nodiscard]] bool WriteImage(std::filesystem::path const& path);

private:
    Buffer m_manifest;
    Buffer m_genesis;
    std::unique_ptr<std::istream> m_upImage;
};

//----------------------------------------------------------------------------------------------------------------------
