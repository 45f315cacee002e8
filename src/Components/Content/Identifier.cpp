//----------------------------------------------------------------------------------------------------------------------
// File: Identifier.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Identifier.hpp"
#include "Utilities/Base58.hpp"
#include "Utilities/FileUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <fstream>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr std::string_view DirectoryTag = "chainkit/directory";

[[nodiscard]] DigestContext CreateContext();
[[nodiscard]] bool Update(DigestContext const& upContext, std::span<std::uint8_t const> buffer);
[[nodiscard]] bool Update(DigestContext const& upContext, std::string_view text);
[[nodiscard]] std::optional<Content::Identifier::Digest> Finalize(DigestContext const& upContext);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Content::Identifier::Digest> Content::Identifier::Hash(std::span<std::uint8_t const> buffer)
{
    auto const upContext = local::CreateContext();
    if (!upContext || !local::Update(upContext, buffer)) { return {}; }
    return local::Finalize(upContext);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Content::Identifier::Digest> Content::Identifier::HashFile(std::filesystem::path const& path)
{
    std::ifstream reader(path, std::ios::binary);
    if (reader.fail()) { return {}; }

    auto const upContext = local::CreateContext();
    if (!upContext) { return {}; }

    // Files are hashed in chunks, published artifacts (e.g. container images) may be large. 
    std::vector<char> chunk(FileUtils::TransferChunkSize);
    while (reader.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || reader.gcount() > 0) {
        auto const size = static_cast<std::size_t>(reader.gcount());
        if (!local::Update(upContext, { reinterpret_cast<std::uint8_t const*>(chunk.data()), size })) { return {}; }
    }

    if (reader.bad()) { return {}; }
    return local::Finalize(upContext);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Content::Identifier::Encode(Digest const& digest)
{
    std::array<std::uint8_t, MultihashSize> multihash{ HashCode, HashSize };
    std::ranges::copy(digest, multihash.begin() + 2);
    return Base58::Encode(multihash);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Content::Identifier::FromBuffer(std::span<std::uint8_t const> buffer)
{
    auto const optDigest = Hash(buffer);
    if (!optDigest) { return {}; }
    return Encode(*optDigest);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Content::Identifier::FromDirectory(std::filesystem::path const& directory)
{
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) { return {}; }

    std::vector<std::pair<std::string, Digest>> entries;
    for (auto const& entry : std::filesystem::directory_iterator(directory, error)) {
        if (!entry.is_regular_file(error)) { return {}; }
        auto const optDigest = HashFile(entry.path());
        if (!optDigest) { return {}; }
        entries.emplace_back(entry.path().filename().string(), *optDigest);
    }
    if (error) { return {}; }

    // Directory iteration order is unspecified, the entries are sorted by name to produce a stable identifier. 
    std::ranges::sort(entries, {}, &std::pair<std::string, Digest>::first);

    auto const upContext = local::CreateContext();
    if (!upContext || !local::Update(upContext, local::DirectoryTag)) { return {}; }
    for (auto const& [name, digest] : entries) {
        // Note: The name is written with its terminator such that entry boundaries are unambiguous. 
        if (!local::Update(upContext, std::string_view{ name.c_str(), name.size() + 1 })) { return {}; }
        if (!local::Update(upContext, digest)) { return {}; }
    }

    auto const optDigest = local::Finalize(upContext);
    if (!optDigest) { return {}; }
    return Encode(*optDigest);
}

//----------------------------------------------------------------------------------------------------------------------

bool Content::Identifier::IsValid(std::string_view identifier)
{
    if (identifier.size() != EncodedSize) { return false; }
    auto const optDecoded = Base58::Decode(identifier);
    if (!optDecoded || optDecoded->size() != MultihashSize) { return false; }
    return (*optDecoded)[0] == HashCode && (*optDecoded)[1] == HashSize;
}

//----------------------------------------------------------------------------------------------------------------------

local::DigestContext local::CreateContext()
{
    DigestContext upContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!upContext) { return upContext; }
    if (EVP_DigestInit_ex(upContext.get(), EVP_sha256(), nullptr) <= 0) { upContext.reset(); }
    return upContext;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::Update(DigestContext const& upContext, std::span<std::uint8_t const> buffer)
{
    return EVP_DigestUpdate(upContext.get(), buffer.data(), buffer.size()) > 0;
}

//----------------------------------------------------------------------------------------------------------------------

bool local::Update(DigestContext const& upContext, std::string_view text)
{
    return EVP_DigestUpdate(upContext.get(), text.data(), text.size()) > 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Content::Identifier::Digest> local::Finalize(DigestContext const& upContext)
{
    Content::Identifier::Digest digest;
    std::uint32_t processed = 0;
    if (EVP_DigestFinal_ex(upContext.get(), digest.data(), &processed) <= 0) { return {}; }
    if (processed != digest.size()) { return {}; }
    return digest;
}

//----------------------------------------------------------------------------------------------------------------------
