//----------------------------------------------------------------------------------------------------------------------
// File: NetworkInfo.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "NetworkInfo.hpp"
#include "Utilities/FileUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Content::NetworkInfo::NetworkInfo(Buffer&& manifest, Buffer&& genesis, std::unique_ptr<std::istream>&& upImage)
    : m_manifest(std::move(manifest))
    , m_genesis(std::move(genesis))
    , m_upImage(std::move(upImage))
{
    assert(m_upImage);
}

//----------------------------------------------------------------------------------------------------------------------

Content::NetworkInfo::Buffer const& Content::NetworkInfo::GetManifest() const { return m_manifest; }

//----------------------------------------------------------------------------------------------------------------------

Content::NetworkInfo::Buffer const& Content::NetworkInfo::GetGenesis() const { return m_genesis; }

//----------------------------------------------------------------------------------------------------------------------

std::istream& Content::NetworkInfo::GetImage() { return *m_upImage; }

//----------------------------------------------------------------------------------------------------------------------

bool Content::NetworkInfo::WriteManifest(std::filesystem::path const& path) const
{
    return FileUtils::WriteFile(path, m_manifest);
}

//----------------------------------------------------------------------------------------------------------------------

bool Content::NetworkInfo::WriteGenesis(std::filesystem::path const& path) const
{
    return FileUtils::WriteFile(path, m_genesis);
}

//----------------------------------------------------------------------------------------------------------------------

bool Content::NetworkInfo::WriteImage(std::filesystem::path const& path)
{
    return FileUtils::WriteStream(path, *m_upImage);
}

//----------------------------------------------------------------------------------------------------------------------
