//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Publisher.hpp"
#include "NetworkInfo.hpp"
#include "Interfaces/OverlayNode.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <system_error>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view StagingPrefix = "chainkit-network";

class StagingFolder;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::StagingFolder
{
public:
    explicit StagingFolder(std::filesystem::path const& path) : m_path(path) { }
    ~StagingFolder()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
    }

    StagingFolder(StagingFolder const& other) = delete;
    StagingFolder& operator=(StagingFolder const& other) = delete;

    [[nodiscard]] std::filesystem::path const& GetPath() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//----------------------------------------------------------------------------------------------------------------------

Content::Publisher::Publisher(std::shared_ptr<IOverlayNode> const& spNode)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_spNode(spNode)
{
    assert(m_logger);
    assert(m_spNode);
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Result<Overlay::ContentIdentifier> Content::Publisher::Publish(Artifacts const& artifacts) const
{
    using namespace Discovery;

    auto const optFolder = FileUtils::CreateTemporaryFolder(local::StagingPrefix);
    if (!optFolder) { return Status{ StatusCode::PublishFailure, "unable to create a staging directory" }; }
    local::StagingFolder const staging{ *optFolder };

    std::array<std::pair<std::string_view, std::filesystem::path const*>, 3> const entries = {{
        { Artifact::Manifest, &artifacts.manifest },
        { Artifact::Genesis, &artifacts.genesis },
        { Artifact::Image, &artifacts.image },
    }};

    for (auto const& [name, pSource] : entries) {
        std::error_code error;
        if (!std::filesystem::is_regular_file(*pSource, error)) {
            auto const cause = fmt::format("the {} at {} is not readable", name, pSource->string());
            return Status{ StatusCode::PublishFailure, cause };
        }

        if (!FileUtils::LinkOrCopy(*pSource, staging.GetPath() / name)) {
            auto const cause = fmt::format("unable to stage the {} at {}", name, pSource->string());
            return Status{ StatusCode::PublishFailure, cause };
        }
    }

    auto optIdentifier = m_spNode->Add(staging.GetPath());
    if (!optIdentifier) {
        return Status{ StatusCode::PublishFailure, "the overlay rejected the network artifacts" };
    }

    m_logger->info("Published the network artifacts as {}.", *optIdentifier);
    return std::move(*optIdentifier);
}

//----------------------------------------------------------------------------------------------------------------------
