//----------------------------------------------------------------------------------------------------------------------
// File: RepositoryLock.hpp
// Description: An advisory lock on an overlay repository directory. At most one live holder may exist for a root 
// across the machine.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/interprocess/sync/file_lock.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Overlay {
//----------------------------------------------------------------------------------------------------------------------

class RepositoryLock;

//----------------------------------------------------------------------------------------------------------------------
} // Overlay namespace
//----------------------------------------------------------------------------------------------------------------------

class Overlay::RepositoryLock final
{
public:
    static constexpr std::string_view FileName = "repo.lock";

    ~RepositoryLock();

    RepositoryLock(RepositoryLock const& other) = delete;
    RepositoryLock(RepositoryLock&& other) = delete;
    RepositoryLock& operator=(RepositoryLock const& other) = delete;
    RepositoryLock& operator=(RepositoryLock&& other) = delete;

    // Note: File locks are owned by the process, a second holder within the same process is detected through a 
    // process-wide registry of held roots. 
    [[nodiscard]] static bool IsHeld(std::filesystem::path const& root);
    [[nodiscard]] static std::unique_ptr<RepositoryLock> Acquire(std::filesystem::path const& root);

    [[nodiscard]] std::filesystem::path const& GetRoot() const;
    [[nodiscard]] bool Covers(std::filesystem::path const& root) const;

private:
    RepositoryLock(std::filesystem::path const& root, boost::interprocess::file_lock&& lock);

    std::filesystem::path m_root;
    boost::interprocess::file_lock m_lock;
};

//----------------------------------------------------------------------------------------------------------------------
