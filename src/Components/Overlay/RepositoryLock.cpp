//----------------------------------------------------------------------------------------------------------------------
// File: RepositoryLock.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "RepositoryLock.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/interprocess/exceptions.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <fstream>
#include <mutex>
#include <set>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class Registry
{
public:
    [[nodiscard]] bool Contains(std::filesystem::path const& root) const
    {
        std::scoped_lock lock(m_mutex);
        return m_roots.contains(root);
    }

    [[nodiscard]] bool Insert(std::filesystem::path const& root)
    {
        std::scoped_lock lock(m_mutex);
        return m_roots.emplace(root).second;
    }

    void Erase(std::filesystem::path const& root)
    {
        std::scoped_lock lock(m_mutex);
        m_roots.erase(root);
    }

private:
    mutable std::mutex m_mutex;
    std::set<std::filesystem::path> m_roots;
};

[[nodiscard]] Registry& GetRegistry();
[[nodiscard]] std::filesystem::path Normalize(std::filesystem::path const& root);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Overlay::RepositoryLock::RepositoryLock(std::filesystem::path const& root, boost::interprocess::file_lock&& lock)
    : m_root(root)
    , m_lock(std::move(lock))
{
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::RepositoryLock::~RepositoryLock()
{
    try {
        m_lock.unlock();
    } catch (boost::interprocess::interprocess_exception const&) {
        // The lock is released when the descriptor is closed. 
    }

    local::GetRegistry().Erase(m_root);
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::RepositoryLock::IsHeld(std::filesystem::path const& root)
{
    auto const normalized = local::Normalize(root);
    if (local::GetRegistry().Contains(normalized)) { return true; }

    // If the lock file has never been created, no process could have locked the repository. 
    auto const file = normalized / FileName;
    std::error_code error;
    if (!std::filesystem::exists(file, error)) { return false; }

    try {
        boost::interprocess::file_lock lock(file.c_str());
        if (!lock.try_lock()) { return true; }
        lock.unlock();
        return false;
    } catch (boost::interprocess::interprocess_exception const&) {
        return true; // Note: A lock file that can not be opened is treated as held, opening the repository would fail.
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<Overlay::RepositoryLock> Overlay::RepositoryLock::Acquire(std::filesystem::path const& root)
{
    auto const normalized = local::Normalize(root);
    if (!local::GetRegistry().Insert(normalized)) { return nullptr; }

    auto const file = normalized / FileName;
    {
        std::ofstream touch(file, std::ios::app); // The interprocess lock requires the file to exist. 
        if (touch.fail()) {
            local::GetRegistry().Erase(normalized);
            return nullptr;
        }
    }

    try {
        boost::interprocess::file_lock lock(file.c_str());
        if (!lock.try_lock()) {
            local::GetRegistry().Erase(normalized);
            return nullptr;
        }
        return std::unique_ptr<RepositoryLock>(new RepositoryLock(normalized, std::move(lock)));
    } catch (boost::interprocess::interprocess_exception const&) {
        local::GetRegistry().Erase(normalized);
        return nullptr;
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Overlay::RepositoryLock::GetRoot() const { return m_root; }

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::RepositoryLock::Covers(std::filesystem::path const& root) const
{
    return local::Normalize(root) == m_root;
}

//----------------------------------------------------------------------------------------------------------------------

local::Registry& local::GetRegistry()
{
    static Registry registry;
    return registry;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path local::Normalize(std::filesystem::path const& root)
{
    std::error_code error;
    auto normalized = std::filesystem::weakly_canonical(root, error);
    return (error) ? root.lexically_normal() : normalized;
}

//----------------------------------------------------------------------------------------------------------------------
