//----------------------------------------------------------------------------------------------------------------------
// File: Node.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Node.hpp"
#include "Fabric.hpp"
#include "Repository.hpp"
#include "Stream.hpp"
#include "Components/Content/Identifier.hpp"
#include "Components/Overlay/Multiaddress.hpp"
#include "Components/Overlay/RepositoryLock.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/post.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <dlfcn.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <fstream>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view PluginExtension = ".so";
constexpr std::string_view PathPrefix = "/ipfs/";
constexpr std::string_view StagingExtension = ".staging";

struct ContentPath
{
    Overlay::ContentIdentifier content;
    std::string name;
};

[[nodiscard]] std::optional<ContentPath> ParseContentPath(std::string_view path);
void Merge(Overlay::AddressList& destination, Overlay::AddressList const& source);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Overlay::Loopback::Node::Node(std::shared_ptr<Fabric> const& spFabric)
    : m_spFabric(spFabric)
    , m_logger(spdlog::get(Logger::Name::Overlay.data()))
    , m_mutex()
    , m_upLock()
    , m_upRepository()
    , m_identifier()
    , m_blocks()
    , m_listening()
    , m_online(false)
    , m_session(0)
    , m_handlers()
    , m_addressBook()
    , m_plugins()
    , m_context()
    , m_upWorkGuard()
    , m_worker()
{
    assert(m_spFabric);
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::Loopback::Node::~Node()
{
    Close();
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::IsLockedByOtherProcess(std::filesystem::path const& root) const
{
    return RepositoryLock::IsHeld(root);
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::IsInitialized(std::filesystem::path const& root) const
{
    return Repository::IsInitialized(root);
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::AcquireRepository(std::filesystem::path const& root)
{
    std::scoped_lock lock(m_mutex);
    if (m_upLock) { return m_upLock->Covers(root); }
    if (m_upRepository) { return false; }

    if (!FileUtils::CreateFolderIfNoneExist(root)) {
        m_logger->error("Failed to create the overlay repository directory at {}.", root.string());
        return false;
    }

    m_upLock = RepositoryLock::Acquire(root);
    if (!m_upLock) {
        m_logger->warn("The overlay repository at {} is held by another node.", root.string());
        return false;
    }

    m_logger->debug("Acquired the overlay repository at {}.", root.string());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::Initialize(std::filesystem::path const& root)
{
    // Initialization always runs under the repository lock, a temporary one is taken if the node has none. 
    std::unique_ptr<RepositoryLock> upTemporary;
    if (!HoldsRepository(root)) {
        if (!FileUtils::CreateFolderIfNoneExist(root)) { return false; }
        upTemporary = RepositoryLock::Acquire(root);
        if (!upTemporary) {
            m_logger->error("Unable to initialize {}, the overlay repository is held by another node.", root.string());
            return false;
        }
    }

    if (!Repository::Initialize(root)) {
        m_logger->error("Failed to initialize an overlay repository at {}.", root.string());
        return false;
    }

    m_logger->info("Initialized an overlay repository at {}.", root.string());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::Open(std::filesystem::path const& root)
{
    std::scoped_lock lock(m_mutex);
    if (m_upRepository) { return false; }

    auto upRepository = (m_upLock) ? Repository::Open(root, m_upLock) : Repository::Open(root);
    if (!upRepository) {
        m_logger->error("Failed to open the overlay repository at {}.", root.string());
        return false;
    }

    m_identifier = upRepository->GetIdentifier();
    m_blocks = upRepository->GetBlocksPath();
    m_listening = upRepository->GetSwarmAddresses();
    m_upRepository = std::move(upRepository);

    m_logger->debug("Opened the overlay repository for {} at {}.", m_identifier, root.string());
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::LoadPlugins(std::filesystem::path const& directory)
{
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) { return true; } // Plugins are optional. 

    std::vector<std::filesystem::path> libraries;
    for (auto const& entry : std::filesystem::directory_iterator(directory, error)) {
        if (entry.is_regular_file(error) && entry.path().extension() == local::PluginExtension) {
            libraries.emplace_back(entry.path());
        }
    }
    if (error) { return false; }

    std::ranges::sort(libraries); // Plugins are loaded in a stable order. 

    std::scoped_lock lock(m_mutex);
    for (auto const& library : libraries) {
        PluginHandle handle{ ::dlopen(library.c_str(), RTLD_NOW | RTLD_LOCAL) };
        if (!handle) {
            char const* const reason = ::dlerror();
            m_logger->error("Failed to load the plugin {}: {}", library.string(), (reason) ? reason : "unknown error");
            return false;
        }

        m_logger->debug("Loaded the plugin {}.", library.string());
        m_plugins.emplace_back(std::move(handle));
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::SetListenAddresses(AddressList const& addresses)
{
    std::scoped_lock lock(m_mutex);
    if (!m_upRepository || m_online) { return false; }
    if (!m_upRepository->SetSwarmAddresses(addresses)) { return false; }
    m_listening = addresses;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::Online()
{
    {
        std::scoped_lock lock(m_mutex);
        if (!m_upRepository || m_online) { return false; }

        // The node must be owned by a shared pointer for the fabric to observe its lifetime. 
        if (!m_spFabric->Register(m_identifier, m_listening, weak_from_this())) {
            m_logger->error("Failed to bring {} online, an address is already in use.", m_identifier);
            return false;
        }

        m_context.restart();
        m_upWorkGuard = std::make_unique<WorkGuard>(boost::asio::make_work_guard(m_context));
        m_worker = std::jthread([this] { m_context.run(); });
        m_online = true;
    }

    RegisterHeldContent();

    m_logger->info("{} is online.", m_identifier);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Node::Close()
{
    std::unique_ptr<RepositoryLock> upLock;
    std::unique_ptr<Repository> upRepository;
    std::vector<PluginHandle> plugins;
    {
        std::scoped_lock lock(m_mutex);
        if (m_online) {
            m_spFabric->Unregister(m_identifier);
            m_online = false;
        }

        ++m_session;
        m_handlers.clear();
        upLock = std::move(m_upLock);
        upRepository = std::move(m_upRepository);
        plugins = std::move(m_plugins);
    }

    // The worker is joined outside of the lock, pending inbound handlers may require the node's state. 
    m_upWorkGuard.reset();
    m_context.stop();
    if (m_worker.joinable()) { m_worker.join(); }

    if (upRepository) { m_logger->debug("Closed the overlay repository at {}.", upRepository->GetRoot().string()); }
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::PeerIdentifier const& Overlay::Loopback::Node::GetIdentifier() const { return m_identifier; }

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList Overlay::Loopback::Node::GetListenAddresses() const
{
    std::scoped_lock lock(m_mutex);
    return m_listening;
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList Overlay::Loopback::Node::GetAnnounceAddresses() const
{
    std::scoped_lock lock(m_mutex);
    return CreateAnnounceAddresses();
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::OperationStatus Overlay::Loopback::Node::Connect(
    std::string_view address, std::chrono::milliseconds timeout, std::stop_token token)
{
    if (!IsOnline()) { return OperationStatus::Failure; }

    auto const optAddress = Multiaddress::Parse(address);
    if (!optAddress) {
        m_logger->debug("Unable to dial the malformed address {}.", address);
        return OperationStatus::Failure;
    }

    if (auto const status = m_spFabric->SimulateLatency(timeout, token); status != OperationStatus::Success) {
        return status;
    }

    auto const spRemote = m_spFabric->Resolve(*optAddress);
    if (!spRemote || spRemote.get() == this) { return OperationStatus::Failure; }

    // Both sides of the connection learn the other's addresses. 
    auto const& remote = spRemote->GetIdentifier();
    AddressList const dialed = { optAddress->WithLoopbackHost().WithoutPeerIdentifier().GetUri() };
    RecordPeerAddresses(remote, dialed);
    spRemote->RecordPeerAddresses(m_identifier, GetAnnounceAddresses());

    m_logger->debug("{} connected to {}.", m_identifier, remote);
    return OperationStatus::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<IOverlayStream> Overlay::Loopback::Node::NewStream(
    PeerIdentifier const& peer, std::string_view protocol, std::stop_token token)
{
    if (token.stop_requested() || !IsOnline() || peer == m_identifier) { return nullptr; }

    auto const spRemote = m_spFabric->Find(peer);
    if (!spRemote) {
        m_logger->debug("Unable to open a {} stream, {} is not reachable.", protocol, peer);
        return nullptr;
    }

    auto upStream = spRemote->Accept(m_identifier, protocol, m_context);
    if (!upStream) { return nullptr; }

    // An established stream implies a connection, the remote learns the dialer's addresses. 
    if (auto const optAddresses = m_spFabric->GetKnownAddresses(peer); optAddresses) {
        RecordPeerAddresses(peer, *optAddresses);
    }
    spRemote->RecordPeerAddresses(m_identifier, GetAnnounceAddresses());

    return upStream;
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Node::SetStreamHandler(std::string_view protocol, StreamHandler const& handler)
{
    std::scoped_lock lock(m_mutex);
    m_handlers.insert_or_assign(std::string{ protocol }, handler);
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Node::RemoveStreamHandler(std::string_view protocol)
{
    std::scoped_lock lock(m_mutex);
    if (auto const itr = m_handlers.find(protocol); itr != m_handlers.end()) { m_handlers.erase(itr); }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::ContentIdentifier> Overlay::Loopback::Node::Add(std::filesystem::path const& directory)
{
    std::filesystem::path blocks;
    {
        std::scoped_lock lock(m_mutex);
        if (!m_upRepository) { return {}; }
        blocks = m_blocks;
    }

    auto const optIdentifier = Content::Identifier::FromDirectory(directory);
    if (!optIdentifier) {
        m_logger->warn("Unable to add {}, only flat directories of regular files are supported.", directory.string());
        return {};
    }

    std::error_code error;
    auto const destination = blocks / *optIdentifier;
    if (!std::filesystem::is_directory(destination, error)) {
        // Content is staged beside its final location and moved into place once every entry has been copied. 
        auto const staging = blocks / (*optIdentifier + std::string{ local::StagingExtension });
        std::filesystem::remove_all(staging, error);
        if (!FileUtils::CreateFolderIfNoneExist(staging)) { return {}; }

        for (auto const& entry : std::filesystem::directory_iterator(directory, error)) {
            std::filesystem::copy_file(entry.path(), staging / entry.path().filename(), error);
            if (error) {
                m_logger->warn("Failed to store {}: {}", entry.path().string(), error.message());
                std::filesystem::remove_all(staging, error);
                return {};
            }
        }

        std::filesystem::rename(staging, destination, error);
        if (error) {
            std::filesystem::remove_all(staging, error);
            return {};
        }
    }

    if (IsOnline()) { m_spFabric->AddHolder(*optIdentifier, m_identifier); }

    m_logger->debug("Added {} as {}.", directory.string(), *optIdentifier);
    return optIdentifier;
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<std::istream> Overlay::Loopback::Node::Get(std::string_view path, std::stop_token token)
{
    auto const optPath = local::ParseContentPath(path);
    if (!optPath) { return nullptr; }

    if (auto upLocal = OpenBlock(optPath->content, optPath->name); upLocal) { return upLocal; }

    // Content missing from the local store is fetched from any online node holding it. 
    for (auto const& holder : m_spFabric->GetHolders(optPath->content)) {
        if (token.stop_requested()) { return nullptr; }
        if (holder == m_identifier) { continue; }
        if (auto const spRemote = m_spFabric->Find(holder); spRemote) {
            if (auto upRemote = spRemote->OpenBlock(optPath->content, optPath->name); upRemote) { return upRemote; }
        }
    }

    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::OperationStatus Overlay::Loopback::Node::Provide(
    ContentIdentifier const& identifier, bool announce, std::stop_token token)
{
    if (!IsOnline()) { return OperationStatus::Failure; }
    if (!announce) { return OperationStatus::Success; } // Without an announcement the record is only kept locally.

    auto const status = m_spFabric->SimulateLatency(std::chrono::milliseconds::max(), token);
    if (status != OperationStatus::Success) { return status; }

    m_spFabric->AddProvider(identifier, m_identifier);
    m_logger->debug("{} provided {}.", m_identifier, identifier);
    return OperationStatus::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Overlay::Loopback::Node::FindProviders(
    ContentIdentifier const& identifier,
    std::size_t limit,
    std::stop_token token,
    ProviderReader const& reader)
{
    if (!IsOnline()) { return 0; }

    std::size_t found = 0;
    for (auto const& provider : m_spFabric->GetProviders(identifier)) {
        if (found >= limit || token.stop_requested()) { break; }

        // Provider records carry the addresses the routing table knows for the provider. 
        if (auto const optAddresses = m_spFabric->GetKnownAddresses(provider); optAddresses) {
            RecordPeerAddresses(provider, *optAddresses);
        }

        ProviderRecord record{ provider, GetPeerAddresses(provider).value_or(AddressList{}) };
        ++found;
        if (reader(record) == CallbackIteration::Stop) { break; }
    }

    return found;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::IsOnline() const
{
    std::scoped_lock lock(m_mutex);
    return m_online;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::AddressList> Overlay::Loopback::Node::GetPeerAddresses(PeerIdentifier const& peer) const
{
    std::scoped_lock lock(m_mutex);
    if (auto const itr = m_addressBook.find(peer); itr != m_addressBook.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<IOverlayStream> Overlay::Loopback::Node::Accept(
    PeerIdentifier const& dialer, std::string_view protocol, boost::asio::io_context& dialerContext)
{
    StreamHandler handler;
    std::uint64_t session = 0;
    {
        std::scoped_lock lock(m_mutex);
        if (!m_online) { return nullptr; }
        session = m_session;
        auto const itr = m_handlers.find(protocol);
        if (itr == m_handlers.end()) {
            m_logger->debug(
                "{} rejected a {} stream from {}, the protocol is not supported.", m_identifier, protocol, dialer);
            return nullptr;
        }
        handler = itr->second;
    }

    auto optStreams = Stream::CreatePair(dialerContext, dialer, m_context, m_identifier);
    if (!optStreams) { return nullptr; }

    // Inbound streams are handled on the node's worker, the dialer may start reading immediately. A stream still 
    // queued when the node closes is dropped, which the dialer observes as the end of the stream. 
    auto spInbound = std::make_shared<std::unique_ptr<IOverlayStream>>(std::move(optStreams->second));
    boost::asio::post(m_context, [this, handler, spInbound, session] {
        if (!IsCurrentSession(session)) { return; }
        handler(std::move(*spInbound));
    });

    return std::move(optStreams->first);
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<std::istream> Overlay::Loopback::Node::OpenBlock(
    ContentIdentifier const& content, std::string_view name) const
{
    std::filesystem::path blocks;
    {
        std::scoped_lock lock(m_mutex);
        if (!m_upRepository) { return nullptr; }
        blocks = m_blocks;
    }

    std::error_code error;
    auto const path = blocks / content / name;
    if (!std::filesystem::is_regular_file(path, error)) { return nullptr; }

    auto upReader = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (upReader->fail()) { return nullptr; }
    return upReader;
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Node::RecordPeerAddresses(PeerIdentifier const& peer, AddressList const& addresses)
{
    std::scoped_lock lock(m_mutex);
    if (peer == m_identifier) { return; }
    local::Merge(m_addressBook[peer], addresses);
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::HoldsRepository(std::filesystem::path const& root) const
{
    std::scoped_lock lock(m_mutex);
    return m_upLock && m_upLock->Covers(root);
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Node::IsCurrentSession(std::uint64_t session) const
{
    std::scoped_lock lock(m_mutex);
    return m_session == session;
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Node::RegisterHeldContent()
{
    std::filesystem::path blocks;
    {
        std::scoped_lock lock(m_mutex);
        blocks = m_blocks;
    }

    std::error_code error;
    for (auto const& entry : std::filesystem::directory_iterator(blocks, error)) {
        auto const name = entry.path().filename().string();
        if (entry.is_directory(error) && Content::Identifier::IsValid(name)) {
            m_spFabric->AddHolder(name, m_identifier);
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList Overlay::Loopback::Node::CreateAnnounceAddresses() const
{
    AddressList addresses;
    for (auto const& address : m_listening) {
        if (auto const optAddress = Multiaddress::Parse(address); optAddress) {
            addresses.emplace_back(optAddress->WithLoopbackHost().GetUri());
        }
    }
    return addresses;
}

//----------------------------------------------------------------------------------------------------------------------

void Overlay::Loopback::Node::PluginDeleter::operator()(void* pHandle) const
{
    if (pHandle) { ::dlclose(pHandle); }
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<local::ContentPath> local::ParseContentPath(std::string_view path)
{
    if (path.starts_with(PathPrefix)) { path.remove_prefix(PathPrefix.size()); }
    while (path.starts_with('/')) { path.remove_prefix(1); }

    auto const separator = path.find('/');
    if (separator == std::string_view::npos) { return {}; }

    auto const content = path.substr(0, separator);
    auto const name = path.substr(separator + 1);
    if (content.empty() || name.empty() || name.find('/') != std::string_view::npos || name == "..") { return {}; }
    if (!Content::Identifier::IsValid(content)) { return {}; }

    return ContentPath{ Overlay::ContentIdentifier{ content }, std::string{ name } };
}

//----------------------------------------------------------------------------------------------------------------------

void local::Merge(Overlay::AddressList& destination, Overlay::AddressList const& source)
{
    for (auto const& address : source) {
        if (std::ranges::find(destination, address) == destination.end()) { destination.emplace_back(address); }
    }
}

//----------------------------------------------------------------------------------------------------------------------
