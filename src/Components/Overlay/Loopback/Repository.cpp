//----------------------------------------------------------------------------------------------------------------------
// File: Repository.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Repository.hpp"
#include "Components/Overlay/Multiaddress.hpp"
#include "Components/Overlay/RepositoryLock.hpp"
#include "Utilities/Base58.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using KeyContext = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using KeyPair = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

constexpr std::size_t KeySize = 32;

// The identifier of a peer is the identity multihash of its protobuf encoded Ed25519 public key. 
constexpr std::array<std::uint8_t, 6> IdentifierPrefix = { 0x00, 0x24, 0x08, 0x01, 0x12, 0x20 };

[[nodiscard]] std::optional<Overlay::PeerIdentifier> CreateIdentifier(EVP_PKEY* pKey);
[[nodiscard]] std::string EncodeKey(std::span<std::uint8_t const> key);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> DecodeKey(std::string_view encoded);
[[nodiscard]] std::string_view ToStringView(boost::json::string const& value);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Identity = "Identity";
constexpr std::string_view PeerIdentifier = "PeerID";
constexpr std::string_view PrivateKey = "PrivKey";
constexpr std::string_view Addresses = "Addresses";
constexpr std::string_view Swarm = "Swarm";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::Loopback::Identity> Overlay::Loopback::GenerateIdentity()
{
    local::KeyContext upContext(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
    if (!upContext || EVP_PKEY_keygen_init(upContext.get()) <= 0) { return {}; }

    EVP_PKEY* pKey = nullptr;
    if (EVP_PKEY_keygen(upContext.get(), &pKey) <= 0) { return {}; }
    local::KeyPair upKey(pKey, &EVP_PKEY_free);

    std::array<std::uint8_t, local::KeySize> key;
    std::size_t size = key.size();
    if (EVP_PKEY_get_raw_private_key(upKey.get(), key.data(), &size) <= 0 || size != key.size()) { return {}; }

    auto optIdentifier = local::CreateIdentifier(upKey.get());
    if (!optIdentifier) { return {}; }

    return Identity{ std::move(*optIdentifier), local::EncodeKey(key) };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::PeerIdentifier> Overlay::Loopback::DeriveIdentifier(std::string_view key)
{
    auto const optDecoded = local::DecodeKey(key);
    if (!optDecoded || optDecoded->size() != local::KeySize) { return {}; }

    local::KeyPair upKey(
        EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, optDecoded->data(), optDecoded->size()),
        &EVP_PKEY_free);
    if (!upKey) { return {}; }

    return local::CreateIdentifier(upKey.get());
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::Loopback::Repository::Repository(
    std::filesystem::path const& root, std::unique_ptr<RepositoryLock>&& upLock)
    : m_root(root)
    , m_upLock(std::move(upLock))
    , m_identity()
    , m_swarm()
{
}

//----------------------------------------------------------------------------------------------------------------------

Overlay::Loopback::Repository::~Repository() = default;

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Repository::IsInitialized(std::filesystem::path const& root)
{
    std::error_code error;
    return std::filesystem::is_regular_file(root / ConfigFilename, error);
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Repository::Initialize(std::filesystem::path const& root)
{
    if (IsInitialized(root)) { return false; } // Existing repositories are never overwritten. 
    if (!FileUtils::CreateFolderIfNoneExist(root)) { return false; }
    if (!FileUtils::CreateFolderIfNoneExist(root / BlocksDirectory)) { return false; }

    auto optIdentity = GenerateIdentity();
    if (!optIdentity) { return false; }

    Repository repository{ root, nullptr };
    repository.m_identity = std::move(*optIdentity);
    return repository.Store();
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<Overlay::Loopback::Repository> Overlay::Loopback::Repository::Open(std::filesystem::path const& root)
{
    if (!IsInitialized(root)) { return nullptr; }

    auto upLock = RepositoryLock::Acquire(root);
    if (!upLock) { return nullptr; }

    return Open(root, upLock);
}

//----------------------------------------------------------------------------------------------------------------------

std::unique_ptr<Overlay::Loopback::Repository> Overlay::Loopback::Repository::Open(
    std::filesystem::path const& root, std::unique_ptr<RepositoryLock>& upLock)
{
    if (!upLock || !upLock->Covers(root) || !IsInitialized(root)) { return nullptr; }

    std::unique_ptr<Repository> upRepository(new Repository(root, std::move(upLock)));
    bool const opened = upRepository->Load() && FileUtils::CreateFolderIfNoneExist(upRepository->GetBlocksPath());
    if (!opened) {
        upLock = std::move(upRepository->m_upLock);
        return nullptr;
    }

    return upRepository;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Overlay::Loopback::Repository::GetRoot() const { return m_root; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Overlay::Loopback::Repository::GetBlocksPath() const { return m_root / BlocksDirectory; }

//----------------------------------------------------------------------------------------------------------------------

Overlay::PeerIdentifier const& Overlay::Loopback::Repository::GetIdentifier() const { return m_identity.identifier; }

//----------------------------------------------------------------------------------------------------------------------

Overlay::AddressList const& Overlay::Loopback::Repository::GetSwarmAddresses() const { return m_swarm; }

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Repository::SetSwarmAddresses(AddressList const& addresses)
{
    for (auto const& address : addresses) {
        if (!Multiaddress::Parse(address)) { return false; }
    }

    m_swarm = addresses;
    return Store();
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Repository::Load()
{
    auto const optBuffer = FileUtils::ReadFile(m_root / ConfigFilename);
    if (!optBuffer || optBuffer->empty()) { return false; }

    boost::json::error_code error;
    std::string_view const serialized{ reinterpret_cast<char const*>(optBuffer->data()), optBuffer->size() };
    auto const json = boost::json::parse(serialized, error);
    if (error || !json.is_object()) { return false; }

    auto const& root = json.get_object();
    auto const pIdentity = root.if_contains(symbols::Identity);
    if (!pIdentity || !pIdentity->is_object()) { return false; }

    auto const pIdentifier = pIdentity->get_object().if_contains(symbols::PeerIdentifier);
    auto const pKey = pIdentity->get_object().if_contains(symbols::PrivateKey);
    if (!pIdentifier || !pIdentifier->is_string() || !pKey || !pKey->is_string()) { return false; }

    // The stored identifier must be the one derived from the stored key, otherwise the repository has been altered. 
    auto const key = local::ToStringView(pKey->get_string());
    auto const optDerived = DeriveIdentifier(key);
    if (!optDerived || *optDerived != local::ToStringView(pIdentifier->get_string())) { return false; }

    m_identity = Identity{ *optDerived, std::string{ key } };

    m_swarm.clear();
    if (auto const pAddresses = root.if_contains(symbols::Addresses); pAddresses && pAddresses->is_object()) {
        if (auto const pSwarm = pAddresses->get_object().if_contains(symbols::Swarm); pSwarm && pSwarm->is_array()) {
            for (auto const& value : pSwarm->get_array()) {
                if (!value.is_string()) { return false; }
                m_swarm.emplace_back(local::ToStringView(value.get_string()));
            }
        }
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Overlay::Loopback::Repository::Store() const
{
    boost::json::object identity;
    identity[symbols::PeerIdentifier] = m_identity.identifier;
    identity[symbols::PrivateKey] = m_identity.key;

    boost::json::array swarm;
    for (auto const& address : m_swarm) { swarm.emplace_back(boost::json::string{ address }); }

    boost::json::object addresses;
    addresses[symbols::Swarm] = std::move(swarm);

    boost::json::object json;
    json[symbols::Identity] = std::move(identity);
    json[symbols::Addresses] = std::move(addresses);

    return JSON::PrettyPrinter{}.WriteFile(json, m_root / ConfigFilename);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Overlay::PeerIdentifier> local::CreateIdentifier(EVP_PKEY* pKey)
{
    std::array<std::uint8_t, IdentifierPrefix.size() + KeySize> multihash;
    std::ranges::copy(IdentifierPrefix, multihash.begin());

    std::size_t size = KeySize;
    auto const pPublicKey = multihash.data() + IdentifierPrefix.size();
    if (EVP_PKEY_get_raw_public_key(pKey, pPublicKey, &size) <= 0 || size != KeySize) { return {}; }

    return Base58::Encode(multihash);
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::EncodeKey(std::span<std::uint8_t const> key)
{
    std::string encoded(4 * ((key.size() + 2) / 3) + 1, '\0'); // Note: The encoder writes a terminator. 
    auto const written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()), key.data(), static_cast<int>(key.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::vector<std::uint8_t>> local::DecodeKey(std::string_view encoded)
{
    if (encoded.empty() || encoded.size() % 4 != 0) { return {}; }

    std::vector<std::uint8_t> decoded(3 * (encoded.size() / 4), 0x00);
    auto const written = EVP_DecodeBlock(
        decoded.data(), reinterpret_cast<unsigned char const*>(encoded.data()), static_cast<int>(encoded.size()));
    if (written < 0) { return {}; }

    // The block decoder does not account for padding, each pad character represents one discarded byte. 
    auto const padding = static_cast<std::size_t>(std::ranges::count(encoded.substr(encoded.size() - 2), '='));
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view local::ToStringView(boost::json::string const& value)
{
    return std::string_view{ value.data(), value.size() };
}

//----------------------------------------------------------------------------------------------------------------------
