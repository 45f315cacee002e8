//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema. 
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "discovery": {
//     "root": Optional String,
//     "port": Optional Integer,
//     "bootstraps": Optional [String],
//     "connection_timeout": Optional Integer
// },
// "peer": {
//     "p2p_port": Optional Integer
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_filepath(filepath)
    , m_version(Defaults::Version)
    , m_options(filepath.parent_path() / Defaults::OverlayDirectory)
    , m_validated(false)
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    std::error_code error;
    if (!std::filesystem::exists(m_filepath, error)) {
        m_logger->info("Creating a default configuration file at {}.", m_filepath.string());
        if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }
        return Serialize();
    }

    m_logger->debug("Reading configuration file at {}.", m_filepath.string());
    if (auto const status = Deserialize(); status.first != StatusCode::Success) { return status; }
    return ValidateOptions();
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    if (auto const parent = m_filepath.parent_path(); !parent.empty()) {
        if (!FileUtils::CreateFolderIfNoneExist(parent)) {
            return { StatusCode::FileError, "Failed to create the configuration folder." };
        }
    }

    boost::json::object json;
    json[VersionSymbol] = m_version;
    if (auto const status = m_options.Write(json); status.first != StatusCode::Success) { return status; }

    if (!JSON::PrettyPrinter{}.WriteFile(json, m_filepath)) {
        return { StatusCode::FileError, "Failed to write the configuration file." };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options const& Configuration::Parser::GetOptions() const { return m_options; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Parser::SetOptions(Options const& options)
{
    m_options = options;
    m_validated = false;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    std::error_code error;
    auto const size = std::filesystem::file_size(m_filepath, error);
    if (error) { return { StatusCode::FileError, "Failed to open configuration file for reading." }; }
    if (size == 0) { return { StatusCode::DecodeError, "The configuration file is empty." }; }
    if (size > Defaults::FileSizeLimit) {
        return { StatusCode::InputError, "The configuration file exceeds the maximum allowed size." };
    }

    auto const optBuffer = FileUtils::ReadFile(m_filepath);
    if (!optBuffer) { return { StatusCode::FileError, "Failed to open configuration file for reading." }; }

    constexpr boost::json::parse_options ParserOptions{
        .allow_comments = true,
        .allow_trailing_commas = true,
    };

    boost::json::error_code parseError;
    std::string_view const serialized{ reinterpret_cast<char const*>(optBuffer->data()), optBuffer->size() };
    auto const json = boost::json::parse(serialized, parseError, boost::json::storage_ptr{}, ParserOptions);
    if (parseError || !json.is_object()) {
        return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
    }

    auto const& object = json.get_object();
    if (auto const itr = object.find(VersionSymbol); itr != object.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", VersionSymbol) };
        }
        auto const& version = itr->value().get_string();
        m_version.assign(version.data(), version.size());
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(VersionSymbol) };
    }

    return m_options.Merge(object);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails. 
    if (auto const status = m_options.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    m_validated = true;
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------
