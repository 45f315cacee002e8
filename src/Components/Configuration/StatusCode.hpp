//----------------------------------------------------------------------------------------------------------------------
// File: StatusCode.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

enum class StatusCode : std::uint32_t { Success, DecodeError, EncodeError, InputError, FileError };

using DeserializationResult = std::pair<StatusCode, std::string>;
using SerializationResult = std::pair<StatusCode, std::string>;
using ValidationResult = std::pair<StatusCode, std::string>;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
