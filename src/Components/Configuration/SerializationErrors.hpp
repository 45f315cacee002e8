//----------------------------------------------------------------------------------------------------------------------
// File: SerializationErrors.hpp
// Description: Messages describing why a configuration field was rejected. Field names are joined with a period 
// (e.g. discovery.port).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline std::string_view GetIndefiniteArticle(std::string_view value)
{
    if (value.empty()) { return ""; }
    switch (value.front()) {
        case 'a': case 'e': case 'i': case 'o': case 'u': return "an";
        default: return "a";
    }
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string ConcatenateFieldNames(Fields const&... fields)
{
    std::string result;
    ((result += std::string(result.empty() ? "" : ".").append(std::string_view{ fields })), ...);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMissingFieldMessage(Fields const&... fields)
{
    return fmt::format("The '{}' field was not found.", ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view type, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be {} {}.", ConcatenateFieldNames(fields...), GetIndefiniteArticle(type), type);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateInvalidValueMessage(Fields const&... fields)
{
    return fmt::format(
        "The '{}' field contains an invalid value. See documentation for supported values.",
        ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateInvalidValueInArrayMessage(std::size_t index, Fields const&... fields)
{
    return fmt::format(
        "The element at index {} of the '{}' field contains an invalid value.", index, ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateValueRangeMessage(std::integral auto min, std::integral auto max, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be a value between {} and {}.", ConcatenateFieldNames(fields...), min, max);
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
