//----------------------------------------------------------------------------------------------------------------------
// File: Status.hpp
// Description: The outcome of a discovery operation. A failed status names its cause such that command line 
// collaborators can surface the underlying reason.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Discovery {
//----------------------------------------------------------------------------------------------------------------------

enum class StatusCode : std::uint32_t {
    Success,
    AlreadyRunning,
    AlreadyStarted,
    NotStarted,
    InitializationFailure,
    InvalidIdentifier,
    PublishFailure,
    ContentNotFound,
    ProvideTimeout,
    ProvideFailure,
    Canceled
};

class Status;

template<typename ValueType>
using Result = std::variant<ValueType, Status>;

[[nodiscard]] std::string_view ToString(StatusCode code);

//----------------------------------------------------------------------------------------------------------------------
} // Discovery namespace
//----------------------------------------------------------------------------------------------------------------------

class Discovery::Status
{
public:
    Status();
    Status(StatusCode code, std::string cause = {});

    [[nodiscard]] StatusCode GetCode() const;
    [[nodiscard]] std::string const& GetCause() const;
    [[nodiscard]] bool IsSuccess() const;
    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] bool operator==(StatusCode code) const;

private:
    StatusCode m_code;
    std::string m_cause;
};

//----------------------------------------------------------------------------------------------------------------------
