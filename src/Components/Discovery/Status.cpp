//----------------------------------------------------------------------------------------------------------------------
// File: Status.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Status.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <sstream>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

std::string_view Discovery::ToString(StatusCode code)
{
    switch (code) {
        case StatusCode::Success: return "success";
        case StatusCode::AlreadyRunning: return "another instance is already accessing the repository";
        case StatusCode::AlreadyStarted: return "the discovery server has already been started";
        case StatusCode::NotStarted: return "the discovery server has not been started";
        case StatusCode::InitializationFailure: return "failed to initialize the discovery server";
        case StatusCode::InvalidIdentifier: return "invalid network identifier";
        case StatusCode::PublishFailure: return "failed to publish the network";
        case StatusCode::ContentNotFound: return "network content not found";
        case StatusCode::ProvideTimeout: return "timed out announcing the network";
        case StatusCode::ProvideFailure: return "failed to announce the network";
        case StatusCode::Canceled: return "the operation was canceled";
    }
    return "unknown status";
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Status::Status()
    : m_code(StatusCode::Success)
    , m_cause()
{
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::Status::Status(StatusCode code, std::string cause)
    : m_code(code)
    , m_cause(std::move(cause))
{
}

//----------------------------------------------------------------------------------------------------------------------

Discovery::StatusCode Discovery::Status::GetCode() const { return m_code; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Discovery::Status::GetCause() const { return m_cause; }

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Status::IsSuccess() const { return m_code == StatusCode::Success; }

//----------------------------------------------------------------------------------------------------------------------

std::string Discovery::Status::ToString() const
{
    std::ostringstream oss;
    oss << Discovery::ToString(m_code);
    if (!m_cause.empty()) { oss << ": " << m_cause; }
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

bool Discovery::Status::operator==(StatusCode code) const { return m_code == code; }

//----------------------------------------------------------------------------------------------------------------------
