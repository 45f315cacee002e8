//----------------------------------------------------------------------------------------------------------------------
// File: CallbackIteration.hpp
// Description: Return value of enumeration callbacks used to continue or stop the enumeration.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

enum class CallbackIteration : std::uint32_t { Continue, Stop };

//----------------------------------------------------------------------------------------------------------------------
