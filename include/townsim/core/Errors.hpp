#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace townsim::core {

// Outcome classes recorded on failed inputs.
enum class ErrorKind : std::uint8_t {
    Validation = 0, // bad reference / malformed args; safe to retry after fixing input
    Internal,       // handler hit an invariant violation; world left untouched
    Stuck,          // cleared by the stuck-input sweep
};

[[nodiscard]] inline const char* ErrorKindName(ErrorKind k) noexcept
{
    switch (k)
    {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Internal:   return "internal";
    case ErrorKind::Stuck:      return "stuck";
    }
    return "internal";
}

[[nodiscard]] inline ErrorKind ErrorKindFromName(const std::string& s) noexcept
{
    if (s == "validation") return ErrorKind::Validation;
    if (s == "stuck")      return ErrorKind::Stuck;
    return ErrorKind::Internal;
}

// Unknown entity, actor not allowed, malformed arguments.
struct ValidationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A specific channel cannot take another occupant.
struct CapacityExceeded : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A new channel (or its world) could not be created.
struct AllocationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Too many unprocessed inputs queued for one engine.
struct RateLimited : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace townsim::core
