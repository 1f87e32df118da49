#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"
#include "townsim/core/Errors.hpp"
#include "townsim/engine/Commands.hpp"

namespace townsim::engine {

struct InputOutcome {
    bool            ok = false;
    nlohmann::json  value;                       // ok only
    core::ErrorKind errorKind = core::ErrorKind::Internal;
    std::string     message;                     // error only
    TimeMs          completedAt = 0;

    [[nodiscard]] static InputOutcome Ok(nlohmann::json v, TimeMs at)
    {
        InputOutcome o;
        o.ok = true;
        o.value = std::move(v);
        o.completedAt = at;
        return o;
    }

    [[nodiscard]] static InputOutcome Error(core::ErrorKind kind, std::string msg, TimeMs at)
    {
        InputOutcome o;
        o.errorKind = kind;
        o.message = std::move(msg);
        o.completedAt = at;
        return o;
    }
};

struct InputRecord {
    std::int64_t                number = -1;
    TimeMs                      received = 0;
    std::string                 name;
    nlohmann::json              args;
    Command                     command;
    std::optional<InputOutcome> outcome;      // set once, never changed
};

[[nodiscard]] nlohmann::json OutcomeToJson(const InputOutcome& o);
[[nodiscard]] InputOutcome OutcomeFromJson(const nlohmann::json& j);

// Public view of a record (without the parsed command).
[[nodiscard]] nlohmann::json InputToJson(const InputRecord& r);

// Durable sink for submitted and completed inputs.
class InputJournal {
public:
    virtual ~InputJournal() = default;
    virtual void recordSubmitted(const InputRecord& r) = 0;
    virtual void recordCompleted(std::int64_t number, const InputOutcome& o) = 0;
};

} // namespace townsim::engine
