#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "townsim/core/Clock.hpp"
#include "townsim/engine/Input.hpp"

namespace townsim::engine {

// Multi-producer input table for one engine. Numbers are assigned and the
// receipt time is read under the same lock, so number order is receipt order.
class InputQueue {
public:
    InputQueue(const core::IClock& clock, std::size_t maxPending, std::size_t retainCompleted);

    // Throws core::RateLimited when `maxPending` inputs are unresolved.
    InputRecord push(std::string name, nlohmann::json args, Command command);

    // Re-inserts a record read back from the journal.
    void restore(InputRecord r);

    // Unresolved inputs numbered above `after`, in number order.
    [[nodiscard]] std::vector<InputRecord> pending(std::int64_t after, std::size_t max) const;
    [[nodiscard]] std::vector<InputRecord> unresolved() const;

    // False if the input is unknown or already has an outcome.
    bool complete(std::int64_t number, const InputOutcome& outcome);

    [[nodiscard]] std::optional<InputRecord> get(std::int64_t number) const;
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::int64_t nextNumber() const;

private:
    void pruneLocked();

    const core::IClock& m_clock;
    std::size_t m_maxPending;
    std::size_t m_retainCompleted;

    mutable std::mutex m_mutex;
    std::map<std::int64_t, InputRecord> m_records;
    std::int64_t m_nextNumber = 0;
    std::size_t  m_pending = 0;
    std::size_t  m_completed = 0;
};

} // namespace townsim::engine
