#include "townsim/engine/InputQueue.hpp"

#include <spdlog/spdlog.h>

namespace townsim::engine {

InputQueue::InputQueue(const core::IClock& clock, std::size_t maxPending, std::size_t retainCompleted)
    : m_clock(clock)
    , m_maxPending(maxPending)
    , m_retainCompleted(retainCompleted)
{
}

InputRecord InputQueue::push(std::string name, nlohmann::json args, Command command)
{
    std::lock_guard lock(m_mutex);
    if (m_pending >= m_maxPending)
        throw core::RateLimited("Too many unprocessed inputs (" + std::to_string(m_pending) + "/" +
                                std::to_string(m_maxPending) + "), rejecting " + name);

    if (m_pending * 10 > m_maxPending * 8)
        spdlog::warn("Input buffer at {}% capacity", m_pending * 100 / m_maxPending);

    InputRecord r;
    r.number   = m_nextNumber++;
    r.received = m_clock.now();
    r.name     = std::move(name);
    r.args     = std::move(args);
    r.command  = std::move(command);

    m_records.emplace(r.number, r);
    ++m_pending;
    return r;
}

void InputQueue::restore(InputRecord r)
{
    std::lock_guard lock(m_mutex);
    if (r.number >= m_nextNumber)
        m_nextNumber = r.number + 1;

    auto it = m_records.find(r.number);
    if (it != m_records.end())
    {
        if (!it->second.outcome && r.outcome)
        {
            it->second.outcome = std::move(r.outcome);
            --m_pending;
            ++m_completed;
        }
        return;
    }

    if (r.outcome)
        ++m_completed;
    else
        ++m_pending;
    m_records.emplace(r.number, std::move(r));
    pruneLocked();
}

std::vector<InputRecord> InputQueue::pending(std::int64_t after, std::size_t max) const
{
    std::lock_guard lock(m_mutex);
    std::vector<InputRecord> out;
    for (auto it = m_records.upper_bound(after); it != m_records.end() && out.size() < max; ++it)
        if (!it->second.outcome)
            out.push_back(it->second);
    return out;
}

std::vector<InputRecord> InputQueue::unresolved() const
{
    std::lock_guard lock(m_mutex);
    std::vector<InputRecord> out;
    for (const auto& [n, r] : m_records)
        if (!r.outcome)
            out.push_back(r);
    return out;
}

bool InputQueue::complete(std::int64_t number, const InputOutcome& outcome)
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(number);
    if (it == m_records.end() || it->second.outcome)
        return false;

    it->second.outcome = outcome;
    --m_pending;
    ++m_completed;
    pruneLocked();
    return true;
}

std::optional<InputRecord> InputQueue::get(std::int64_t number) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(number);
    if (it == m_records.end())
        return std::nullopt;
    return it->second;
}

std::size_t InputQueue::pendingCount() const
{
    std::lock_guard lock(m_mutex);
    return m_pending;
}

std::int64_t InputQueue::nextNumber() const
{
    std::lock_guard lock(m_mutex);
    return m_nextNumber;
}

// Oldest completed records go first; unresolved ones are never dropped.
void InputQueue::pruneLocked()
{
    for (auto it = m_records.begin(); m_completed > m_retainCompleted && it != m_records.end();)
    {
        if (it->second.outcome)
        {
            it = m_records.erase(it);
            --m_completed;
        }
        else
        {
            ++it;
        }
    }
}

} // namespace townsim::engine
