#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace townsim::core {

// Milliseconds. All simulation timestamps use this unit.
using TimeMs = std::int64_t;

// Longest activity a command may request (one week).
inline constexpr TimeMs kMaxActivityMs = 7LL * 24 * 60 * 60 * 1000;

class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual TimeMs now() const = 0;
};

// Wall clock (Unix epoch, ms).
class SystemClock final : public IClock {
public:
    [[nodiscard]] TimeMs now() const override
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }
};

// Hand-advanced clock for tests and deterministic replays.
class ManualClock final : public IClock {
public:
    explicit ManualClock(TimeMs start = 0) noexcept : m_now(start) {}

    [[nodiscard]] TimeMs now() const override { return m_now.load(std::memory_order_acquire); }

    void set(TimeMs t) noexcept { m_now.store(t, std::memory_order_release); }
    void advance(TimeMs dt) noexcept { m_now.fetch_add(dt, std::memory_order_acq_rel); }

private:
    std::atomic<TimeMs> m_now;
};

} // namespace townsim::core
