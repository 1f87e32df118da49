#pragma once

#include <mutex>
#include <set>
#include <string>

namespace townsim::recovery {

// External records that keep agents alive (bot registrations, accounts).
class OwnerDirectory {
public:
    virtual ~OwnerDirectory() = default;
    [[nodiscard]] virtual bool ownerExists(const std::string& ownerId) const = 0;
};

// In-process directory fed by the admin surface.
class InMemoryOwnerDirectory final : public OwnerDirectory {
public:
    void add(const std::string& ownerId)
    {
        std::lock_guard lock(m_mutex);
        m_owners.insert(ownerId);
    }

    void remove(const std::string& ownerId)
    {
        std::lock_guard lock(m_mutex);
        m_owners.erase(ownerId);
    }

    [[nodiscard]] bool ownerExists(const std::string& ownerId) const override
    {
        std::lock_guard lock(m_mutex);
        return m_owners.count(ownerId) != 0;
    }

private:
    mutable std::mutex    m_mutex;
    std::set<std::string> m_owners;
};

} // namespace townsim::recovery
