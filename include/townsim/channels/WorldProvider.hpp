#pragma once

#include <string>

namespace townsim::channels {

// Supplies worlds for new channels and answers liveness checks.
class WorldProvider {
public:
    virtual ~WorldProvider() = default;

    // World id for a new channel. Throws core::AllocationError when no world
    // can be provided.
    virtual std::string provideWorld(const std::string& zone, const std::string& channelName) = 0;

    [[nodiscard]] virtual bool isAlive(const std::string& worldId) const = 0;
};

} // namespace townsim::channels
