#pragma once

// Identifiers for files written under the data directory.
namespace townsim::persist::savefmt {

inline constexpr const char* kWorldFormat    = "Townsim.World";
// Version history (world snapshot JSON)
//  v1: engine counters + map + world (players, agents, conversations, archives)
inline constexpr int         kWorldVersion   = 1;

inline constexpr const char* kInputLogSuffix = ".inputs.jsonl";
inline constexpr const char* kWorldSuffix    = ".world.json";
inline constexpr const char* kChannelsFile   = "channels.json";

} // namespace townsim::persist::savefmt
