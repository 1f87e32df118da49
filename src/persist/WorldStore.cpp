#include "townsim/persist/WorldStore.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"
#include "townsim/persist/SaveFormat.hpp"

#include <memory>

namespace townsim::persist {

using json = nlohmann::json;

bool SaveWorld(const std::filesystem::path& path,
               const std::string& worldId,
               const engine::Checkpoint& cp,
               std::string* outError) noexcept
{
    try
    {
        if (!cp.world)
        {
            if (outError)
                *outError = "No world to save";
            return false;
        }

        json j;
        j["format"]  = savefmt::kWorldFormat;
        j["version"] = savefmt::kWorldVersion;
        j["worldId"] = worldId;
        j["engine"]  = engine::EngineStateToJson(cp.state);
        j["map"]     = cp.world->map().toJson();
        j["world"]   = cp.world->toJson();

        return core::json_util::WriteFileAtomic(path, j.dump(), outError);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = std::string("Failed to serialise world: ") + e.what();
        return false;
    }
}

bool LoadWorld(const std::filesystem::path& path, LoadedWorld& out, std::string* outError) noexcept
{
    using namespace core::json_util;

    json j;
    if (!ParseJsonFile(path, j, outError))
        return false;

    if (!j.is_object() || ObjString(j, "format", "") != savefmt::kWorldFormat)
    {
        if (outError)
            *outError = "Unsupported world format in '" + path.string() + "'";
        return false;
    }

    const int version = ObjInt(j, "version", 0);
    if (version < 1 || version > savefmt::kWorldVersion)
    {
        if (outError)
            *outError = "Unsupported world version " + std::to_string(version);
        return false;
    }

    try
    {
        auto map = std::make_shared<const world::WorldMap>(world::WorldMap::fromJson(j.at("map")));
        world::World w = world::World::fromJson(j.at("world"), map);

        const auto broken = w.checkInvariants();
        if (!broken.empty())
        {
            if (outError)
                *outError = "World in '" + path.string() + "' is inconsistent: " + broken.front();
            return false;
        }

        out.worldId = ObjString(j, "worldId", path.stem().string());
        out.state   = j.contains("engine") ? engine::EngineStateFromJson(j.at("engine")) : engine::EngineState{};
        out.world   = std::move(w);
        return true;
    }
    catch (const json::exception& e)
    {
        if (outError)
            *outError = "Malformed world '" + path.string() + "': " + e.what();
        return false;
    }
    catch (const core::ValidationError& e)
    {
        if (outError)
            *outError = "Malformed world '" + path.string() + "': " + e.what();
        return false;
    }
}

} // namespace townsim::persist
