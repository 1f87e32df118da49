#include "townsim/channels/Channel.hpp"

#include "townsim/core/JsonUtil.hpp"

namespace townsim::channels {

using json = nlohmann::json;

const char* ChannelTypeName(ChannelType t) noexcept
{
    switch (t)
    {
    case ChannelType::General:    return "GENERAL";
    case ChannelType::Regional:   return "REGIONAL";
    case ChannelType::Event:      return "EVENT";
    case ChannelType::Restricted: return "RESTRICTED";
    case ChannelType::Test:       return "TEST";
    }
    return "GENERAL";
}

std::optional<ChannelType> ChannelTypeFromName(const std::string& s) noexcept
{
    if (s == "GENERAL")    return ChannelType::General;
    if (s == "REGIONAL")   return ChannelType::Regional;
    if (s == "EVENT")      return ChannelType::Event;
    if (s == "RESTRICTED") return ChannelType::Restricted;
    if (s == "TEST")       return ChannelType::Test;
    return std::nullopt;
}

const char* ChannelStatusName(ChannelStatus s) noexcept
{
    switch (s)
    {
    case ChannelStatus::Active:      return "ACTIVE";
    case ChannelStatus::Full:        return "FULL";
    case ChannelStatus::Draining:    return "DRAINING";
    case ChannelStatus::Maintenance: return "MAINTENANCE";
    }
    return "ACTIVE";
}

std::optional<ChannelStatus> ChannelStatusFromName(const std::string& s) noexcept
{
    if (s == "ACTIVE")      return ChannelStatus::Active;
    if (s == "FULL")        return ChannelStatus::Full;
    if (s == "DRAINING")    return ChannelStatus::Draining;
    if (s == "MAINTENANCE") return ChannelStatus::Maintenance;
    return std::nullopt;
}

json ChannelToJson(const Channel& c)
{
    json j = {
        {"id", c.id},
        {"name", c.name},
        {"zone", c.zone},
        {"type", ChannelTypeName(c.type)},
        {"status", ChannelStatusName(c.status)},
        {"currentBots", c.currentBots},
        {"maxBots", c.maxBots},
        {"worldId", c.worldId},
        {"region", c.region},
        {"isDefault", c.isDefault},
        {"needsWorldReassignment", c.needsWorldReassignment},
        {"createdAt", c.createdAt},
        {"seq", c.seq},
        {"loadPercent", c.loadPercent()},
    };
    j["overCapacityUntil"] = c.overCapacityUntil ? json(*c.overCapacityUntil) : json();
    j["emptySince"] = c.emptySince ? json(*c.emptySince) : json();
    return j;
}

Channel ChannelFromJson(const json& j)
{
    using namespace core::json_util;
    Channel c;
    c.id          = j.at("id").get<std::string>();
    c.name        = ObjString(j, "name", c.id);
    c.zone        = j.at("zone").get<std::string>();
    c.type        = ChannelTypeFromName(ObjString(j, "type", "GENERAL")).value_or(ChannelType::General);
    c.status      = ChannelStatusFromName(ObjString(j, "status", "ACTIVE")).value_or(ChannelStatus::Active);
    c.currentBots = std::max(0, ObjInt(j, "currentBots", 0));
    c.maxBots     = std::max(1, ObjInt(j, "maxBots", 30));
    c.worldId     = ObjString(j, "worldId", "");
    c.region      = ObjString(j, "region", "");
    c.isDefault   = ObjBool(j, "isDefault", false);
    c.needsWorldReassignment = ObjBool(j, "needsWorldReassignment", false);
    c.createdAt   = ObjInt64(j, "createdAt", 0);
    c.seq         = ObjInt64(j, "seq", 0);
    if (const json* v = ObjFind(j, "overCapacityUntil"); v && IsNumber(*v))
        c.overCapacityUntil = SafeInt64(*v, 0);
    if (const json* v = ObjFind(j, "emptySince"); v && IsNumber(*v))
        c.emptySince = SafeInt64(*v, 0);
    return c;
}

} // namespace townsim::channels
