#include "townsim/engine/Input.hpp"

#include "townsim/core/JsonUtil.hpp"

namespace townsim::engine {

using json = nlohmann::json;

json OutcomeToJson(const InputOutcome& o)
{
    if (o.ok)
        return { {"kind", "ok"}, {"value", o.value}, {"completedAt", o.completedAt} };
    return {
        {"kind", "error"},
        {"errorKind", core::ErrorKindName(o.errorKind)},
        {"message", o.message},
        {"completedAt", o.completedAt},
    };
}

InputOutcome OutcomeFromJson(const json& j)
{
    using namespace core::json_util;
    const TimeMs at = ObjInt64(j, "completedAt", 0);
    if (ObjString(j, "kind", "error") == "ok")
        return InputOutcome::Ok(j.contains("value") ? j.at("value") : json(), at);
    return InputOutcome::Error(core::ErrorKindFromName(ObjString(j, "errorKind", "internal")),
                               ObjString(j, "message", ""), at);
}

json InputToJson(const InputRecord& r)
{
    json j = {
        {"number", r.number},
        {"received", r.received},
        {"name", r.name},
        {"args", r.args},
    };
    j["returnValue"] = r.outcome ? OutcomeToJson(*r.outcome) : json();
    return j;
}

} // namespace townsim::engine
