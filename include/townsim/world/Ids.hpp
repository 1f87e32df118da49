#pragma once

#include <charconv>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "townsim/core/Errors.hpp"

namespace townsim::world {

// Every id is allocated from the owning world's single counter and rendered
// with a type prefix ("p:7"), so ids of different kinds never collide.
template <char Prefix>
struct GameId {
    std::int64_t n = 0;

    constexpr auto operator<=>(const GameId&) const = default;

    [[nodiscard]] static constexpr char prefix() noexcept { return Prefix; }

    [[nodiscard]] std::string str() const
    {
        return std::string(1, Prefix) + ":" + std::to_string(n);
    }

    [[nodiscard]] static std::optional<GameId> parse(std::string_view s) noexcept
    {
        if (s.size() < 3 || s[0] != Prefix || s[1] != ':')
            return std::nullopt;
        std::int64_t v = 0;
        const char* first = s.data() + 2;
        const char* last  = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec != std::errc{} || ptr != last || v < 0)
            return std::nullopt;
        return GameId{ v };
    }
};

using PlayerId       = GameId<'p'>;
using AgentId        = GameId<'a'>;
using ConversationId = GameId<'c'>;
using OperationId    = GameId<'o'>;

template <char Prefix>
void to_json(nlohmann::json& j, const GameId<Prefix>& id)
{
    j = id.str();
}

template <char Prefix>
void from_json(const nlohmann::json& j, GameId<Prefix>& id)
{
    if (!j.is_string())
        throw core::ValidationError("expected an id string");
    auto parsed = GameId<Prefix>::parse(j.get_ref<const std::string&>());
    if (!parsed)
        throw core::ValidationError("malformed id '" + j.get<std::string>() + "'");
    id = *parsed;
}

} // namespace townsim::world
