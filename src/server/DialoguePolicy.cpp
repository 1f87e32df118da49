#include "townsim/server/DialoguePolicy.hpp"

#include "townsim/core/Hash.hpp"

namespace townsim::server {

namespace {

// "{partner}" is replaced by the partner's name.
std::string Fill(const std::string& line, const std::string& partner)
{
    static const std::string kKey = "{partner}";
    std::string out = line;
    for (auto pos = out.find(kKey); pos != std::string::npos; pos = out.find(kKey, pos + partner.size()))
        out.replace(pos, kKey.size(), partner);
    return out;
}

const std::string& Pick(const std::vector<std::string>& lines, std::size_t salt)
{
    return lines[salt % lines.size()];
}

} // namespace

TemplateDialoguePolicy::TemplateDialoguePolicy()
{
    setLines("default",
             { "Hi {partner}, how is your day going?", "Good to see you, {partner}." },
             { "I was just thinking the same thing.", "Busy day around town.", "Really? Tell me more." },
             { "I should get going. See you around, {partner}.", "Catch you later." });

    setLines("WORKER",
             { "Morning {partner}. Plenty to do today.", "Hey {partner}, got a minute between shifts?" },
             { "The market stalls need restocking again.", "Honest work pays off.", "I'll lend a hand if you need one." },
             { "Back to work for me.", "Shift starts soon, take care {partner}." });

    setLines("GAMBLER",
             { "{partner}! Feeling lucky today?", "Bet you can't guess what I won last night, {partner}." },
             { "Odds are better than they look.", "Double or nothing?", "The house doesn't always win." },
             { "The tables are calling.", "Wish me luck, {partner}." });

    setLines("CRIMINAL",
             { "Keep your voice down, {partner}.", "You didn't see me here, {partner}." },
             { "Nobody needs to know about that.", "I know a guy who can help.", "Watch the corners." },
             { "I was never here.", "We'll talk later. Somewhere quieter." });
}

void TemplateDialoguePolicy::setLines(const std::string& personality,
                                      std::vector<std::string> openers,
                                      std::vector<std::string> replies,
                                      std::vector<std::string> farewells)
{
    Lines& l = m_lines[personality];
    if (!openers.empty())   l.openers = std::move(openers);
    if (!replies.empty())   l.replies = std::move(replies);
    if (!farewells.empty()) l.farewells = std::move(farewells);
}

const TemplateDialoguePolicy::Lines& TemplateDialoguePolicy::linesFor(const std::string& personality) const
{
    auto it = m_lines.find(personality);
    if (it != m_lines.end() && !it->second.openers.empty() && !it->second.replies.empty() &&
        !it->second.farewells.empty())
        return it->second;
    return m_lines.at("default");
}

std::string TemplateDialoguePolicy::compose(const DialogueContext& ctx) const
{
    const Lines& l = linesFor(ctx.personality);
    const auto salt = static_cast<std::size_t>(
        core::hash64(core::hash_string(ctx.speaker) + static_cast<std::uint64_t>(ctx.messageIndex)));

    if (ctx.closing)
        return Fill(Pick(l.farewells, salt), ctx.partner);
    if (ctx.messageIndex == 0)
        return Fill(Pick(l.openers, salt), ctx.partner);
    return Fill(Pick(l.replies, salt), ctx.partner);
}

} // namespace townsim::server
