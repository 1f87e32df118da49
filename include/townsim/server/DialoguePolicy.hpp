#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace townsim::server {

struct DialogueContext {
    std::string  speaker;
    std::string  personality;
    std::string  partner;
    std::int64_t messageIndex = 0;   // messages already in the conversation
    bool         closing = false;    // last message before the speaker leaves
};

// Produces the text an agent says. Implementations must be deterministic for
// a given context so replays produce the same conversation.
class DialoguePolicy {
public:
    virtual ~DialoguePolicy() = default;
    [[nodiscard]] virtual std::string compose(const DialogueContext& ctx) const = 0;
};

// Fixed lines per personality tag; unknown tags use the "default" set.
class TemplateDialoguePolicy final : public DialoguePolicy {
public:
    TemplateDialoguePolicy();

    void setLines(const std::string& personality,
                  std::vector<std::string> openers,
                  std::vector<std::string> replies,
                  std::vector<std::string> farewells);

    [[nodiscard]] std::string compose(const DialogueContext& ctx) const override;

private:
    struct Lines {
        std::vector<std::string> openers;
        std::vector<std::string> replies;
        std::vector<std::string> farewells;
    };

    [[nodiscard]] const Lines& linesFor(const std::string& personality) const;

    std::map<std::string, Lines> m_lines;
};

} // namespace townsim::server
