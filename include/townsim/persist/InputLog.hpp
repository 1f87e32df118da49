#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "townsim/engine/Input.hpp"

namespace townsim::persist {

// Append-only JSON-lines journal of one engine's inputs. Each line is either
// a submission or a completion; replay merges them by input number.
class InputLog final : public engine::InputJournal {
public:
    explicit InputLog(std::filesystem::path path);
    ~InputLog() override;

    InputLog(const InputLog&) = delete;
    InputLog& operator=(const InputLog&) = delete;

    [[nodiscard]] bool open(std::string* outError = nullptr);
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    void recordSubmitted(const engine::InputRecord& r) override;
    void recordCompleted(std::int64_t number, const engine::InputOutcome& o) override;

    // Rewrites the file keeping inputs numbered >= keepFrom plus any input
    // that never completed.
    [[nodiscard]] bool compact(std::int64_t keepFrom, std::string* outError = nullptr);

    // Records in number order. A missing file is an empty log. Malformed
    // lines (a torn final write) are skipped.
    [[nodiscard]] static bool Replay(const std::filesystem::path& path,
                                     std::vector<engine::InputRecord>& out,
                                     std::string* outError = nullptr) noexcept;

private:
    void writeLine(const std::string& line);

    std::filesystem::path m_path;
    std::mutex            m_mutex;
    std::ofstream         m_out;
    bool                  m_reportedError = false;
};

} // namespace townsim::persist
