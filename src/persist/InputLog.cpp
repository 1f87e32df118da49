#include "townsim/persist/InputLog.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"

#include <map>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace townsim::persist {

using json = nlohmann::json;

namespace {

json SubmittedLine(const engine::InputRecord& r)
{
    return { {"type", "submitted"},
             {"number", r.number},
             {"received", r.received},
             {"name", r.name},
             {"args", r.args} };
}

json CompletedLine(std::int64_t number, const engine::InputOutcome& o)
{
    return { {"type", "completed"}, {"number", number}, {"outcome", engine::OutcomeToJson(o)} };
}

} // namespace

InputLog::InputLog(fs::path path)
    : m_path(std::move(path))
{
}

InputLog::~InputLog()
{
    std::lock_guard lock(m_mutex);
    if (m_out.is_open())
        m_out.flush();
}

bool InputLog::open(std::string* outError)
{
    std::lock_guard lock(m_mutex);
    std::error_code ec;
    if (m_path.has_parent_path())
        fs::create_directories(m_path.parent_path(), ec);

    m_out.open(m_path, std::ios::binary | std::ios::app);
    if (!m_out)
    {
        if (outError)
            *outError = "Failed to open input log '" + m_path.string() + "'";
        return false;
    }
    return true;
}

void InputLog::writeLine(const std::string& line)
{
    if (!m_out.is_open())
        return;
    m_out << line << '\n';
    m_out.flush();
    if (!m_out && !m_reportedError)
    {
        m_reportedError = true;
        spdlog::error("Write to input log '{}' failed; inputs are no longer durable", m_path.string());
    }
}

void InputLog::recordSubmitted(const engine::InputRecord& r)
{
    const std::string line = SubmittedLine(r).dump();
    std::lock_guard lock(m_mutex);
    writeLine(line);
}

void InputLog::recordCompleted(std::int64_t number, const engine::InputOutcome& o)
{
    const std::string line = CompletedLine(number, o).dump();
    std::lock_guard lock(m_mutex);
    writeLine(line);
}

bool InputLog::Replay(const fs::path& path, std::vector<engine::InputRecord>& out, std::string* outError) noexcept
{
    using namespace core::json_util;
    out.clear();

    std::error_code ec;
    if (!fs::exists(path, ec))
        return true;

    std::string text;
    if (!ReadFileToString(path, text, outError))
        return false;

    try
    {
        std::map<std::int64_t, engine::InputRecord> byNumber;
        std::map<std::int64_t, engine::InputOutcome> outcomes;
        std::istringstream in(text);
        std::string line;
        std::size_t lineNo = 0, skipped = 0;

        while (std::getline(in, line))
        {
            ++lineNo;
            if (line.empty())
                continue;

            const json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
            if (j.is_discarded() || !j.is_object())
            {
                ++skipped;
                continue;
            }

            const std::string type = ObjString(j, "type", "");
            const std::int64_t number = ObjInt64(j, "number", -1);
            if (number < 0)
            {
                ++skipped;
                continue;
            }

            if (type == "submitted")
            {
                engine::InputRecord r;
                r.number   = number;
                r.received = ObjInt64(j, "received", 0);
                r.name     = ObjString(j, "name", "");
                r.args     = j.contains("args") ? j.at("args") : json::object();
                try
                {
                    r.command = engine::ParseCommand(r.name, r.args);
                }
                catch (const core::ValidationError& e)
                {
                    r.outcome = engine::InputOutcome::Error(core::ErrorKind::Validation, e.what(), r.received);
                }
                byNumber[number] = std::move(r);
            }
            else if (type == "completed")
            {
                // An input re-applied after a restart is completed again; the
                // latest completion wins.
                if (const json* o = ObjFind(j, "outcome"))
                    outcomes[number] = engine::OutcomeFromJson(*o);
            }
            else
            {
                ++skipped;
            }
        }

        for (auto& [n, o] : outcomes)
        {
            auto it = byNumber.find(n);
            if (it != byNumber.end() && !it->second.outcome)
                it->second.outcome = std::move(o);
        }

        out.reserve(byNumber.size());
        for (auto& [n, r] : byNumber)
            out.push_back(std::move(r));

        if (skipped > 0)
            spdlog::warn("Input log '{}': skipped {} of {} line(s)", path.string(), skipped, lineNo);
        return true;
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = "Failed to replay '" + path.string() + "': " + e.what();
        return false;
    }
}

bool InputLog::compact(std::int64_t keepFrom, std::string* outError)
{
    std::lock_guard lock(m_mutex);
    if (m_out.is_open())
        m_out.close();

    std::vector<engine::InputRecord> records;
    bool ok = Replay(m_path, records, outError);

    if (ok)
    {
        std::string bytes;
        for (const engine::InputRecord& r : records)
        {
            if (r.number < keepFrom && r.outcome)
                continue;
            bytes += SubmittedLine(r).dump();
            bytes += '\n';
            if (r.outcome)
            {
                bytes += CompletedLine(r.number, *r.outcome).dump();
                bytes += '\n';
            }
        }
        ok = core::json_util::WriteFileAtomic(m_path, bytes, outError);
    }

    m_out.open(m_path, std::ios::binary | std::ios::app);
    if (!m_out)
    {
        if (outError)
            *outError = "Failed to reopen input log '" + m_path.string() + "'";
        return false;
    }
    return ok;
}

} // namespace townsim::persist
