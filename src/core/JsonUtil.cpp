#include "townsim/core/JsonUtil.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace townsim::core::json_util {

namespace {

constexpr std::size_t kMaxFileBytes = 512u * 1024u * 1024u; // 512 MiB guardrail

void SetError(std::string* outError, std::string msg)
{
    if (outError)
        *outError = std::move(msg);
}

} // namespace

bool ReadFileToString(const fs::path& path, std::string& out, std::string* outError) noexcept
{
    try
    {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec)
        {
            SetError(outError, "Failed to stat '" + path.string() + "': " + ec.message());
            return false;
        }
        if (size > kMaxFileBytes)
        {
            SetError(outError, "File '" + path.string() + "' is too large");
            return false;
        }

        std::ifstream f(path, std::ios::binary);
        if (!f)
        {
            SetError(outError, "Failed to open '" + path.string() + "'");
            return false;
        }

        std::ostringstream ss;
        ss << f.rdbuf();
        out = ss.str();
        return true;
    }
    catch (const std::exception& e)
    {
        SetError(outError, std::string("Failed to read '") + path.string() + "': " + e.what());
        return false;
    }
}

bool ParseJsonFile(const fs::path& path, json& out, std::string* outError) noexcept
{
    std::string text;
    if (!ReadFileToString(path, text, outError))
        return false;

    out = json::parse(text, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (out.is_discarded())
    {
        SetError(outError, "Malformed JSON in '" + path.string() + "'");
        return false;
    }
    return true;
}

bool WriteFileAtomic(const fs::path& path, const std::string& bytes, std::string* outError) noexcept
{
    try
    {
        std::error_code ec;
        if (path.has_parent_path())
            fs::create_directories(path.parent_path(), ec);

        fs::path tmp = path;
        tmp += ".tmp";

        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            if (!f)
            {
                SetError(outError, "Failed to open '" + tmp.string() + "' for writing");
                return false;
            }
            f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            f.flush();
            if (!f)
            {
                SetError(outError, "Failed to write '" + tmp.string() + "'");
                return false;
            }
        }

        fs::rename(tmp, path, ec);
        if (ec)
        {
            SetError(outError, "Failed to publish '" + path.string() + "': " + ec.message());
            std::error_code rmEc;
            fs::remove(tmp, rmEc);
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        SetError(outError, std::string("Failed to write '") + path.string() + "': " + e.what());
        return false;
    }
}

} // namespace townsim::core::json_util
