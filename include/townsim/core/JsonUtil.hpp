#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

// Tolerant readers for JSON documents written by us or by operators.
// Missing or mistyped values fall back to the supplied default.
namespace townsim::core::json_util {

using json = nlohmann::json;

[[nodiscard]] inline bool IsNumber(const json& v) noexcept
{
    return v.is_number_integer() || v.is_number_unsigned() || v.is_number_float();
}

[[nodiscard]] inline std::int64_t SafeInt64(const json& v, std::int64_t def) noexcept
{
    if (!IsNumber(v))
        return def;
    if (v.is_number_integer())
        return v.get<std::int64_t>();
    if (v.is_number_unsigned())
        return static_cast<std::int64_t>(v.get<std::uint64_t>());
    return static_cast<std::int64_t>(v.get<double>());
}

[[nodiscard]] inline bool SafeBool(const json& v, bool def) noexcept
{
    if (v.is_boolean())
        return v.get<bool>();
    if (IsNumber(v))
        return SafeInt64(v, def ? 1 : 0) != 0;
    return def;
}

[[nodiscard]] inline std::int64_t ObjInt64(const json& obj, const char* key, std::int64_t def) noexcept
{
    if (!obj.is_object())
        return def;
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    return SafeInt64(*it, def);
}

[[nodiscard]] inline int ObjInt(const json& obj, const char* key, int def) noexcept
{
    return static_cast<int>(ObjInt64(obj, key, def));
}

[[nodiscard]] inline double ObjDouble(const json& obj, const char* key, double def) noexcept
{
    if (!obj.is_object())
        return def;
    auto it = obj.find(key);
    if (it == obj.end() || !IsNumber(*it))
        return def;
    return it->get<double>();
}

[[nodiscard]] inline bool ObjBool(const json& obj, const char* key, bool def) noexcept
{
    if (!obj.is_object())
        return def;
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    return SafeBool(*it, def);
}

[[nodiscard]] inline std::string ObjString(const json& obj, const char* key, const std::string& def) noexcept
{
    if (!obj.is_object())
        return def;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return def;
    return it->get<std::string>();
}

[[nodiscard]] inline const json* ObjFind(const json& obj, const char* key) noexcept
{
    if (!obj.is_object())
        return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    return &*it;
}

// Whole-file helpers. Return false (and fill outError) instead of throwing.
[[nodiscard]] bool ReadFileToString(const std::filesystem::path& path,
                                    std::string& out,
                                    std::string* outError = nullptr) noexcept;

[[nodiscard]] bool ParseJsonFile(const std::filesystem::path& path,
                                 json& out,
                                 std::string* outError = nullptr) noexcept;

// Write to a sibling temp file, then rename over the destination.
[[nodiscard]] bool WriteFileAtomic(const std::filesystem::path& path,
                                   const std::string& bytes,
                                   std::string* outError = nullptr) noexcept;

} // namespace townsim::core::json_util
