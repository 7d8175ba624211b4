#include "landfall/transport/TransportConfig.hpp"
#include "logging/Log.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace landfall::transport {

namespace {
    constexpr int kConfigVersion = 1;

    constexpr std::int64_t kMaxDepth = 1 << 20;
    constexpr std::int64_t kMaxBoats = 10000;

    bool ReadFileToString(const std::filesystem::path& p, std::string& out) noexcept
    {
        out.clear();
        std::ifstream f(p, std::ios::binary);
        if (!f) return false;
        f.seekg(0, std::ios::end);
        const std::streamoff sz = f.tellg();
        if (sz <= 0) return false;
        f.seekg(0, std::ios::beg);
        out.resize(static_cast<std::size_t>(sz));
        f.read(out.data(), static_cast<std::streamsize>(sz));
        return static_cast<bool>(f);
    }

    // Reads an integer member clamped to [lo, hi]; leaves `dst` alone if absent or not an integer.
    void ReadClampedInt(const nlohmann::json& obj, const char* key, int& dst,
                        std::int64_t lo, std::int64_t hi)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_number_integer())
            dst = static_cast<int>(std::clamp(it->get<std::int64_t>(), lo, hi));
    }
}

bool ParseTransportConfig(std::string_view text, TransportConfig& out) noexcept
{
    // Allow // comments and avoid exceptions.
    const nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
        return false;

    TransportConfig tmp = out;

    if (const auto it = j.find("transport"); it != j.end() && it->is_object())
    {
        ReadClampedInt(*it, "boatMaxNumber",           tmp.boatMaxNumber,           0, kMaxBoats);
        ReadClampedInt(*it, "lakeSearchDepth",         tmp.lakeSearchDepth,         0, kMaxDepth);
        ReadClampedInt(*it, "terraNulliusSearchDepth", tmp.terraNulliusSearchDepth, 0, kMaxDepth);
        ReadClampedInt(*it, "borderShoreSearchDepth",  tmp.borderShoreSearchDepth,  0, kMaxDepth);
    }

    if (const auto it = j.find("sampling"); it != j.end() && it->is_object())
    {
        ReadClampedInt(*it, "divisor",     tmp.shoreSamplingDivisor, 1, 100000);
        ReadClampedInt(*it, "minInterval", tmp.minSamplingInterval,  1, 100000);
    }

    out = tmp;
    return true;
}

bool LoadTransportConfig(const std::filesystem::path& path, TransportConfig& out) noexcept
{
    std::string text;
    if (!ReadFileToString(path, text))
        return false;

    if (!ParseTransportConfig(text, out))
    {
        logsys::get()->warn("LoadTransportConfig: {} is not a JSON object", path.string());
        return false;
    }
    return true;
}

bool SaveTransportConfig(const std::filesystem::path& path, const TransportConfig& cfg) noexcept
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    nlohmann::json j;
    j["version"] = kConfigVersion;
    j["transport"] = {
        {"boatMaxNumber", cfg.boatMaxNumber},
        {"lakeSearchDepth", cfg.lakeSearchDepth},
        {"terraNulliusSearchDepth", cfg.terraNulliusSearchDepth},
        {"borderShoreSearchDepth", cfg.borderShoreSearchDepth},
    };
    j["sampling"] = {
        {"divisor", cfg.shoreSamplingDivisor},
        {"minInterval", cfg.minSamplingInterval},
    };

    std::string payload = j.dump(4);
    payload.push_back('\n');

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        logsys::get()->warn("SaveTransportConfig: cannot open {}", path.string());
        return false;
    }
    f.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    return static_cast<bool>(f);
}

} // namespace landfall::transport
