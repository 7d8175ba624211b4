#pragma once

#include <filesystem>
#include <string_view>

namespace landfall::transport {

// Tunables for transport targeting. Depth bounds are BFS levels, not distances.
struct TransportConfig
{
    // Transport ships a single player may have in flight.
    int boatMaxNumber = 3;

    // Lakes are small; a moderate bound covers them.
    int lakeSearchDepth = 300;

    // Interactive clicks on neutral land/water. Kept small for responsiveness.
    int terraNulliusSearchDepth = 50;

    // Large enough to connect any two shores on the largest supported map.
    int borderShoreSearchDepth = 10000;

    // Candidate sampling: stride = max(minSamplingInterval, ceil(shores / shoreSamplingDivisor)).
    int shoreSamplingDivisor = 50;
    int minSamplingInterval  = 10;
};

// Returns true if `text` was a JSON object and was applied.
// On failure, `out` is left unchanged (callers should initialize defaults first).
[[nodiscard]] bool ParseTransportConfig(std::string_view text, TransportConfig& out) noexcept;

// Returns true if the file existed and was successfully parsed.
[[nodiscard]] bool LoadTransportConfig(const std::filesystem::path& path, TransportConfig& out) noexcept;

// Returns true on success. Creates the parent directory if needed.
[[nodiscard]] bool SaveTransportConfig(const std::filesystem::path& path, const TransportConfig& cfg) noexcept;

} // namespace landfall::transport
