#pragma once

#include <cstdint>
#include <optional>
#include <span>

namespace bimview::app {

struct AppArgs {
    std::uint32_t frames = 300;
    std::uint32_t floors = 4;
    // Instances per floor along x and z.
    std::uint32_t grid = 8;
    bool help = false;
};

// Accepts --frames N, --floors N, --grid N and --help. Returns nullopt and
// logs the offending argument on anything else.
[[nodiscard]] std::optional<AppArgs> parseAppArgs(std::span<const char* const> args);

void printUsage(const char* program);

} // namespace bimview::app
