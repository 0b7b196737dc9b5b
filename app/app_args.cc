#include "app/app_args.h"

#include "core/log.h"

#include <charconv>
#include <iostream>
#include <string_view>

namespace bimview::app {

namespace {

constexpr std::uint32_t kMaxFloors = 200;
constexpr std::uint32_t kMaxGrid = 256;

std::optional<std::uint32_t> parseCount(std::string_view text) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<AppArgs> parseAppArgs(std::span<const char* const> args) {
    AppArgs result;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i] != nullptr ? std::string_view(args[i]) : std::string_view{};
        if (arg == "--help" || arg == "-h") {
            result.help = true;
            continue;
        }

        std::uint32_t* target = nullptr;
        std::uint32_t minValue = 1;
        std::uint32_t maxValue = 0xFFFFFFFFu;
        if (arg == "--frames") {
            target = &result.frames;
            minValue = 0;
        } else if (arg == "--floors") {
            target = &result.floors;
            maxValue = kMaxFloors;
        } else if (arg == "--grid") {
            target = &result.grid;
            maxValue = kMaxGrid;
        } else {
            BIM_LOGE("app") << "unknown argument: " << arg;
            return std::nullopt;
        }

        if (i + 1 >= args.size() || args[i + 1] == nullptr) {
            BIM_LOGE("app") << arg << " expects a value";
            return std::nullopt;
        }
        const std::string_view valueText(args[++i]);
        const std::optional<std::uint32_t> value = parseCount(valueText);
        if (!value.has_value() || *value < minValue || *value > maxValue) {
            BIM_LOGE("app") << "invalid value for " << arg << ": " << valueText
                            << " (expected " << minValue << ".." << maxValue << ")";
            return std::nullopt;
        }
        *target = *value;
    }
    return result;
}

void printUsage(const char* program) {
    std::cout << "usage: " << (program != nullptr ? program : "bimview_app")
              << " [--frames N] [--floors N] [--grid N]\n"
              << "  --frames N   frames to render along the camera path (default 300)\n"
              << "  --floors N   building floors (1.." << kMaxFloors << ", default 4)\n"
              << "  --grid N     instances per floor edge (1.." << kMaxGrid << ", default 8)\n"
              << "Render options come from BIMVIEW_* environment variables.\n";
}

} // namespace bimview::app
