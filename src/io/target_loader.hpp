#ifndef UPTIME_WATCH_TARGET_LOADER_HPP
#define UPTIME_WATCH_TARGET_LOADER_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace io {
    // One target per line; surrounding whitespace trimmed, blank lines and
    // lines starting with '#' dropped, order preserved.
    [[nodiscard]] std::vector<std::string> parse_targets(std::string_view text);

    [[nodiscard]] std::vector<std::string> load_targets(const std::filesystem::path& path);
}  // namespace io

#endif
