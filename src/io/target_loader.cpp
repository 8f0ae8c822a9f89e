#include "target_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "../utils/string_utils.hpp"

namespace io {
    std::vector<std::string> parse_targets(std::string_view text) {
        std::vector<std::string> targets;
        std::istringstream in{std::string(text)};
        std::string line;

        while (std::getline(in, line)) {
            line = string_utils::trim(std::move(line));
            if (line.empty() || line.front() == '#') {
                continue;
            }
            targets.push_back(std::move(line));
        }

        return targets;
    }

    std::vector<std::string> load_targets(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("Cannot open target list: " + path.string());
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad()) {
            throw std::runtime_error("Failed reading target list: " + path.string());
        }

        return parse_targets(contents.str());
    }
}  // namespace io
