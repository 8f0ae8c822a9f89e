#ifndef UPTIME_WATCH_STRING_UTILS_HPP
#define UPTIME_WATCH_STRING_UTILS_HPP

#include <string>
#include <optional>
#include <string_view>

namespace string_utils {
    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);

    std::string to_lower(std::string_view s);

    std::string trim(std::string s);

    // Invalid UTF-8 sequences are replaced with U+FFFD.
    std::string to_valid_utf8(std::string_view bytes);

    // Decodes the code point starting at `pos` and advances `pos` past it.
    // std::nullopt (with `pos` moved one byte) on a malformed sequence.
    std::optional<char32_t> next_code_point(std::string_view bytes, size_t& pos);

    // Letters and digits. Outside ASCII, code points in the punctuation,
    // symbol and space blocks are rejected; other scripts are accepted.
    bool is_alphanumeric(char32_t cp);
}  // namespace string_utils

#endif
