#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

static constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

struct CodePointRange {
    char32_t first_;
    char32_t last_;
};

// Punctuation, symbols and spaces above ASCII.
static constexpr std::array<CodePointRange, 27> NON_ALPHANUMERIC_RANGES = {{
    {0x00A0, 0x00A9}, {0x00AB, 0x00B1}, {0x00B4, 0x00B4}, {0x00B6, 0x00B8}, {0x00BB, 0x00BB}, {0x00BF, 0x00BF},
    {0x00D7, 0x00D7}, {0x00F7, 0x00F7}, {0x02C2, 0x02C5}, {0x02D2, 0x02DF}, {0x037E, 0x037E}, {0x0387, 0x0387},
    {0x055A, 0x055F}, {0x1680, 0x1680}, {0x2000, 0x206F}, {0x20A0, 0x20CF}, {0x2190, 0x245F}, {0x2500, 0x2775},
    {0x2794, 0x2BFF}, {0x2E00, 0x2E7F}, {0x3000, 0x3004}, {0x3008, 0x3020}, {0xFE10, 0xFE6F}, {0xFF01, 0xFF0F},
    {0xFF1A, 0xFF20}, {0xFF3B, 0xFF40}, {0xFF5B, 0xFF65},
}};

static constexpr char32_t SYMBOLS_AND_EMOJI_FIRST = 0x1F000;
static constexpr char32_t SYMBOLS_AND_EMOJI_LAST = 0x1FAFF;

namespace string_utils {
    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_valid_utf8(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size());

        auto in_range = [](unsigned char c, unsigned char lo, unsigned char hi) { return c >= lo && c <= hi; };

        size_t i = 0;
        while (i < bytes.size()) {
            const auto lead = static_cast<unsigned char>(bytes[i]);

            if (lead < 0x80) {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            }

            size_t needed = 0;
            unsigned char second_lo = 0x80;
            unsigned char second_hi = 0xBF;

            if (in_range(lead, 0xC2, 0xDF)) {
                needed = 1;
            } else if (lead == 0xE0) {
                needed = 2;
                second_lo = 0xA0;
            } else if (lead == 0xED) {
                needed = 2;
                second_hi = 0x9F;
            } else if (in_range(lead, 0xE1, 0xEF)) {
                needed = 2;
            } else if (lead == 0xF0) {
                needed = 3;
                second_lo = 0x90;
            } else if (lead == 0xF4) {
                needed = 3;
                second_hi = 0x8F;
            } else if (in_range(lead, 0xF1, 0xF3)) {
                needed = 3;
            } else {
                out += REPLACEMENT_CHARACTER;
                ++i;
                continue;
            }

            // Replace the maximal valid prefix of a broken sequence with a single U+FFFD.
            size_t consumed = 1;
            bool valid = true;
            for (size_t k = 0; k < needed; ++k) {
                if (i + consumed >= bytes.size()) {
                    valid = false;
                    break;
                }
                const auto c = static_cast<unsigned char>(bytes[i + consumed]);
                const unsigned char lo = k == 0 ? second_lo : 0x80;
                const unsigned char hi = k == 0 ? second_hi : 0xBF;
                if (!in_range(c, lo, hi)) {
                    valid = false;
                    break;
                }
                ++consumed;
            }

            if (valid) {
                out.append(bytes.substr(i, consumed));
            } else {
                out += REPLACEMENT_CHARACTER;
            }
            i += consumed;
        }

        return out;
    }

    std::optional<char32_t> next_code_point(std::string_view bytes, size_t& pos) {
        const auto lead = static_cast<unsigned char>(bytes[pos]);

        size_t needed = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            ++pos;
            return lead;
        }
        if (lead >= 0xC2 && lead <= 0xDF) {
            needed = 1;
            cp = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            needed = 2;
            cp = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            needed = 3;
            cp = lead & 0x07;
        } else {
            ++pos;
            return std::nullopt;
        }

        if (pos + needed >= bytes.size()) {
            ++pos;
            return std::nullopt;
        }

        for (size_t k = 1; k <= needed; ++k) {
            const auto c = static_cast<unsigned char>(bytes[pos + k]);
            if ((c & 0xC0) != 0x80) {
                ++pos;
                return std::nullopt;
            }
            cp = (cp << 6) | (c & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF.
        const char32_t min_for_length = needed == 1 ? 0x80 : (needed == 2 ? 0x800 : 0x10000);
        if (cp < min_for_length || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            ++pos;
            return std::nullopt;
        }

        pos += needed + 1;
        return cp;
    }

    bool is_alphanumeric(char32_t cp) {
        if (cp < 0x80) {
            return std::isalnum(static_cast<int>(cp)) != 0;
        }
        if (cp >= SYMBOLS_AND_EMOJI_FIRST && cp <= SYMBOLS_AND_EMOJI_LAST) {
            return false;
        }
        return std::none_of(NON_ALPHANUMERIC_RANGES.begin(), NON_ALPHANUMERIC_RANGES.end(),
                            [cp](const CodePointRange& r) { return cp >= r.first_ && cp <= r.last_; });
    }
}  // namespace string_utils
