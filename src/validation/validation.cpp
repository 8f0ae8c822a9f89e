#include "validation.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace validation {
    namespace {
        bool is_ascii_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 && static_cast<unsigned char>(c) < 0x80; }

        // Every code point a letter or digit. Malformed UTF-8 is not.
        bool is_word_needle(std::string_view needle) {
            size_t pos = 0;
            while (pos < needle.size()) {
                const auto cp = string_utils::next_code_point(needle, pos);
                if (!cp || !string_utils::is_alphanumeric(*cp)) {
                    return false;
                }
            }
            return true;
        }

        std::string format_list(const std::vector<std::string>& items) {
            std::string out = "[";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += "\"" + items[i] + "\"";
            }
            out += "]";
            return out;
        }
    }  // namespace

    void enforce_https_policy(std::string_view url, const config::RunConfig& cfg, ValidationReport& report) {
        if (!cfg.https_required_) {
            report.https_policy_ok_ = true;
            return;
        }

        if (string_utils::ieq_prefix(url.data(), url.size(), constants::HTTPS_SCHEME)) {
            report.https_policy_ok_ = true;
        } else {
            report.https_policy_ok_ = false;
            report.issues_.emplace_back("HTTPS required by policy, but URL is not https");
        }
    }

    void validate_response(const http::model::Response& resp, const config::RunConfig& cfg, ValidationReport& report) {
        validate_headers(resp, cfg, report);

        if (!cfg.has_body_rules()) {
            report.body_ok_ = true;
            return;
        }

        const std::string_view raw = std::string_view(resp.body_).substr(0, cfg.max_body_bytes_);
        BodyCheck body = check_body_text(string_utils::to_valid_utf8(raw), cfg);
        report.body_ok_ = body.ok_;
        report.issues_.insert(report.issues_.end(), std::make_move_iterator(body.issues_.begin()), std::make_move_iterator(body.issues_.end()));
    }

    void validate_headers(const http::model::Response& resp, const config::RunConfig& cfg, ValidationReport& report) {
        bool ok = true;

        for (const auto& name : cfg.required_headers_) {
            if (!resp.header(name)) {
                ok = false;
                report.issues_.push_back("Missing header: " + name);
            }
        }

        if (!cfg.content_type_allowlist_.empty()) {
            const auto content_type = resp.header(constants::CONTENT_TYPE_HEADER);
            if (content_type) {
                const std::string lower = string_utils::to_lower(*content_type);
                const bool allowed = std::any_of(cfg.content_type_allowlist_.begin(), cfg.content_type_allowlist_.end(),
                                                 [&lower](const std::string& prefix) { return lower.starts_with(string_utils::to_lower(prefix)); });
                if (!allowed) {
                    ok = false;
                    report.issues_.push_back("Content-Type not allowed: " + *content_type);
                }
            } else {
                ok = false;
                report.issues_.push_back(std::string("Missing header: ") + constants::CONTENT_TYPE_HEADER);
            }
        }

        for (const auto& [name, expected] : cfg.header_equals_) {
            const auto value = resp.header(name);
            if (!value) {
                ok = false;
                report.issues_.push_back("Missing header: " + name);
            } else if (*value != expected) {
                ok = false;
                report.issues_.push_back("Header " + name + " mismatch: got '" + *value + "', expected '" + expected + "'");
            }
        }

        for (const auto& [name, needle] : cfg.header_contains_) {
            const auto value = resp.header(name);
            if (!value) {
                ok = false;
                report.issues_.push_back("Missing header: " + name);
            } else if (value->find(needle) == std::string::npos) {
                ok = false;
                report.issues_.push_back("Header " + name + " does not contain '" + needle + "': got '" + *value + "'");
            }
        }

        report.header_ok_ = ok;
    }

    BodyCheck check_body_text(std::string_view text, const config::RunConfig& cfg) {
        BodyCheck out;

        for (const auto& needle : cfg.body_contains_all_) {
            if (!contains_token(text, needle)) {
                out.issues_.push_back("Body missing required text: '" + needle + "'");
            }
        }
        out.ok_ = out.issues_.empty();

        if (!cfg.body_contains_any_.empty()) {
            const bool any_hit = std::any_of(cfg.body_contains_any_.begin(), cfg.body_contains_any_.end(),
                                             [text](const std::string& needle) { return contains_token(text, needle); });
            if (!any_hit) {
                out.issues_.push_back("Body did not contain ANY of: " + format_list(cfg.body_contains_any_));
            }
            out.ok_ = out.ok_ && any_hit;
        }

        return out;
    }

    bool contains_token(std::string_view text, std::string_view needle) {
        if (needle.empty()) {
            return true;
        }

        if (!is_word_needle(needle)) {
            return text.find(needle) != std::string_view::npos;
        }

        size_t from = 0;
        while (from < text.size()) {
            const size_t start = text.find(needle, from);
            if (start == std::string_view::npos) {
                return false;
            }

            const size_t end = start + needle.size();
            const bool left_ok = start == 0 || !is_ascii_alnum(text[start - 1]);
            const bool right_ok = end >= text.size() || !is_ascii_alnum(text[end]);
            if (left_ok && right_ok) {
                return true;
            }

            from = start + 1;
        }
        return false;
    }

}  // namespace validation
