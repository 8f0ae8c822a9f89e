#include "model.hpp"

#include "../../utils/string_utils.hpp"

namespace http::model {
    std::optional<std::string> Response::header(std::string_view name) const {
        for (const auto& [key, value] : headers_) {
            if (string_utils::iequals(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }
}  // namespace http::model
