#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace categorizer::utils {

bool is_absolute_url(std::string_view url);

/// Removes every trailing '/' from `url`.
std::string strip_trailing_slashes(std::string url);

/// Throws InvalidArgumentError naming `name` when `value` is empty.
const std::string& require_non_empty(const std::string& name, const std::string& value);

/// Parses `text`, preserving object key order; std::nullopt on empty or malformed input.
std::optional<nlohmann::ordered_json> safe_json(const std::string& text);

}  // namespace categorizer::utils
