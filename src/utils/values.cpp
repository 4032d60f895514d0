#include "categorizer/utils/values.hpp"

#include "categorizer/error.hpp"

#include <cctype>
#include <string>

namespace categorizer::utils {

bool is_absolute_url(std::string_view url) {
  auto colon_pos = url.find(':');
  if (colon_pos == std::string_view::npos) {
    return false;
  }
  if (colon_pos == 0) {
    return false;
  }

  unsigned char first = static_cast<unsigned char>(url[0]);
  if (!std::isalpha(first)) {
    return false;
  }

  for (std::size_t i = 1; i < colon_pos; ++i) {
    unsigned char ch = static_cast<unsigned char>(url[i]);
    if (!(std::isalnum(ch) || ch == '+' || ch == '.' || ch == '-')) {
      return false;
    }
  }

  return true;
}

std::string strip_trailing_slashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

const std::string& require_non_empty(const std::string& name, const std::string& value) {
  if (value.empty()) {
    throw InvalidArgumentError(name + " must be a non-empty string");
  }
  return value;
}

std::optional<nlohmann::ordered_json> safe_json(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    return nlohmann::ordered_json::parse(text);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace categorizer::utils
