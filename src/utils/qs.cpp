#include "categorizer/utils/qs.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace categorizer::utils::qs {

namespace {

bool is_unreserved(unsigned char c, Format format) {
  if (std::isalnum(c) != 0) {
    return true;
  }
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
      return true;
    case '(':
    case ')':
      return format == Format::RFC1738;
    default:
      return false;
  }
}

std::string rfc1738_formatter(const std::string& value) {
  std::string result = value;
  for (std::size_t pos = result.find("%20"); pos != std::string::npos; pos = result.find("%20", pos)) {
    result.replace(pos, 3, "+");
    pos += 1;
  }
  return result;
}

}  // namespace

std::string encode(const std::string& input, Format format) {
  if (input.empty()) {
    return input;
  }

  std::ostringstream encoded;
  encoded << std::uppercase << std::hex;

  for (unsigned char byte : input) {
    if (is_unreserved(byte, format)) {
      encoded << static_cast<char>(byte);
      continue;
    }

    encoded << '%';
    encoded << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }

  if (format == Format::RFC1738) {
    return rfc1738_formatter(encoded.str());
  }
  return encoded.str();
}

std::string stringify(const std::map<std::string, std::string>& object,
                      const StringifyOptions& options) {
  if (object.empty()) {
    return {};
  }

  std::ostringstream joined;
  bool first = true;
  for (const auto& [key, value] : object) {
    if (!first) {
      joined << options.delimiter;
    }
    first = false;
    joined << encode(key, options.format) << '=' << encode(value, options.format);
  }

  std::string prefix = options.add_query_prefix ? "?" : "";
  return prefix + joined.str();
}

}  // namespace categorizer::utils::qs
