#pragma once

#include <map>
#include <string>

namespace categorizer::utils::qs {

enum class Format { RFC1738, RFC3986 };

struct StringifyOptions {
  bool add_query_prefix = false;
  std::string delimiter = "&";
  Format format = Format::RFC3986;
};

/// Percent-encodes a single key or value.
[[nodiscard]] std::string encode(const std::string& input, Format format = Format::RFC3986);

/// Joins `key=value` pairs in key order; returns an empty string for an empty map.
[[nodiscard]] std::string stringify(const std::map<std::string, std::string>& object,
                                    const StringifyOptions& options = {});

}  // namespace categorizer::utils::qs
