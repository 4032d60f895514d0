#include "categorizer/render.hpp"

namespace categorizer {
namespace {

constexpr std::size_t kIndentWidth = 2;

std::string indented(std::size_t base_indent, std::size_t level, const std::string& text) {
  return std::string(base_indent + level * kIndentWidth, ' ') + text;
}

std::string join(const std::vector<std::string>& values, const std::string& separator) {
  std::string joined;
  for (std::size_t idx = 0; idx < values.size(); ++idx) {
    if (idx > 0) {
      joined += separator;
    }
    joined += values[idx];
  }
  return joined;
}

}  // namespace

std::vector<std::string> render_catalog(const CategorizedCatalog& catalog, std::size_t base_indent) {
  std::vector<std::string> lines;
  for (const auto& [provider, families] : catalog) {
    lines.push_back(indented(base_indent, 0, "Provider: " + provider));
    for (const auto& [family, types] : families) {
      lines.push_back(indented(base_indent, 1, "Family: " + family));
      for (const auto& [type, entry] : types) {
        lines.push_back(indented(base_indent, 2, "Type: " + type));
        if (entry.latest && !entry.latest->empty()) {
          lines.push_back(indented(base_indent, 3, "Latest: " + *entry.latest));
        }
        if (entry.other_versions && !entry.other_versions->empty()) {
          lines.push_back(indented(base_indent, 3, "Other versions: " + join(*entry.other_versions, ", ")));
        }
      }
    }
  }
  return lines;
}

void write_catalog(std::ostream& out, const CategorizedCatalog& catalog, std::size_t base_indent) {
  for (const auto& line : render_catalog(catalog, base_indent)) {
    out << line << '\n';
  }
}

}  // namespace categorizer
