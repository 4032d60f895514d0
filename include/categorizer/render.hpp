#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "categorizer/models.hpp"

namespace categorizer {

/**
 * Renders a catalog as an indented tree, one entry per line:
 *
 *   Provider: OpenAI
 *     Family: GPT-4
 *       Type: chat
 *         Latest: gpt-4-turbo
 *         Other versions: gpt-4, gpt-4-0314
 *
 * Each level adds two spaces on top of `base_indent`. `Latest` and
 * `Other versions` lines are emitted only when the value is present and
 * non-empty. Lines carry no trailing newline.
 */
std::vector<std::string> render_catalog(const CategorizedCatalog& catalog, std::size_t base_indent = 0);

/// Writes render_catalog() output, one newline-terminated line each.
void write_catalog(std::ostream& out, const CategorizedCatalog& catalog, std::size_t base_indent = 0);

}  // namespace categorizer
