#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "categorizer/client.hpp"
#include "categorizer/logging.hpp"

namespace categorizer::cli {

enum class OutputFormat { Pretty, Json };

std::optional<OutputFormat> parse_output_format(const std::string& value);

struct CliOptions {
  std::string base_url = kDefaultBaseUrl;
  bool include_experimental = false;
  OutputFormat format = OutputFormat::Pretty;
  LogLevel log_level = LogLevel::Off;
};

/**
 * Fetches the categorized catalog and prints it to `out` in the requested
 * format, followed by a sample lookup of OpenAI's GPT-4 family when the
 * catalog has one. Service and decoding failures are reported on `out`
 * rather than propagated; the return value is the process exit status and
 * is always 0.
 */
int run(const CliOptions& options, const CategorizerClient& client, std::ostream& out);

}  // namespace categorizer::cli
