#include "categorizer/cli.hpp"

#include "categorizer/error.hpp"
#include "categorizer/render.hpp"

namespace categorizer::cli {
namespace {

void print_sample_family(const CategorizedCatalog& catalog, std::ostream& out) {
  auto provider_it = catalog.find(std::string("OpenAI"));
  if (provider_it == catalog.end()) {
    return;
  }
  auto family_it = provider_it->second.find(std::string("GPT-4"));
  if (family_it == provider_it->second.end()) {
    return;
  }
  out << "GPT-4 model types:\n";
  for (const auto& [type, entry] : family_it->second) {
    out << "  - " << type << ": " << entry.latest.value_or("(none)") << '\n';
  }
}

}  // namespace

std::optional<OutputFormat> parse_output_format(const std::string& value) {
  if (value == "pretty") return OutputFormat::Pretty;
  if (value == "json") return OutputFormat::Json;
  return std::nullopt;
}

int run(const CliOptions& options, const CategorizerClient& client, std::ostream& out) {
  try {
    out << "Fetching categorized models...\n";
    auto catalog = client.models().get_categorized_models(options.include_experimental);

    if (options.format == OutputFormat::Json) {
      out << catalog_to_json(catalog).dump(2) << '\n';
    } else {
      out << "\nCategorized Models:\n";
      write_catalog(out, catalog);
    }

    out << "\nExample: Accessing a specific model family\n";
    print_sample_family(catalog, out);
  } catch (const ServiceError& error) {
    out << "Error connecting to Model Categorizer service: " << error.what() << '\n';
    out << "Make sure the service is running at " << client.options().base_url << ".\n";
  } catch (const std::exception& error) {
    out << "Unexpected error: " << error.what() << '\n';
  }
  return 0;
}

}  // namespace categorizer::cli
