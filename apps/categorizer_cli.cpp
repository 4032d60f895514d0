#include "categorizer/cli.hpp"
#include "categorizer/client.hpp"
#include "categorizer/logging.hpp"

#include <argparse/argparse.hpp>

#include <iostream>
#include <string>
#include <utility>

int main(int argc, char* argv[])
{
  argparse::ArgumentParser program("categorizer-cli", "0.1.0");
  program.add_description("Fetch and print categorized models from the Model Categorizer service.");

  program.add_argument("--url")
      .default_value(std::string(categorizer::kDefaultBaseUrl))
      .help("base URL of the Model Categorizer service");
  program.add_argument("--experimental")
      .default_value(false)
      .implicit_value(true)
      .help("include experimental models");
  program.add_argument("--format")
      .default_value(std::string("pretty"))
      .help("output format: pretty or json");
  program.add_argument("--log-level")
      .default_value(std::string("off"))
      .help("client log level written to stderr: off, error, warn, info or debug");

  try
  {
    program.parse_args(argc, argv);
  }
  catch (const std::runtime_error& err)
  {
    std::cerr << err.what() << std::endl;
    std::cerr << program;
    return 1;
  }

  categorizer::cli::CliOptions cli_options;
  cli_options.base_url = program.get<std::string>("--url");
  cli_options.include_experimental = program.get<bool>("--experimental");
  cli_options.log_level = categorizer::parse_log_level(program.get<std::string>("--log-level"));

  auto format = categorizer::cli::parse_output_format(program.get<std::string>("--format"));
  if (!format)
  {
    std::cerr << "invalid choice for --format: " << program.get<std::string>("--format") << std::endl;
    std::cerr << program;
    return 1;
  }
  cli_options.format = *format;

  try
  {
    categorizer::ClientOptions options;
    options.base_url = cli_options.base_url;
    options.log_level = cli_options.log_level;
    options.logger = categorizer::make_stream_logger(std::cerr);

    categorizer::CategorizerClient client(std::move(options));
    return categorizer::cli::run(cli_options, client, std::cout);
  }
  catch (const categorizer::CategorizerError& error)
  {
    std::cerr << "Categorizer error: " << error.what() << std::endl;
    return 1;
  }
}
