#include "docqa_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // Get API base URL from environment variable
    const char *api_base_url = std::getenv("DOCQA_API_URL");
    std::string base_url = (api_base_url && *api_base_url) ? api_base_url
                                                           : docqa_cli::CliHandler::DEFAULT_API_URL;

    docqa_cli::CliHandler handler(base_url);

    docqa_cli::CliOptions options = handler.parse_arguments(argc, argv);

    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
