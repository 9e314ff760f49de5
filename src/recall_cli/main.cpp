#include "recall_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    const char *api_base_url = std::getenv("RECALL_API_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    curl_global_init(CURL_GLOBAL_DEFAULT);
    recall_cli::CliOptions options = recall_cli::CliHandler::parse_arguments(argc, argv);
    {
      recall_cli::CliHandler handler(base_url);
      handler.execute_command(options);
    }
    curl_global_cleanup();
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
