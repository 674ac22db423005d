#include "artmatch_cli/cli_handler.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // Config path from environment variable
    const char *config_env = std::getenv("ARTMATCH_CONFIG");
    std::string config_path = config_env ? config_env : "artmatchrc.json";

    artmatch_cli::CliHandler handler(config_path);

    artmatch_cli::CliOptions options = handler.parse_arguments(argc, argv);

    handler.execute_command(options);
  }
  catch (const artmatch_cli::CliError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Run 'artmatch_cli help' for usage." << std::endl;
    return 2;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
