#include <bookland/server/server.hpp>
#include <bookland/server/config.hpp>

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  try {
    // Command line flags override the optional --config file
    auto config = bookland::server::Config::LoadFromArgs(argc, argv);

    bookland::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
