#include <peerrec/server/server.hpp>
#include <peerrec/server/config.hpp>

#include <iostream>
#include <exception>

int main(int argc, char** argv) {
  try {
    // Flags override the optional --config file
    auto config = peerrec::server::Config::LoadFromArgs(argc, argv);

    peerrec::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
