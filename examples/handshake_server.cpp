#include "wsshake.hpp"

#include <sockpp/tcp_acceptor.h>

#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace {

void handle_client(sockpp::tcp_socket sock, const wsshake::ExtensionRegistry& registry) {
  wsshake::SocketStream stream(std::move(sock));
  wsshake::Handshaker handshaker(registry);

  auto outcome = handshaker.negotiate(stream);
  if (!outcome) {
    std::cerr << "Handshake #" << handshaker.get_id() << " error: " << wsshake::error_name(outcome.get_error())
              << std::endl;
    return;
  }

  const auto& result = outcome.value();
  if (!result.accepted) {
    return;
  }

  std::cout << "Handshake #" << handshaker.get_id() << " upgraded " << result.request.uri.path;
  for (const auto& extension : result.response_extensions) {
    std::cout << " [" << wsshake::serialize_extension(extension) << "]";
  }
  std::cout << std::endl;

  // Frame handling is out of scope here; the connection is dropped when
  // stream goes out of scope.
}

}  // namespace

int main(int argc, char* argv[]) {
  uint16_t port = 8080;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  try {
    sockpp::initialize();

    wsshake::ExtensionRegistry registry;
    auto added = registry.add(std::make_shared<wsshake::DeflateExtension>());
    if (!added) {
      WSSHAKE_THROW(std::runtime_error(std::string("Failed to register extension: ") +
                                       wsshake::error_name(added.get_error())));
    }

    std::error_code ec;
    sockpp::tcp_acceptor acceptor(port, 128, ec);
    if (ec) {
      WSSHAKE_THROW(std::runtime_error("Failed to listen on port " + std::to_string(port) + ": " + ec.message()));
    }

    WSSHAKE_LOG_INFO("Handshake server listening on port " + std::to_string(port));

    while (true) {
      auto res = acceptor.accept();
      if (!res) {
        WSSHAKE_LOG_ERROR("Accept failed: " + res.error_message());
        continue;
      }
      std::thread(handle_client, res.release(), std::cref(registry)).detach();
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
