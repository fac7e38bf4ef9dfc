#include "wsshake.hpp"

#include <cstring>

#include <arpa/inet.h>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <netinet/in.h>
#include <sockpp/tcp_acceptor.h>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace wsshake;

// ============================================================================
// Minimal HTTP upgrade client (raw POSIX socket)
// ============================================================================

class UpgradeClient {
 public:
  UpgradeClient() = default;
  ~UpgradeClient() { disconnect(); }

  bool connect(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0)
      return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }

    struct timeval tv;
    tv.tv_sec = 2;
    tv.tv_usec = 0;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return true;
  }

  bool send_raw(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  // Receive until `marker` has been seen or the peer closes / times out
  std::string recv_until(std::string_view marker) {
    std::string received;
    char buf[512];
    while (received.find(marker) == std::string::npos) {
      ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n <= 0)
        break;
      received.append(buf, static_cast<size_t>(n));
    }
    return received;
  }

  // True once the server has closed its end
  bool peer_closed() {
    char c;
    return ::recv(fd_, &c, 1, 0) == 0;
  }

  void disconnect() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

// ============================================================================
// One-shot handshake server on an ephemeral loopback port
// ============================================================================

class OneShotServer {
 public:
  explicit OneShotServer(const ExtensionRegistry& registry, const SocketTimeouts& timeouts = SocketTimeouts{})
      : registry_(registry), timeouts_(timeouts), acceptor_(sockpp::inet_address("127.0.0.1", 0)) {
    port_ = acceptor_.address().port();
  }

  ~OneShotServer() { join(); }

  uint16_t port() const { return port_; }

  // Accept one connection and run the handshake on a background thread.
  // When reply is non-empty it is written on the released socket after
  // an accepted handshake.
  void serve_one(std::string reply = "") {
    thread_ = std::thread([this, reply]() {
      auto res = acceptor_.accept();
      if (!res) {
        accept_failed = true;
        return;
      }

      SocketStream stream(res.release(), timeouts_);
      stream_was_open = stream.is_open() && stream.get_fd() >= 0;

      Handshaker handshaker(registry_);
      auto outcome = handshaker.negotiate(stream);
      final_state = handshaker.get_state();
      if (!outcome) {
        error = outcome.get_error();
        return;
      }

      accepted = outcome.value().accepted;
      path = outcome.value().request.uri.path;
      pending_data = outcome.value().pending_data;
      extension_count = outcome.value().negotiated_extensions.size();

      if (accepted && !reply.empty()) {
        sockpp::tcp_socket sock = stream.release();
        released_closed_stream = !stream.is_open();
        auto written = sock.write_n(reply.data(), reply.size());
        reply_sent = written && written.value() == reply.size();
      }
    });
  }

  void join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  // Written by the server thread, read after join()
  bool accept_failed = false;
  bool stream_was_open = false;
  bool accepted = false;
  bool released_closed_stream = false;
  bool reply_sent = false;
  ErrorCode error = ErrorCode::kOk;
  HandshakeState final_state = HandshakeState::kIdle;
  std::string path;
  std::string pending_data;
  size_t extension_count = 0;

 private:
  const ExtensionRegistry& registry_;
  SocketTimeouts timeouts_;
  sockpp::tcp_acceptor acceptor_;
  uint16_t port_ = 0;
  std::thread thread_;
};

namespace {

std::string upgrade_request(std::string_view extra_headers = "") {
  std::string request =
      "GET /chat?room=7 HTTP/1.1\r\n"
      "Host: localhost\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n";
  request.append(extra_headers.data(), extra_headers.size());
  request += "\r\n";
  return request;
}

}  // namespace

// ============================================================================
// Tests
// ============================================================================

TEST_CASE("Integration - upgrade over TCP", "[integration]") {
  sockpp::initialize();
  ExtensionRegistry registry;
  OneShotServer server(registry);
  server.serve_one();

  UpgradeClient client;
  REQUIRE(client.connect(server.port()));
  REQUIRE(client.send_raw(upgrade_request()));

  std::string response = client.recv_until("\r\n\r\n");
  server.join();

  REQUIRE(!server.accept_failed);
  REQUIRE(server.stream_was_open);
  REQUIRE(server.accepted);
  REQUIRE(server.final_state == HandshakeState::kAccepted);
  REQUIRE(server.path == "/chat");
  REQUIRE(response.rfind("HTTP/1.1 101 Switching Protocols\r\n", 0) == 0);
  REQUIRE(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != std::string::npos);
}

TEST_CASE("Integration - permessage-deflate over TCP", "[integration]") {
  sockpp::initialize();
  ExtensionRegistry registry;
  REQUIRE(registry.add(std::make_shared<DeflateExtension>()));
  OneShotServer server(registry);
  server.serve_one();

  UpgradeClient client;
  REQUIRE(client.connect(server.port()));
  REQUIRE(client.send_raw(upgrade_request("Sec-WebSocket-Extensions: permessage-deflate; client_max_window_bits\r\n")));

  std::string response = client.recv_until("\r\n\r\n");
  server.join();

  REQUIRE(server.accepted);
  REQUIRE(server.extension_count == 1);
  REQUIRE(response.find("Sec-WebSocket-Extensions: permessage-deflate;client_no_context_takeover\r\n") !=
          std::string::npos);
}

TEST_CASE("Integration - socket handed over after the upgrade", "[integration]") {
  sockpp::initialize();
  ExtensionRegistry registry;
  OneShotServer server(registry);
  server.serve_one("ready");

  UpgradeClient client;
  REQUIRE(client.connect(server.port()));
  REQUIRE(client.send_raw(upgrade_request() + "early-bytes"));

  std::string received = client.recv_until("\r\n\r\nready");
  server.join();

  REQUIRE(server.accepted);
  REQUIRE(server.pending_data == "early-bytes");
  REQUIRE(server.released_closed_stream);
  REQUIRE(server.reply_sent);
  REQUIRE(received.find("\r\n\r\nready") != std::string::npos);
}

TEST_CASE("Integration - non-upgrade request rejected and closed", "[integration]") {
  sockpp::initialize();
  ExtensionRegistry registry;
  OneShotServer server(registry);
  server.serve_one();

  UpgradeClient client;
  REQUIRE(client.connect(server.port()));
  REQUIRE(client.send_raw("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"));

  std::string response = client.recv_until("\r\n\r\n");
  server.join();

  REQUIRE(!server.accepted);
  REQUIRE(server.final_state == HandshakeState::kRejected);
  REQUIRE(response == "HTTP/1.1 404 Bad Request\r\n\r\n");
  REQUIRE(client.peer_closed());
}

TEST_CASE("Integration - stalled client hits the read deadline", "[integration]") {
  sockpp::initialize();
  ExtensionRegistry registry;
  SocketTimeouts timeouts;
  timeouts.read_timeout_ms = 200;
  OneShotServer server(registry, timeouts);
  server.serve_one();

  UpgradeClient client;
  REQUIRE(client.connect(server.port()));
  REQUIRE(client.send_raw("GET /chat HTTP/1.1\r\nHost: localhost\r\n"));

  server.join();

  REQUIRE(server.error == ErrorCode::kTimeout);
  REQUIRE(server.final_state == HandshakeState::kFailed);
}

TEST_CASE("Integration - malformed request from a client that hangs up", "[integration]") {
  sockpp::initialize();
  ExtensionRegistry registry;
  OneShotServer server(registry);
  server.serve_one();

  {
    UpgradeClient client;
    REQUIRE(client.connect(server.port()));
    REQUIRE(client.send_raw("PUT /chat HTTP/1.1\r\n"));
  }

  server.join();
  REQUIRE(server.error == ErrorCode::kMalformedRequest);
}
