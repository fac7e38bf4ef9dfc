#include "wsshake/http_response.hpp"

#include "memory_stream.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace wsshake;

TEST_CASE("ResponseWriter - lines are CRLF terminated and sent on flush", "[response]") {
  MemoryStream stream;
  ResponseWriter writer(stream);

  writer.write_line("HTTP/1.1 101 Switching Protocols");
  writer.write_header("Upgrade", "websocket");
  writer.end_headers();
  REQUIRE(stream.output().empty());
  REQUIRE(writer.buffered() == "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n\r\n");

  REQUIRE(writer.flush());
  REQUIRE(stream.output() == "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n\r\n");
  REQUIRE(stream.writes() == 1);
  REQUIRE(stream.flushes() == 1);
  REQUIRE(writer.buffered().empty());
  REQUIRE(!stream.closed());
}

TEST_CASE("ResponseWriter - write failure is reported", "[response]") {
  MemoryStream stream;
  stream.fail_writes(ErrorCode::kTimeout);
  ResponseWriter writer(stream);

  writer.write_line("HTTP/1.1 404 Bad Request");
  auto result = writer.flush();
  REQUIRE(!result);
  REQUIRE(result.get_error() == ErrorCode::kTimeout);
  REQUIRE(stream.flushes() == 0);
}

TEST_CASE("Reject response - status line and blank line only", "[response]") {
  MemoryStream stream;
  ResponseWriter writer(stream);
  build_reject_response(writer);
  REQUIRE(writer.flush());
  REQUIRE(stream.output() == "HTTP/1.1 404 Bad Request\r\n\r\n");
}

TEST_CASE("Accept response - minimal", "[response]") {
  MemoryStream stream;
  ResponseWriter writer(stream);
  build_accept_response(writer, "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=", nullptr, {});
  REQUIRE(writer.flush());
  REQUIRE(stream.output() ==
          "HTTP/1.1 101 Switching Protocols\r\n"
          "Upgrade: websocket\r\n"
          "Connection: Upgrade\r\n"
          "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
          "\r\n");
}

TEST_CASE("Accept response - protocol echoed and extensions in one header", "[response]") {
  std::string protocol = "chat, superchat";

  ExtensionDescriptor deflate;
  deflate.name = "permessage-deflate";
  deflate.options.push_back(ExtensionOption{"client_no_context_takeover", {}, false});
  ExtensionDescriptor other;
  other.name = "x-other";

  MemoryStream stream;
  ResponseWriter writer(stream);
  build_accept_response(writer, "KEY", &protocol, {deflate, other});
  REQUIRE(writer.flush());
  REQUIRE(stream.output() ==
          "HTTP/1.1 101 Switching Protocols\r\n"
          "Upgrade: websocket\r\n"
          "Connection: Upgrade\r\n"
          "Sec-WebSocket-Accept: KEY\r\n"
          "Sec-WebSocket-Protocol: chat, superchat\r\n"
          "Sec-WebSocket-Extensions: permessage-deflate;client_no_context_takeover,x-other\r\n"
          "\r\n");
}
