#include "wsshake/socket_stream.hpp"

#include "wsshake/log.hpp"

#include <cerrno>

#include <chrono>
#include <string>
#include <utility>

namespace wsshake {

SocketStream::SocketStream(sockpp::tcp_socket&& sock, const SocketTimeouts& timeouts)
    : socket_(std::move(sock)) {
  if (timeouts.read_timeout_ms > 0) {
    auto res = socket_.read_timeout(std::chrono::milliseconds(timeouts.read_timeout_ms));
    if (!res) {
      WSSHAKE_LOG_WARN("Failed to set read timeout: " + res.error_message());
    }
  }
  if (timeouts.write_timeout_ms > 0) {
    auto res = socket_.write_timeout(std::chrono::milliseconds(timeouts.write_timeout_ms));
    if (!res) {
      WSSHAKE_LOG_WARN("Failed to set write timeout: " + res.error_message());
    }
  }
}

SocketStream::~SocketStream() { close(); }

expected<size_t, ErrorCode> SocketStream::read(void* buf, size_t len) {
  auto res = socket_.read(buf, len);
  if (!res) {
    ErrorCode code = map_error(res.error().value());
    if (code == ErrorCode::kSocketError) {
      WSSHAKE_LOG_ERROR("Read error: " + res.error_message());
    }
    return expected<size_t, ErrorCode>::error(code);
  }
  return expected<size_t, ErrorCode>::success(res.value());
}

expected<void, ErrorCode> SocketStream::write(const void* data, size_t len) {
  auto res = socket_.write_n(data, len);
  if (!res) {
    ErrorCode code = map_error(res.error().value());
    if (code == ErrorCode::kSocketError) {
      WSSHAKE_LOG_ERROR("Write error: " + res.error_message());
    }
    return expected<void, ErrorCode>::error(code);
  }
  if (res.value() != len) {
    WSSHAKE_LOG_ERROR("Short write: " + std::to_string(res.value()) + " of " + std::to_string(len) + " bytes");
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> SocketStream::flush() {
  // Unbuffered: write_n() already handed everything to the kernel
  return expected<void, ErrorCode>::success();
}

void SocketStream::close() {
  if (!socket_.is_open()) {
    return;
  }
  auto res = socket_.close();
  if (!res) {
    WSSHAKE_LOG_WARN("Close error: " + res.error_message());
  }
}

ErrorCode SocketStream::map_error(int err) {
  if (err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT) {
    return ErrorCode::kTimeout;
  }
  return ErrorCode::kSocketError;
}

}  // namespace wsshake
