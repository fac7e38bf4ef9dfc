/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef WSSHAKE_SOCKET_STREAM_HPP_
#define WSSHAKE_SOCKET_STREAM_HPP_

#include "config.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <sockpp/tcp_socket.h>

#include <cstddef>

#include <utility>

namespace wsshake {

// ============================================================================
// SocketStream - Stream over an accepted TCP connection
// ============================================================================

/**
 * @brief Blocking Stream on a sockpp::tcp_socket with read/write deadlines.
 *
 * Owns the socket. After an accepted handshake, release() hands it on to
 * the framing layer; otherwise it is closed on destruction.
 */
class SocketStream : public Stream {
 public:
  explicit SocketStream(sockpp::tcp_socket&& sock, const SocketTimeouts& timeouts = SocketTimeouts{});
  ~SocketStream() override;

  SocketStream(const SocketStream&) = delete;
  SocketStream& operator=(const SocketStream&) = delete;

  expected<size_t, ErrorCode> read(void* buf, size_t len) override;
  expected<void, ErrorCode> write(const void* data, size_t len) override;
  expected<void, ErrorCode> flush() override;
  void close() override;

  bool is_open() const { return socket_.is_open(); }

  int get_fd() const { return socket_.handle(); }

  // Give up ownership of the socket
  sockpp::tcp_socket release() { return std::move(socket_); }

 private:
  static ErrorCode map_error(int err);

  sockpp::tcp_socket socket_;
};

}  // namespace wsshake

#endif  // WSSHAKE_SOCKET_STREAM_HPP_
