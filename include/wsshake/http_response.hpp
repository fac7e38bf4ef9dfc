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

#ifndef WSSHAKE_HTTP_RESPONSE_HPP_
#define WSSHAKE_HTTP_RESPONSE_HPP_

#include "http_request.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wsshake {

// Rejection uses status code 404 with the reason phrase "Bad Request"
constexpr std::string_view kRejectStatusLine = "HTTP/1.1 404 Bad Request";
constexpr std::string_view kSwitchingProtocolsStatusLine = "HTTP/1.1 101 Switching Protocols";

// ============================================================================
// ResponseWriter - CRLF-terminated ASCII lines, sent on flush()
// ============================================================================

/**
 * @brief Accumulates a response and hands it to the stream in one write.
 *
 * Never closes the stream; closing on rejection is the caller's decision.
 */
class ResponseWriter {
 public:
  explicit ResponseWriter(Stream& stream) : stream_(stream) {}

  ResponseWriter(const ResponseWriter&) = delete;
  ResponseWriter& operator=(const ResponseWriter&) = delete;

  void write_line(std::string_view line) {
    buffer_.append(line.data(), line.size());
    buffer_.append("\r\n");
  }

  void write_header(std::string_view name, std::string_view value) {
    buffer_.append(name.data(), name.size());
    buffer_.append(": ");
    buffer_.append(value.data(), value.size());
    buffer_.append("\r\n");
  }

  // Blank line closing the header block
  void end_headers() { buffer_.append("\r\n"); }

  // Write buffered bytes and flush the stream.
  // Returns the stream's error(kSocketError)/error(kTimeout) on failure.
  expected<void, ErrorCode> flush();

  const std::string& buffered() const { return buffer_; }

 private:
  Stream& stream_;
  std::string buffer_;
};

// "HTTP/1.1 404 Bad Request\r\n\r\n"
void build_reject_response(ResponseWriter& writer);

// 101 response. protocol is echoed verbatim when non-null; the extensions
// header is omitted when extensions is empty.
void build_accept_response(ResponseWriter& writer, std::string_view accept_key, const std::string* protocol,
                           const std::vector<ExtensionDescriptor>& extensions);

}  // namespace wsshake

#endif  // WSSHAKE_HTTP_RESPONSE_HPP_
