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

#ifndef WSSHAKE_CONFIG_HPP_
#define WSSHAKE_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

namespace wsshake {

// Static limits
static constexpr size_t kMaxLineLength = 8192;  // bytes, one request/header line
static constexpr uint32_t kMaxHeaders = 64;
static constexpr int kDefaultTimeoutMs = 5000;

// ============================================================================
// Handshake configuration
// ============================================================================

// What to do when a header name appears more than once in a request
enum class DuplicateHeaderPolicy : uint8_t {
  kReject,    // Fail the handshake with kDuplicateHeader
  kLastWins,  // Later value replaces the earlier one
  kMerge      // Values joined with ", " in arrival order
};

struct HandshakeConfig {
  DuplicateHeaderPolicy duplicate_headers = DuplicateHeaderPolicy::kReject;

  // Minimum number of comma-separated entries in Sec-WebSocket-Extensions.
  // 1 so that a lone extension ("permessage-deflate") is accepted, the most
  // common client header. 2 reproduces the legacy strict parser, which
  // refused such a header as malformed.
  uint32_t min_extension_entries = 1;

  bool parse_cookies = true;
};

// ============================================================================
// Socket deadlines (applied by SocketStream, never by the handshaker)
// ============================================================================

struct SocketTimeouts {
  int read_timeout_ms = kDefaultTimeoutMs;   // 0 = block indefinitely
  int write_timeout_ms = kDefaultTimeoutMs;  // 0 = block indefinitely
};

}  // namespace wsshake

#endif  // WSSHAKE_CONFIG_HPP_
