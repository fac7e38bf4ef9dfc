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

#ifndef WSSHAKE_HTTP_REQUEST_HPP_
#define WSSHAKE_HTTP_REQUEST_HPP_

#include "config.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace wsshake {

// Header names consulted by the handshake
namespace header {
constexpr std::string_view kHost = "Host";
constexpr std::string_view kUpgrade = "Upgrade";
constexpr std::string_view kConnection = "Connection";
constexpr std::string_view kCookie = "Cookie";
constexpr std::string_view kSecWebSocketKey = "Sec-WebSocket-Key";
constexpr std::string_view kSecWebSocketVersion = "Sec-WebSocket-Version";
constexpr std::string_view kSecWebSocketProtocol = "Sec-WebSocket-Protocol";
constexpr std::string_view kSecWebSocketExtensions = "Sec-WebSocket-Extensions";
constexpr std::string_view kSecWebSocketAccept = "Sec-WebSocket-Accept";
}  // namespace header

enum class HttpVersion : uint8_t { kHttp10, kHttp11 };

// ============================================================================
// HeaderCollection - case-insensitive, insertion-ordered header fields
// ============================================================================

struct HeaderField {
  std::string name;
  std::string value;
};

class HeaderCollection {
 public:
  using Storage = FixedVector<HeaderField, kMaxHeaders>;

  // Insert a field, resolving a repeated name per policy.
  // Returns error(kDuplicateHeader) under kReject,
  // error(kRequestTooLarge) when the collection is full.
  expected<void, ErrorCode> add(std::string_view name, std::string_view value,
                                DuplicateHeaderPolicy policy = DuplicateHeaderPolicy::kReject);

  // nullptr if absent
  const std::string* find(std::string_view name) const;

  bool contains(std::string_view name) const { return find(name) != nullptr; }

  // Empty view if absent
  std::string_view get(std::string_view name) const;

  uint32_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

  Storage::const_iterator begin() const { return fields_.begin(); }
  Storage::const_iterator end() const { return fields_.end(); }

 private:
  Storage fields_;
};

// ============================================================================
// Request target and cookies
// ============================================================================

struct RequestUri {
  std::string raw;    // As received on the request line
  std::string path;   // Before the first '?'
  std::string query;  // After the first '?', without it
};

struct Cookie {
  std::string name;
  std::string value;
  std::string domain;  // Host the request was addressed to
};

// ============================================================================
// Extension descriptors (Sec-WebSocket-Extensions entries)
// ============================================================================

struct ExtensionOption {
  std::string name;
  optional<std::string> value;
  // Listed bare by the client ("name" rather than "name=value"), meaning
  // the client merely advertises support. Never echoed in a response.
  bool client_available = false;
};

struct ExtensionDescriptor {
  std::string name;
  std::vector<ExtensionOption> options;

  // nullptr if absent; names compare case-insensitively
  const ExtensionOption* find_option(std::string_view option_name) const;
};

// ============================================================================
// Request - parsed upgrade request, owned by one handshake
// ============================================================================

struct Request {
  RequestUri uri;
  HttpVersion version = HttpVersion::kHttp10;
  HeaderCollection headers;
  std::vector<Cookie> cookies;
  std::vector<ExtensionDescriptor> extensions;  // Client order

  // First requested extension with this name (case-insensitive), or nullptr
  const ExtensionDescriptor* find_extension(std::string_view name) const;
};

}  // namespace wsshake

#endif  // WSSHAKE_HTTP_REQUEST_HPP_
