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

#ifndef WSSHAKE_HANDSHAKER_HPP_
#define WSSHAKE_HANDSHAKER_HPP_

#include "config.hpp"
#include "extension.hpp"
#include "http_request.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace wsshake {

// ============================================================================
// States (single pass, no re-entry)
// ============================================================================

enum class HandshakeState : uint8_t {
  kIdle,                  // Nothing read yet
  kRequestRead,           // Request line and headers parsed
  kValidated,             // Headers form a WebSocket upgrade request
  kExtensionsNegotiated,  // Registry consulted for each requested extension
  kResponseSent,          // 101 or rejection written and flushed
  kAccepted,
  kRejected,
  kFailed                 // Fatal error, nothing (or nothing complete) written
};

const char* state_name(HandshakeState state);

// ============================================================================
// Outcome handed to the framing layer
// ============================================================================

struct HandshakeOutcome {
  bool accepted = false;

  // Populated for both outcomes; extension fields only when accepted
  Request request;
  std::vector<ExtensionContextPtr> negotiated_extensions;  // Request order
  std::vector<ExtensionDescriptor> response_extensions;    // Same order

  // Bytes received after the header block (start of the frame stream)
  std::string pending_data;
};

// ============================================================================
// Handshaker (one instance per inbound connection attempt)
// ============================================================================

/**
 * @brief Server side of the RFC 6455 opening handshake.
 *
 * Reads the upgrade request from a stream, validates it, negotiates
 * extensions against a shared read-only registry and writes either a
 * 101 Switching Protocols response or a rejection (after which the stream
 * is closed). Synchronous; the caller supplies deadlines at stream level.
 *
 * Usage:
 *   wsshake::Handshaker handshaker(registry);
 *   auto outcome = handshaker.negotiate(stream);
 *   if (outcome && outcome.value().accepted) { ... }
 */
class Handshaker {
 public:
  static constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  static constexpr std::string_view kWebSocketVersion = "13";

  explicit Handshaker(const ExtensionRegistry& extensions, const HandshakeConfig& config = HandshakeConfig{});

  Handshaker(const Handshaker&) = delete;
  Handshaker& operator=(const Handshaker&) = delete;

  // Run the whole handshake over stream. May be called once.
  // Returns the outcome (accepted or rejected) on success.
  // Returns error(kMalformedRequest), error(kMalformedExtensionHeader),
  // error(kDuplicateHeader) or error(kRequestTooLarge) for an unparseable
  // request (no response written), the stream's error if writing fails,
  // error(kInvalidState) on a second call.
  expected<HandshakeOutcome, ErrorCode> negotiate(Stream& stream);

  HandshakeState get_state() const { return state_; }

  uint64_t get_id() const { return id_; }

  // Host, Upgrade: websocket, Connection, non-blank Sec-WebSocket-Key and
  // Sec-WebSocket-Version: 13 all present
  static bool is_websocket_request(const HeaderCollection& headers);

  // Base64(SHA1(client_key + GUID))
  static std::string generate_accept_key(std::string_view client_key);

 private:
  // Derive cookies and requested extensions from the headers
  expected<void, ErrorCode> consolidate(Request& request) const;

  void select_extensions(const Request& request, HandshakeOutcome& outcome) const;

  expected<void, ErrorCode> write_response(Stream& stream, const HandshakeOutcome& outcome);

  expected<HandshakeOutcome, ErrorCode> fail(ErrorCode code, const char* stage);

  void transition_to_state(HandshakeState state) { state_ = state; }

  const ExtensionRegistry& extensions_;
  HandshakeConfig config_;
  HandshakeState state_ = HandshakeState::kIdle;
  uint64_t id_;
};

}  // namespace wsshake

#endif  // WSSHAKE_HANDSHAKER_HPP_
