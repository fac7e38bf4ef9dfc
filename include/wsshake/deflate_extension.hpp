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

#ifndef WSSHAKE_DEFLATE_EXTENSION_HPP_
#define WSSHAKE_DEFLATE_EXTENSION_HPP_

#include "extension.hpp"

#include <cstdint>

#include <string_view>

namespace wsshake {

// ============================================================================
// permessage-deflate (RFC 7692) parameter negotiation
// ============================================================================

struct DeflateOptions {
  bool server_no_context_takeover = false;  // Ask for it even if not offered
  bool client_no_context_takeover = true;   // Always confirmed in the response
  uint8_t client_max_window_bits = 15;      // Sent when the client advertises support and < 15
};

// Parameters agreed for one connection, applied later by message framing
class DeflateContext : public ExtensionContext {
 public:
  std::string_view name() const override { return "permessage-deflate"; }

  bool server_no_context_takeover = false;
  bool client_no_context_takeover = false;
  uint8_t server_max_window_bits = 15;
  uint8_t client_max_window_bits = 15;
};

class DeflateExtension : public Extension {
 public:
  static constexpr std::string_view kName = "permessage-deflate";
  static constexpr uint8_t kMinWindowBits = 8;
  static constexpr uint8_t kMaxWindowBits = 15;

  explicit DeflateExtension(const DeflateOptions& options = DeflateOptions{});

  std::string_view name() const override { return kName; }

  // Declines offers carrying unknown or repeated parameters, or window bits
  // outside 8..15.
  optional<NegotiationResult> try_negotiate(const Request& request, const ExtensionDescriptor& offer) const override;

  const DeflateOptions& options() const { return options_; }

 private:
  DeflateOptions options_;
};

}  // namespace wsshake

#endif  // WSSHAKE_DEFLATE_EXTENSION_HPP_
