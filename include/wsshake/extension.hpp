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

#ifndef WSSHAKE_EXTENSION_HPP_
#define WSSHAKE_EXTENSION_HPP_

#include "http_request.hpp"
#include "vocabulary.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace wsshake {

// ============================================================================
// Negotiated context (opaque to the handshake, consumed by message framing)
// ============================================================================

class ExtensionContext {
 public:
  virtual ~ExtensionContext() = default;

  virtual std::string_view name() const = 0;
};

using ExtensionContextPtr = std::shared_ptr<ExtensionContext>;

struct NegotiationResult {
  ExtensionDescriptor response;  // Echoed in Sec-WebSocket-Extensions
  ExtensionContextPtr context;
};

// ============================================================================
// Extension (pluggable negotiator)
// ============================================================================

/**
 * @brief A server-side extension able to negotiate itself from a request.
 *
 * A client may list the same extension several times, most preferred
 * first. try_negotiate() is called with one of those entries at a time and
 * must negotiate from that entry alone. Once an offer is accepted, later
 * offers of the same name are not presented.
 *
 * Implementations are shared across concurrent handshakes through a const
 * registry, so try_negotiate() must not mutate shared state.
 */
class Extension {
 public:
  virtual ~Extension() = default;

  virtual std::string_view name() const = 0;

  // offer is the request entry under negotiation (an element of
  // request.extensions). Empty optional to decline that offer.
  virtual optional<NegotiationResult> try_negotiate(const Request& request,
                                                    const ExtensionDescriptor& offer) const = 0;
};

using ExtensionPtr = std::shared_ptr<const Extension>;

// ============================================================================
// ExtensionRegistry (read-only once handshakes start)
// ============================================================================

class ExtensionRegistry {
 public:
  ExtensionRegistry() = default;

  // Returns error(kDuplicateExtension) if the name (case-insensitive) is
  // already registered, error(kInvalidState) for a null extension.
  expected<void, ErrorCode> add(ExtensionPtr extension);

  // nullptr if no extension has this name
  const Extension* find(std::string_view name) const;

  size_t size() const { return extensions_.size(); }
  bool empty() const { return extensions_.empty(); }

 private:
  std::vector<ExtensionPtr> extensions_;
};

// ============================================================================
// Sec-WebSocket-Extensions grammar: ext1;opt1;opt2=val,ext2;...
// ============================================================================

// error(kMalformedExtensionHeader) if fewer than min_entries entries, an
// empty extension or option name, or an option with more than one '='.
expected<std::vector<ExtensionDescriptor>, ErrorCode> parse_extension_header(std::string_view header,
                                                                            uint32_t min_entries = 1);

// "name;opt=value" listing only options that are not client-available
std::string serialize_extension(const ExtensionDescriptor& extension);

// Comma-joined serialize_extension() of each entry, in order
std::string serialize_extensions(const std::vector<ExtensionDescriptor>& extensions);

}  // namespace wsshake

#endif  // WSSHAKE_EXTENSION_HPP_
