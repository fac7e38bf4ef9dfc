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

#ifndef WSSHAKE_STREAM_HPP_
#define WSSHAKE_STREAM_HPP_

#include "vocabulary.hpp"

#include <cstddef>

namespace wsshake {

// ============================================================================
// Stream (accepted client connection, already TLS-unwrapped if applicable)
// ============================================================================

class Stream {
 public:
  virtual ~Stream() = default;

  // Read up to len bytes into buf.
  // Returns the number of bytes read, 0 at end of stream,
  // error(kSocketError) or error(kTimeout) on failure.
  virtual expected<size_t, ErrorCode> read(void* buf, size_t len) = 0;

  // Write all len bytes.
  // Returns success() once everything was handed to the transport.
  virtual expected<void, ErrorCode> write(const void* data, size_t len) = 0;

  virtual expected<void, ErrorCode> flush() = 0;

  virtual void close() = 0;
};

}  // namespace wsshake

#endif  // WSSHAKE_STREAM_HPP_
