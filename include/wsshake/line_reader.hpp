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

#ifndef WSSHAKE_LINE_READER_HPP_
#define WSSHAKE_LINE_READER_HPP_

#include "config.hpp"
#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <algorithm>
#include <array>
#include <string>

namespace wsshake {

// ============================================================================
// RingBuffer - Fixed-size circular buffer
// ============================================================================

template <typename T, size_t Size>
class RingBuffer {
 public:
  static constexpr size_t kCapacity = Size;

  RingBuffer() = default;

  // Write data to buffer
  bool push(const T* data, size_t len) {
    if (available() < len)
      return false;
    for (size_t i = 0; i < len; ++i) {
      buffer_[write_idx_] = data[i];
      write_idx_ = (write_idx_ + 1) % kCapacity;
    }
    count_ += len;
    return true;
  }

  // Read data from buffer without removing
  size_t peek(T* data, size_t max_len) const {
    size_t len = std::min(max_len, count_);
    size_t idx = read_idx_;
    for (size_t i = 0; i < len; ++i) {
      data[i] = buffer_[idx];
      idx = (idx + 1) % kCapacity;
    }
    return len;
  }

  // Remove data from buffer
  void advance(size_t len) {
    if (len > count_)
      len = count_;
    read_idx_ = (read_idx_ + len) % kCapacity;
    count_ -= len;
  }

  // Offset of the first element equal to value, or size() if absent
  size_t find(const T& value) const {
    size_t idx = read_idx_;
    for (size_t i = 0; i < count_; ++i) {
      if (buffer_[idx] == value)
        return i;
      idx = (idx + 1) % kCapacity;
    }
    return count_;
  }

  size_t size() const { return count_; }
  size_t available() const { return kCapacity - count_; }
  bool empty() const { return count_ == 0; }
  bool full() const { return count_ == kCapacity; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
    count_ = 0;
  }

  // Contiguous writable region for a direct read from the transport.
  // Follow with commit_write() for the bytes actually stored.
  T* write_ptr(size_t* out_len) {
    size_t avail = available();
    if (avail == 0) {
      *out_len = 0;
      return nullptr;
    }
    size_t contiguous = kCapacity - write_idx_;
    *out_len = (contiguous >= avail) ? avail : contiguous;
    return buffer_.data() + write_idx_;
  }

  void commit_write(size_t len) {
    if (len > available())
      len = available();
    write_idx_ = (write_idx_ + len) % kCapacity;
    count_ += len;
  }

 private:
  std::array<T, kCapacity> buffer_{};
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
  size_t count_ = 0;
};

// ============================================================================
// LineReader - ASCII line reads over a Stream
// ============================================================================

/**
 * @brief Reads LF-terminated lines (a trailing CR is stripped) from a Stream.
 *
 * Reads from the transport in chunks, so bytes following the last line the
 * caller consumes may already be buffered; take_buffered() hands them over.
 * The reader never closes the stream.
 */
class LineReader {
 public:
  static constexpr size_t kBufferSize = kMaxLineLength;

  explicit LineReader(Stream& stream) : stream_(stream) {}

  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // Returns the next line, or an empty optional at end of stream.
  // error(kRequestTooLarge) if a line does not fit in the buffer.
  expected<optional<std::string>, ErrorCode> read_line();

  // Drain bytes received but not yet returned as lines
  std::string take_buffered();

  bool at_eof() const { return eof_ && buffer_.empty(); }

 private:
  // Pull one chunk from the stream; returns bytes added (0 at end of stream)
  expected<size_t, ErrorCode> fill();

  std::string extract(size_t len, size_t consumed);

  Stream& stream_;
  RingBuffer<uint8_t, kBufferSize> buffer_;
  bool eof_ = false;
};

}  // namespace wsshake

#endif  // WSSHAKE_LINE_READER_HPP_
