#ifndef WSSHAKE_TESTS_MEMORY_STREAM_HPP_
#define WSSHAKE_TESTS_MEMORY_STREAM_HPP_

#include "wsshake/stream.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

// ============================================================================
// In-memory Stream for unit tests
// ============================================================================

class MemoryStream : public wsshake::Stream {
 public:
  explicit MemoryStream(std::string input = {}, size_t chunk_size = 4096)
      : input_(std::move(input)), chunk_size_(chunk_size) {}

  wsshake::expected<size_t, wsshake::ErrorCode> read(void* buf, size_t len) override {
    ++reads_;
    if (read_error_ != wsshake::ErrorCode::kOk) {
      return wsshake::expected<size_t, wsshake::ErrorCode>::error(read_error_);
    }
    size_t n = std::min({len, chunk_size_, input_.size() - read_pos_});
    std::memcpy(buf, input_.data() + read_pos_, n);
    read_pos_ += n;
    return wsshake::expected<size_t, wsshake::ErrorCode>::success(n);
  }

  wsshake::expected<void, wsshake::ErrorCode> write(const void* data, size_t len) override {
    ++writes_;
    if (write_error_ != wsshake::ErrorCode::kOk) {
      return wsshake::expected<void, wsshake::ErrorCode>::error(write_error_);
    }
    output_.append(static_cast<const char*>(data), len);
    return wsshake::expected<void, wsshake::ErrorCode>::success();
  }

  wsshake::expected<void, wsshake::ErrorCode> flush() override {
    ++flushes_;
    return wsshake::expected<void, wsshake::ErrorCode>::success();
  }

  void close() override { closed_ = true; }

  void fail_reads(wsshake::ErrorCode code) { read_error_ = code; }
  void fail_writes(wsshake::ErrorCode code) { write_error_ = code; }

  const std::string& output() const { return output_; }
  size_t unread() const { return input_.size() - read_pos_; }
  int reads() const { return reads_; }
  int writes() const { return writes_; }
  int flushes() const { return flushes_; }
  bool closed() const { return closed_; }

 private:
  std::string input_;
  size_t chunk_size_;
  size_t read_pos_ = 0;
  std::string output_;
  wsshake::ErrorCode read_error_ = wsshake::ErrorCode::kOk;
  wsshake::ErrorCode write_error_ = wsshake::ErrorCode::kOk;
  int reads_ = 0;
  int writes_ = 0;
  int flushes_ = 0;
  bool closed_ = false;
};

#endif  // WSSHAKE_TESTS_MEMORY_STREAM_HPP_
