#include "wsshake/line_reader.hpp"

namespace wsshake {

expected<optional<std::string>, ErrorCode> LineReader::read_line() {
  using Result = expected<optional<std::string>, ErrorCode>;

  while (true) {
    size_t newline = buffer_.find(static_cast<uint8_t>('\n'));
    if (newline < buffer_.size()) {
      return Result::success(optional<std::string>(extract(newline, newline + 1)));
    }

    if (eof_) {
      if (buffer_.empty()) {
        return Result::success(optional<std::string>());
      }
      // Unterminated final line
      size_t len = buffer_.size();
      return Result::success(optional<std::string>(extract(len, len)));
    }

    if (buffer_.full()) {
      return Result::error(ErrorCode::kRequestTooLarge);
    }

    auto filled = fill();
    if (!filled) {
      return Result::error(filled.get_error());
    }
  }
}

std::string LineReader::take_buffered() {
  std::string data(buffer_.size(), '\0');
  size_t len = buffer_.peek(reinterpret_cast<uint8_t*>(&data[0]), data.size());
  buffer_.advance(len);
  return data;
}

expected<size_t, ErrorCode> LineReader::fill() {
  size_t len = 0;
  uint8_t* dst = buffer_.write_ptr(&len);
  if (dst == nullptr) {
    return expected<size_t, ErrorCode>::success(0);
  }

  auto n = stream_.read(dst, len);
  if (!n) {
    return n;
  }
  if (n.value() == 0) {
    eof_ = true;
  } else {
    buffer_.commit_write(n.value());
  }
  return n;
}

std::string LineReader::extract(size_t len, size_t consumed) {
  std::string line(len, '\0');
  if (len > 0) {
    buffer_.peek(reinterpret_cast<uint8_t*>(&line[0]), len);
  }
  buffer_.advance(consumed);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

}  // namespace wsshake
