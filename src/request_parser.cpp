#include "wsshake/request_parser.hpp"

#include "wsshake/log.hpp"
#include "wsshake/utils.hpp"

#include <utility>

namespace wsshake {

namespace {

bool is_scheme_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '+' ||
         c == '-' || c == '.';
}

bool has_scheme(std::string_view target) {
  if (target.empty() || !((target[0] >= 'a' && target[0] <= 'z') || (target[0] >= 'A' && target[0] <= 'Z')))
    return false;
  for (size_t i = 1; i < target.size(); ++i) {
    if (target[i] == ':')
      return true;
    if (!is_scheme_char(target[i]))
      return false;
  }
  return false;
}

// "example.com:8080" -> "example.com", "[::1]:80" -> "[::1]"
std::string_view strip_port(std::string_view host) {
  if (!host.empty() && host.front() == '[') {
    size_t close = host.find(']');
    return close == std::string_view::npos ? host : host.substr(0, close + 1);
  }
  size_t colon = host.rfind(':');
  return colon == std::string_view::npos ? host : host.substr(0, colon);
}

}  // namespace

expected<RequestUri, ErrorCode> parse_request_uri(std::string_view target) {
  if (target.empty() || has_scheme(target)) {
    return expected<RequestUri, ErrorCode>::error(ErrorCode::kMalformedRequest);
  }
  for (char c : target) {
    auto uc = static_cast<unsigned char>(c);
    if (uc <= 0x20 || uc == 0x7F) {
      return expected<RequestUri, ErrorCode>::error(ErrorCode::kMalformedRequest);
    }
  }

  RequestUri uri;
  uri.raw.assign(target.data(), target.size());
  size_t question = target.find('?');
  if (question == std::string_view::npos) {
    uri.path = uri.raw;
  } else {
    uri.path.assign(target.data(), question);
    uri.query = std::string(target.substr(question + 1));
  }
  return expected<RequestUri, ErrorCode>::success(std::move(uri));
}

expected<void, ErrorCode> parse_request_line(std::string_view line, Request& request) {
  if (text::is_blank(line) || !text::starts_with(line, "GET")) {
    return expected<void, ErrorCode>::error(ErrorCode::kMalformedRequest);
  }

  auto parts = text::split(line, ' ');
  if (parts.size() != 3) {
    return expected<void, ErrorCode>::error(ErrorCode::kMalformedRequest);
  }

  auto uri = parse_request_uri(parts[1]);
  if (!uri) {
    return expected<void, ErrorCode>::error(uri.get_error());
  }
  request.uri = std::move(uri.value());

  // Anything not ending in 1.1 is treated as HTTP/1.0
  request.version = text::ends_with(parts[2], "1.1") ? HttpVersion::kHttp11 : HttpVersion::kHttp10;
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> parse_header_line(std::string_view line, HeaderCollection& headers,
                                            DuplicateHeaderPolicy policy) {
  size_t separator = line.find(':');
  if (separator == std::string_view::npos) {
    return expected<void, ErrorCode>::success();
  }

  std::string_view key = line.substr(0, separator);
  // Exactly one space is expected after the colon
  size_t value_start = separator + 2;
  std::string_view value = value_start <= line.size() ? line.substr(value_start) : std::string_view();
  return headers.add(key, value, policy);
}

expected<void, ErrorCode> parse_cookies(std::string_view cookie_header, std::string_view host,
                                        std::vector<Cookie>& out) {
  std::string_view domain = strip_port(text::trim(host));

  for (auto pair : text::split(cookie_header, ';')) {
    pair = text::trim(pair);
    if (pair.empty())
      continue;

    size_t equals = pair.find('=');
    if (equals == std::string_view::npos) {
      return expected<void, ErrorCode>::error(ErrorCode::kMalformedRequest);
    }
    std::string_view name = text::trim(pair.substr(0, equals));
    if (name.empty()) {
      return expected<void, ErrorCode>::error(ErrorCode::kMalformedRequest);
    }
    std::string_view value = text::trim(pair.substr(equals + 1));
    out.push_back(Cookie{std::string(name), std::string(value), std::string(domain)});
  }
  return expected<void, ErrorCode>::success();
}

expected<Request, ErrorCode> read_request(LineReader& reader, const HandshakeConfig& config) {
  using Result = expected<Request, ErrorCode>;

  auto first = reader.read_line();
  if (!first) {
    return Result::error(first.get_error());
  }
  if (!first.value().has_value()) {
    WSSHAKE_LOG_DEBUG("Stream ended before the request line");
    return Result::error(ErrorCode::kMalformedRequest);
  }

  Request request;
  auto request_line = parse_request_line(first.value().value(), request);
  if (!request_line) {
    return Result::error(request_line.get_error());
  }

  while (true) {
    auto line = reader.read_line();
    if (!line) {
      return Result::error(line.get_error());
    }
    if (!line.value().has_value() || text::is_blank(line.value().value())) {
      break;
    }

    auto added = parse_header_line(line.value().value(), request.headers, config.duplicate_headers);
    if (!added) {
      return Result::error(added.get_error());
    }
  }

  return Result::success(std::move(request));
}

}  // namespace wsshake
