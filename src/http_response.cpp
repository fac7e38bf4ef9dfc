#include "wsshake/http_response.hpp"

#include "wsshake/extension.hpp"

namespace wsshake {

expected<void, ErrorCode> ResponseWriter::flush() {
  if (!buffer_.empty()) {
    auto written = stream_.write(buffer_.data(), buffer_.size());
    if (!written) {
      return written;
    }
    buffer_.clear();
  }
  return stream_.flush();
}

void build_reject_response(ResponseWriter& writer) {
  writer.write_line(kRejectStatusLine);
  writer.end_headers();
}

void build_accept_response(ResponseWriter& writer, std::string_view accept_key, const std::string* protocol,
                           const std::vector<ExtensionDescriptor>& extensions) {
  writer.write_line(kSwitchingProtocolsStatusLine);
  writer.write_header(header::kUpgrade, "websocket");
  writer.write_header(header::kConnection, "Upgrade");
  writer.write_header(header::kSecWebSocketAccept, accept_key);

  if (protocol != nullptr) {
    writer.write_header(header::kSecWebSocketProtocol, *protocol);
  }

  if (!extensions.empty()) {
    writer.write_header(header::kSecWebSocketExtensions, serialize_extensions(extensions));
  }

  writer.end_headers();
}

}  // namespace wsshake
