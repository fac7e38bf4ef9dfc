#include "wsshake/handshaker.hpp"

#include "wsshake/http_response.hpp"
#include "wsshake/line_reader.hpp"
#include "wsshake/log.hpp"
#include "wsshake/request_parser.hpp"
#include "wsshake/utils.hpp"

#include <algorithm>
#include <atomic>
#include <utility>

namespace wsshake {

namespace {

uint64_t next_handshake_id() {
  static std::atomic<uint64_t> id{1};
  return id.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace

const char* state_name(HandshakeState state) {
  switch (state) {
    case HandshakeState::kIdle:
      return "Idle";
    case HandshakeState::kRequestRead:
      return "RequestRead";
    case HandshakeState::kValidated:
      return "Validated";
    case HandshakeState::kExtensionsNegotiated:
      return "ExtensionsNegotiated";
    case HandshakeState::kResponseSent:
      return "ResponseSent";
    case HandshakeState::kAccepted:
      return "Accepted";
    case HandshakeState::kRejected:
      return "Rejected";
    case HandshakeState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

Handshaker::Handshaker(const ExtensionRegistry& extensions, const HandshakeConfig& config)
    : extensions_(extensions), config_(config), id_(next_handshake_id()) {}

bool Handshaker::is_websocket_request(const HeaderCollection& headers) {
  const std::string* upgrade = headers.find(header::kUpgrade);
  const std::string* key = headers.find(header::kSecWebSocketKey);
  const std::string* version = headers.find(header::kSecWebSocketVersion);

  return headers.contains(header::kHost) &&
         upgrade != nullptr && text::iequals(*upgrade, "websocket") &&
         headers.contains(header::kConnection) &&
         key != nullptr && !text::is_blank(*key) &&
         version != nullptr && *version == kWebSocketVersion;
}

std::string Handshaker::generate_accept_key(std::string_view client_key) {
  std::string key(client_key);
  key.append(kWebSocketGuid);

  auto hash = SHA1::compute(key);
  return Base64::encode(hash.data(), hash.size());
}

expected<HandshakeOutcome, ErrorCode> Handshaker::negotiate(Stream& stream) {
  if (state_ != HandshakeState::kIdle) {
    return expected<HandshakeOutcome, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  LineReader reader(stream);
  auto parsed = read_request(reader, config_);
  if (!parsed) {
    return fail(parsed.get_error(), "reading request");
  }
  transition_to_state(HandshakeState::kRequestRead);

  Request request = std::move(parsed.value());
  auto consolidated = consolidate(request);
  if (!consolidated) {
    return fail(consolidated.get_error(), "parsing derived headers");
  }

  HandshakeOutcome outcome;
  outcome.accepted = is_websocket_request(request.headers);
  if (outcome.accepted) {
    transition_to_state(HandshakeState::kValidated);
    select_extensions(request, outcome);
    transition_to_state(HandshakeState::kExtensionsNegotiated);
  }
  outcome.request = std::move(request);

  auto written = write_response(stream, outcome);
  if (!written) {
    return fail(written.get_error(), "writing response");
  }
  transition_to_state(HandshakeState::kResponseSent);

  if (outcome.accepted) {
    outcome.pending_data = reader.take_buffered();
    transition_to_state(HandshakeState::kAccepted);
    WSSHAKE_LOG_INFO("Handshake #" + std::to_string(id_) + " accepted " + outcome.request.uri.raw + " (" +
                     std::to_string(outcome.negotiated_extensions.size()) + " extensions)");
  } else {
    transition_to_state(HandshakeState::kRejected);
    WSSHAKE_LOG_WARN("Handshake #" + std::to_string(id_) + " rejected: not a WebSocket upgrade request for " +
                     outcome.request.uri.raw);
  }

  return expected<HandshakeOutcome, ErrorCode>::success(std::move(outcome));
}

expected<void, ErrorCode> Handshaker::consolidate(Request& request) const {
  if (config_.parse_cookies) {
    const std::string* cookie = request.headers.find(header::kCookie);
    if (cookie != nullptr) {
      auto cookies = parse_cookies(*cookie, request.headers.get(header::kHost), request.cookies);
      if (!cookies) {
        return cookies;
      }
    }
  }

  const std::string* extensions = request.headers.find(header::kSecWebSocketExtensions);
  if (extensions != nullptr) {
    auto parsed = parse_extension_header(*extensions, config_.min_extension_entries);
    if (!parsed) {
      return expected<void, ErrorCode>::error(parsed.get_error());
    }
    request.extensions = std::move(parsed.value());
  }
  return expected<void, ErrorCode>::success();
}

void Handshaker::select_extensions(const Request& request, HandshakeOutcome& outcome) const {
  // At most one accepted offer per extension; later offers are fallbacks
  std::vector<const Extension*> accepted;

  for (const auto& requested : request.extensions) {
    const Extension* extension = extensions_.find(requested.name);
    if (extension == nullptr) {
      WSSHAKE_LOG_DEBUG("Handshake #" + std::to_string(id_) + " ignoring unknown extension " + requested.name);
      continue;
    }

    if (std::find(accepted.begin(), accepted.end(), extension) != accepted.end()) {
      WSSHAKE_LOG_DEBUG("Handshake #" + std::to_string(id_) + " skipping repeated offer: " + requested.name);
      continue;
    }

    auto negotiated = extension->try_negotiate(request, requested);
    if (!negotiated) {
      WSSHAKE_LOG_DEBUG("Handshake #" + std::to_string(id_) + " extension declined: " + requested.name);
      continue;
    }

    WSSHAKE_LOG_DEBUG("Handshake #" + std::to_string(id_) + " extension negotiated: " +
                      serialize_extension(negotiated.value().response));
    accepted.push_back(extension);
    outcome.negotiated_extensions.push_back(std::move(negotiated.value().context));
    outcome.response_extensions.push_back(std::move(negotiated.value().response));
  }
}

expected<void, ErrorCode> Handshaker::write_response(Stream& stream, const HandshakeOutcome& outcome) {
  ResponseWriter writer(stream);

  if (!outcome.accepted) {
    // Rejected connections are closed even if the write fails
    ScopeGuard close_guard([&stream]() { stream.close(); });
    build_reject_response(writer);
    return writer.flush();
  }

  const HeaderCollection& headers = outcome.request.headers;
  build_accept_response(writer, generate_accept_key(headers.get(header::kSecWebSocketKey)),
                        headers.find(header::kSecWebSocketProtocol), outcome.response_extensions);
  return writer.flush();
}

expected<HandshakeOutcome, ErrorCode> Handshaker::fail(ErrorCode code, const char* stage) {
  transition_to_state(HandshakeState::kFailed);
  WSSHAKE_LOG_ERROR("Handshake #" + std::to_string(id_) + " failed " + stage + ": " + error_name(code));
  return expected<HandshakeOutcome, ErrorCode>::error(code);
}

}  // namespace wsshake
