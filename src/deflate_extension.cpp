#include "wsshake/deflate_extension.hpp"

#include "wsshake/log.hpp"
#include "wsshake/utils.hpp"

#include <memory>
#include <string>
#include <utility>

namespace wsshake {

namespace {

constexpr std::string_view kServerNoContextTakeover = "server_no_context_takeover";
constexpr std::string_view kClientNoContextTakeover = "client_no_context_takeover";
constexpr std::string_view kServerMaxWindowBits = "server_max_window_bits";
constexpr std::string_view kClientMaxWindowBits = "client_max_window_bits";

// "8".."15" without sign or leading zero; 0 on anything else
uint8_t parse_window_bits(std::string_view value) {
  if (value.empty() || value.size() > 2 || value[0] == '0')
    return 0;
  unsigned bits = 0;
  for (char c : value) {
    if (c < '0' || c > '9')
      return 0;
    bits = bits * 10 + static_cast<unsigned>(c - '0');
  }
  if (bits < DeflateExtension::kMinWindowBits || bits > DeflateExtension::kMaxWindowBits)
    return 0;
  return static_cast<uint8_t>(bits);
}

ExtensionOption server_option(std::string_view name) {
  ExtensionOption option;
  option.name.assign(name.data(), name.size());
  return option;
}

ExtensionOption server_option(std::string_view name, unsigned value) {
  ExtensionOption option = server_option(name);
  option.value = std::to_string(value);
  return option;
}

}  // namespace

DeflateExtension::DeflateExtension(const DeflateOptions& options) : options_(options) {
  if (options_.client_max_window_bits < kMinWindowBits || options_.client_max_window_bits > kMaxWindowBits) {
    options_.client_max_window_bits = kMaxWindowBits;
  }
}

optional<NegotiationResult> DeflateExtension::try_negotiate(const Request& /*request*/,
                                                            const ExtensionDescriptor& offer) const {
  if (!text::iequals(offer.name, kName)) {
    return {};
  }

  bool server_no_takeover = options_.server_no_context_takeover;
  bool client_no_takeover = options_.client_no_context_takeover;
  uint8_t server_window = kMaxWindowBits;
  uint8_t client_window = kMaxWindowBits;
  bool server_window_requested = false;
  bool client_window_supported = false;
  bool seen[4] = {false, false, false, false};

  for (const auto& option : offer.options) {
    int index = -1;
    if (text::iequals(option.name, kServerNoContextTakeover)) {
      index = 0;
      if (option.value.has_value())
        return {};
      server_no_takeover = true;
    } else if (text::iequals(option.name, kClientNoContextTakeover)) {
      index = 1;
      if (option.value.has_value())
        return {};
      client_no_takeover = true;
    } else if (text::iequals(option.name, kServerMaxWindowBits)) {
      index = 2;
      if (!option.value.has_value())
        return {};
      server_window = parse_window_bits(option.value.value());
      if (server_window == 0)
        return {};
      server_window_requested = true;
    } else if (text::iequals(option.name, kClientMaxWindowBits)) {
      index = 3;
      client_window_supported = true;
      if (option.value.has_value()) {
        client_window = parse_window_bits(option.value.value());
        if (client_window == 0)
          return {};
      }
    } else {
      WSSHAKE_LOG_DEBUG("permessage-deflate: unknown parameter " + option.name);
      return {};
    }

    if (seen[index]) {
      WSSHAKE_LOG_DEBUG("permessage-deflate: repeated parameter " + option.name);
      return {};
    }
    seen[index] = true;
  }

  if (client_window_supported && options_.client_max_window_bits < client_window) {
    client_window = options_.client_max_window_bits;
  }

  NegotiationResult result;
  result.response.name.assign(kName.data(), kName.size());
  if (server_no_takeover) {
    result.response.options.push_back(server_option(kServerNoContextTakeover));
  }
  if (client_no_takeover) {
    result.response.options.push_back(server_option(kClientNoContextTakeover));
  }
  if (server_window_requested) {
    result.response.options.push_back(server_option(kServerMaxWindowBits, server_window));
  }
  if (client_window_supported && client_window < kMaxWindowBits) {
    result.response.options.push_back(server_option(kClientMaxWindowBits, client_window));
  }

  auto context = std::make_shared<DeflateContext>();
  context->server_no_context_takeover = server_no_takeover;
  context->client_no_context_takeover = client_no_takeover;
  context->server_max_window_bits = server_window;
  context->client_max_window_bits = client_window;
  result.context = std::move(context);

  return result;
}

}  // namespace wsshake
