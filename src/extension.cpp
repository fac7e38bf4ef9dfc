#include "wsshake/extension.hpp"

#include "wsshake/log.hpp"
#include "wsshake/utils.hpp"

#include <utility>

namespace wsshake {

expected<void, ErrorCode> ExtensionRegistry::add(ExtensionPtr extension) {
  if (!extension) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  if (find(extension->name()) != nullptr) {
    WSSHAKE_LOG_WARN("Extension already registered: " + std::string(extension->name()));
    return expected<void, ErrorCode>::error(ErrorCode::kDuplicateExtension);
  }
  extensions_.push_back(std::move(extension));
  return expected<void, ErrorCode>::success();
}

const Extension* ExtensionRegistry::find(std::string_view name) const {
  for (const auto& extension : extensions_) {
    if (text::iequals(extension->name(), name))
      return extension.get();
  }
  return nullptr;
}

expected<std::vector<ExtensionDescriptor>, ErrorCode> parse_extension_header(std::string_view header,
                                                                            uint32_t min_entries) {
  using Result = expected<std::vector<ExtensionDescriptor>, ErrorCode>;

  auto entries = text::split(header, ',');
  if (entries.size() < min_entries) {
    return Result::error(ErrorCode::kMalformedExtensionHeader);
  }

  std::vector<ExtensionDescriptor> extensions;
  extensions.reserve(entries.size());

  for (auto entry : entries) {
    auto parts = text::split(entry, ';');
    std::string_view name = text::trim(parts[0]);
    if (name.empty()) {
      return Result::error(ErrorCode::kMalformedExtensionHeader);
    }

    ExtensionDescriptor extension;
    extension.name.assign(name.data(), name.size());

    for (size_t i = 1; i < parts.size(); ++i) {
      auto option_parts = text::split(parts[i], '=');
      std::string_view option_name = text::trim(option_parts[0]);
      if (option_name.empty() || option_parts.size() > 2) {
        return Result::error(ErrorCode::kMalformedExtensionHeader);
      }

      ExtensionOption option;
      option.name.assign(option_name.data(), option_name.size());
      if (option_parts.size() == 1) {
        option.client_available = true;
      } else {
        option.value = std::string(text::trim(option_parts[1]));
      }
      extension.options.push_back(std::move(option));
    }

    extensions.push_back(std::move(extension));
  }

  return Result::success(std::move(extensions));
}

std::string serialize_extension(const ExtensionDescriptor& extension) {
  std::string out = extension.name;
  for (const auto& option : extension.options) {
    if (option.client_available)
      continue;
    out.push_back(';');
    out.append(option.name);
    if (option.value.has_value()) {
      out.push_back('=');
      out.append(option.value.value());
    }
  }
  return out;
}

std::string serialize_extensions(const std::vector<ExtensionDescriptor>& extensions) {
  std::string out;
  for (size_t i = 0; i < extensions.size(); ++i) {
    if (i > 0)
      out.push_back(',');
    out.append(serialize_extension(extensions[i]));
  }
  return out;
}

}  // namespace wsshake
