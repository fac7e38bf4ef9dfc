#include "wsshake/http_request.hpp"

#include "wsshake/utils.hpp"

namespace wsshake {

expected<void, ErrorCode> HeaderCollection::add(std::string_view name, std::string_view value,
                                                 DuplicateHeaderPolicy policy) {
  for (auto& field : fields_) {
    if (!text::iequals(field.name, name))
      continue;

    switch (policy) {
      case DuplicateHeaderPolicy::kReject:
        return expected<void, ErrorCode>::error(ErrorCode::kDuplicateHeader);
      case DuplicateHeaderPolicy::kLastWins:
        field.value.assign(value.data(), value.size());
        return expected<void, ErrorCode>::success();
      case DuplicateHeaderPolicy::kMerge:
        field.value.append(", ");
        field.value.append(value.data(), value.size());
        return expected<void, ErrorCode>::success();
    }
  }

  if (!fields_.emplace_back(std::string(name), std::string(value))) {
    return expected<void, ErrorCode>::error(ErrorCode::kRequestTooLarge);
  }
  return expected<void, ErrorCode>::success();
}

const std::string* HeaderCollection::find(std::string_view name) const {
  for (const auto& field : fields_) {
    if (text::iequals(field.name, name))
      return &field.value;
  }
  return nullptr;
}

std::string_view HeaderCollection::get(std::string_view name) const {
  const std::string* value = find(name);
  return value != nullptr ? std::string_view(*value) : std::string_view();
}

const ExtensionOption* ExtensionDescriptor::find_option(std::string_view option_name) const {
  for (const auto& option : options) {
    if (text::iequals(option.name, option_name))
      return &option;
  }
  return nullptr;
}

const ExtensionDescriptor* Request::find_extension(std::string_view name) const {
  for (const auto& extension : extensions) {
    if (text::iequals(extension.name, name))
      return &extension;
  }
  return nullptr;
}

}  // namespace wsshake
