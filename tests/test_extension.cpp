#include "wsshake/extension.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace wsshake;

namespace {

class NamedContext : public ExtensionContext {
 public:
  explicit NamedContext(std::string name) : name_(std::move(name)) {}
  std::string_view name() const override { return name_; }

 private:
  std::string name_;
};

// Accepts whenever the client asked for it, echoing nothing but its name
class EchoExtension : public Extension {
 public:
  explicit EchoExtension(std::string name) : name_(std::move(name)) {}

  std::string_view name() const override { return name_; }

  optional<NegotiationResult> try_negotiate(const Request& /*request*/,
                                            const ExtensionDescriptor& offer) const override {
    if (offer.name != name_) {
      return {};
    }
    NegotiationResult result;
    result.response.name = name_;
    result.context = std::make_shared<NamedContext>(name_);
    return result;
  }

 private:
  std::string name_;
};

}  // namespace

// ============================================================================
// parse_extension_header
// ============================================================================

TEST_CASE("Extension header - single extension with options", "[extension]") {
  auto parsed = parse_extension_header("permessage-deflate; client_max_window_bits; server_max_window_bits=10");
  REQUIRE(parsed);

  const auto& extensions = parsed.value();
  REQUIRE(extensions.size() == 1);
  REQUIRE(extensions[0].name == "permessage-deflate");
  REQUIRE(extensions[0].options.size() == 2);

  const auto& bare = extensions[0].options[0];
  REQUIRE(bare.name == "client_max_window_bits");
  REQUIRE(bare.client_available);
  REQUIRE(!bare.value.has_value());

  const auto& valued = extensions[0].options[1];
  REQUIRE(valued.name == "server_max_window_bits");
  REQUIRE(!valued.client_available);
  REQUIRE(valued.value.value() == "10");
}

TEST_CASE("Extension header - multiple entries keep client order", "[extension]") {
  auto parsed = parse_extension_header("foo;a=1, bar, baz;b");
  REQUIRE(parsed);
  REQUIRE(parsed.value().size() == 3);
  REQUIRE(parsed.value()[0].name == "foo");
  REQUIRE(parsed.value()[1].name == "bar");
  REQUIRE(parsed.value()[1].options.empty());
  REQUIRE(parsed.value()[2].name == "baz");
}

TEST_CASE("Extension header - option with empty value", "[extension]") {
  auto parsed = parse_extension_header("foo;x=");
  REQUIRE(parsed);
  const auto& option = parsed.value()[0].options[0];
  REQUIRE(option.value.has_value());
  REQUIRE(option.value.value().empty());
  REQUIRE(!option.client_available);
}

TEST_CASE("Extension header - malformed forms", "[extension]") {
  REQUIRE(parse_extension_header("").get_error() == ErrorCode::kMalformedExtensionHeader);
  REQUIRE(parse_extension_header("foo,,bar").get_error() == ErrorCode::kMalformedExtensionHeader);
  REQUIRE(parse_extension_header("foo;=1").get_error() == ErrorCode::kMalformedExtensionHeader);
  REQUIRE(parse_extension_header("foo;a=1=2").get_error() == ErrorCode::kMalformedExtensionHeader);
  REQUIRE(parse_extension_header(";a").get_error() == ErrorCode::kMalformedExtensionHeader);
}

TEST_CASE("Extension header - minimum entry count", "[extension]") {
  REQUIRE(parse_extension_header("foo", 1));
  REQUIRE(parse_extension_header("foo", 2).get_error() == ErrorCode::kMalformedExtensionHeader);
  REQUIRE(parse_extension_header("foo, bar", 2));
}

TEST_CASE("ExtensionDescriptor - find_option ignores case", "[extension]") {
  auto parsed = parse_extension_header("foo; Mode=fast");
  REQUIRE(parsed);
  const auto* option = parsed.value()[0].find_option("mode");
  REQUIRE(option != nullptr);
  REQUIRE(option->value.value() == "fast");
  REQUIRE(parsed.value()[0].find_option("speed") == nullptr);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_CASE("Serialize - client-available options are omitted", "[extension]") {
  ExtensionDescriptor extension;
  extension.name = "permessage-deflate";
  extension.options.push_back(ExtensionOption{"client_max_window_bits", {}, true});
  extension.options.push_back(ExtensionOption{"server_no_context_takeover", {}, false});
  extension.options.push_back(ExtensionOption{"server_max_window_bits", std::string("10"), false});

  REQUIRE(serialize_extension(extension) == "permessage-deflate;server_no_context_takeover;server_max_window_bits=10");
}

TEST_CASE("Serialize - name only", "[extension]") {
  ExtensionDescriptor extension;
  extension.name = "x-webkit";
  REQUIRE(serialize_extension(extension) == "x-webkit");
}

TEST_CASE("Serialize - list is comma joined", "[extension]") {
  ExtensionDescriptor a;
  a.name = "a";
  a.options.push_back(ExtensionOption{"k", std::string("v"), false});
  ExtensionDescriptor b;
  b.name = "b";

  REQUIRE(serialize_extensions({a, b}) == "a;k=v,b");
  REQUIRE(serialize_extensions({}).empty());
}

TEST_CASE("Serialize - parsed header re-serializes without bare options", "[extension]") {
  auto parsed = parse_extension_header("foo;a=1;b, bar;c=2");
  REQUIRE(parsed);
  REQUIRE(serialize_extensions(parsed.value()) == "foo;a=1,bar;c=2");
}

// ============================================================================
// ExtensionRegistry
// ============================================================================

TEST_CASE("ExtensionRegistry - lookup is case-insensitive", "[extension]") {
  ExtensionRegistry registry;
  REQUIRE(registry.empty());
  REQUIRE(registry.add(std::make_shared<EchoExtension>("x-test")));
  REQUIRE(registry.size() == 1);
  REQUIRE(registry.find("X-TEST") != nullptr);
  REQUIRE(registry.find("other") == nullptr);
}

TEST_CASE("ExtensionRegistry - duplicate name is refused", "[extension]") {
  ExtensionRegistry registry;
  REQUIRE(registry.add(std::make_shared<EchoExtension>("x-test")));
  auto again = registry.add(std::make_shared<EchoExtension>("X-Test"));
  REQUIRE(!again);
  REQUIRE(again.get_error() == ErrorCode::kDuplicateExtension);
  REQUIRE(registry.size() == 1);
}

TEST_CASE("ExtensionRegistry - null extension is refused", "[extension]") {
  ExtensionRegistry registry;
  auto result = registry.add(nullptr);
  REQUIRE(!result);
  REQUIRE(result.get_error() == ErrorCode::kInvalidState);
}

TEST_CASE("Extension - negotiates from the offered entry", "[extension]") {
  EchoExtension extension("x-test");

  Request request;
  request.extensions = parse_extension_header("x-other, x-test").value();
  REQUIRE(!extension.try_negotiate(request, request.extensions[0]).has_value());

  auto result = extension.try_negotiate(request, request.extensions[1]);
  REQUIRE(result.has_value());
  REQUIRE(result.value().response.name == "x-test");
  REQUIRE(result.value().context->name() == "x-test");
}
