#include <nostr/relay_url.hpp>

#include <algorithm>
#include <cctype>

namespace relay_feed::nostr {

namespace {

  constexpr std::string_view secure_scheme = "wss://";
  constexpr std::string_view insecure_scheme = "ws://";
  constexpr std::string_view default_port = "443";
  constexpr std::string_view insecure_default_port = "80";

  auto trim(std::string_view text) -> std::string_view
  {
    const auto is_space = [](unsigned char character) { return std::isspace(character) != 0; };
    while (not text.empty() and is_space(static_cast<unsigned char>(text.front()))) { text.remove_prefix(1); }
    while (not text.empty() and is_space(static_cast<unsigned char>(text.back()))) { text.remove_suffix(1); }
    return text;
  }

  auto lower(std::string_view text) -> std::string
  {
    std::string result(text);
    std::ranges::transform(
      result, result.begin(), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
  }

  auto starts_with_icase(std::string_view text, std::string_view prefix) -> bool
  {
    return text.size() >= prefix.size() and lower(text.substr(0, prefix.size())) == prefix;
  }

  struct url_parts
  {
    std::string host;
    std::string port;
    std::string path;
  };

  auto split(std::string_view url) -> std::optional<url_parts>
  {
    auto rest = trim(url);
    bool insecure = false;
    if (starts_with_icase(rest, secure_scheme)) {
      rest.remove_prefix(secure_scheme.size());
    } else if (starts_with_icase(rest, insecure_scheme)) {
      rest.remove_prefix(insecure_scheme.size());
      insecure = true;
    } else if (rest.find("://") != std::string_view::npos) {
      return std::nullopt;
    }

    const auto fragment = rest.find_first_of("?#");
    if (fragment != std::string_view::npos) { rest = rest.substr(0, fragment); }

    url_parts parts;
    const auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    parts.path = slash == std::string_view::npos ? std::string{} : std::string(rest.substr(slash));

    const auto at = authority.rfind('@');
    if (at != std::string_view::npos) { authority.remove_prefix(at + 1); }

    // IPv6 literals keep their brackets; the port follows the closing bracket
    const auto bracket = authority.rfind(']');
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos and (bracket == std::string_view::npos or colon > bracket)) {
      parts.port = std::string(authority.substr(colon + 1));
      authority = authority.substr(0, colon);
      if (parts.port.empty() or not std::ranges::all_of(parts.port, [](unsigned char character) {
            return std::isdigit(character) != 0;
          })) {
        return std::nullopt;
      }
    }

    parts.host = lower(authority);
    if (parts.host.empty()) { return std::nullopt; }

    // ws:// is upgraded to wss://, so its implicit port moves with it
    if (parts.port == default_port or (insecure and parts.port == insecure_default_port)) { parts.port.clear(); }
    while (not parts.path.empty() and parts.path.back() == '/') { parts.path.pop_back(); }

    return parts;
  }

}// namespace

auto normalize_relay_url(std::string_view url) -> std::string
{
  auto parts = split(url);
  if (not parts) { return std::string(url); }

  auto normalized = std::string(secure_scheme) + parts->host;
  if (not parts->port.empty()) { normalized += ":" + parts->port; }
  normalized += parts->path;
  return normalized;
}

auto parse_relay_endpoint(std::string_view url) -> std::optional<relay_endpoint>
{
  auto parts = split(url);
  if (not parts) { return std::nullopt; }

  return relay_endpoint{ .host = parts->host,
    .port = parts->port.empty() ? std::string(default_port) : parts->port,
    .path = parts->path.empty() ? std::string("/") : parts->path };
}

}// namespace relay_feed::nostr
